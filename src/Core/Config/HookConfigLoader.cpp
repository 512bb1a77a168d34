/**
 * @file HookConfigLoader.cpp
 * @brief Implementation of secure hook configuration loading
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/Config.hpp>
#include <Snare/Core/Pattern.hpp>

#include <nlohmann/json.hpp>

#ifdef _WIN32
#include <windows.h>
#include <shlwapi.h>
#pragma comment(lib, "shlwapi.lib")
#else
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>
#endif

#include <cerrno>
#include <unordered_set>

namespace Snare::Config {

using json = nlohmann::json;

const char* toString(FailurePolicy policy) noexcept {
    switch (policy) {
        case FailurePolicy::Abort:          return "abort";
        case FailurePolicy::LogAndContinue: return "log-and-continue";
    }
    return "unknown";
}

Core::LoggerOptions LoggingOptions::toLoggerOptions() const {
    Core::LoggerOptions options;
    options.minLevel = level;
    options.outputs = Core::LogOutput::Console;
    if (!file.empty()) {
        options.outputs = options.outputs | Core::LogOutput::File;
        options.filePath = file;
    }
    options.maxFileSizeMB = maxFileSizeMB;
    options.maxFiles = maxFiles;
    return options;
}

namespace {

    /**
     * @brief Required string member
     */
    Result<std::string> requireString(const json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || it->is_null()) {
            return ErrorCode::MissingField;
        }
        if (!it->is_string()) {
            return ErrorCode::InvalidFieldType;
        }
        return it->get<std::string>();
    }

    Result<HookDefinition> parseHook(const json& entry) {
        if (!entry.is_object()) {
            return ErrorCode::InvalidFieldType;
        }

        auto id = requireString(entry, "id");
        if (id.isFailure()) return id.error();
        auto signature = requireString(entry, "signature");
        if (signature.isFailure()) return signature.error();
        auto moduleName = requireString(entry, "module");
        if (moduleName.isFailure()) return moduleName.error();

        HookDefinition hook;
        hook.id = std::move(id.value());
        hook.signature = std::move(signature.value());
        hook.moduleName = std::move(moduleName.value());

        if (hook.id.empty() || hook.moduleName.empty()) {
            return ErrorCode::ConfigInvalid;
        }

        auto compiled = Core::Memory::Pattern::compile(hook.signature);
        if (compiled.isFailure()) {
            return compiled.error();
        }
        // Store the canonical form so equal signatures compare equal
        hook.signature = compiled.value().toString();

        if (entry.contains("timeout_ms")) {
            const json& timeout = entry["timeout_ms"];
            if (!timeout.is_number_integer()) {
                return ErrorCode::InvalidFieldType;
            }
            const int64_t ms = timeout.get<int64_t>();
            if (ms < 0) {
                return ErrorCode::ConfigInvalid;
            }
            hook.timeout = Milliseconds(ms);
        }

        if (entry.contains("on_failure")) {
            const json& policy = entry["on_failure"];
            if (!policy.is_string()) {
                return ErrorCode::InvalidFieldType;
            }
            const std::string name = policy.get<std::string>();
            if (name == "abort") {
                hook.onFailure = FailurePolicy::Abort;
            } else if (name == "log-and-continue") {
                hook.onFailure = FailurePolicy::LogAndContinue;
            } else {
                return ErrorCode::ConfigInvalid;
            }
        }

        if (entry.contains("target_offset")) {
            const json& offset = entry["target_offset"];
            if (!offset.is_number_integer()) {
                return ErrorCode::InvalidFieldType;
            }
            hook.targetDisplacement = offset.get<int64_t>();
        }

        return hook;
    }

    /**
     * Positive integer field; absent leaves @p out untouched
     */
    Result<void> optionalCount(const json& section, const char* key, size_t& out) {
        if (!section.contains(key)) {
            return {};
        }
        const json& value = section[key];
        if (!value.is_number_integer()) {
            return ErrorCode::InvalidFieldType;
        }
        const int64_t count = value.get<int64_t>();
        if (count <= 0) {
            return ErrorCode::ConfigInvalid;
        }
        out = static_cast<size_t>(count);
        return {};
    }

    Result<LoggingOptions> parseLogging(const json& section) {
        if (!section.is_object()) {
            return ErrorCode::InvalidFieldType;
        }

        LoggingOptions logging;
        if (section.contains("level")) {
            const json& level = section["level"];
            if (!level.is_string()) {
                return ErrorCode::InvalidFieldType;
            }
            if (!Core::ParseLogLevel(level.get<std::string>(), logging.level)) {
                return ErrorCode::ConfigInvalid;
            }
        }
        if (section.contains("file")) {
            const json& file = section["file"];
            if (!file.is_string()) {
                return ErrorCode::InvalidFieldType;
            }
            logging.file = file.get<std::string>();
        }

        auto maxFileSize = optionalCount(section, "max_file_size_mb", logging.maxFileSizeMB);
        if (maxFileSize.isFailure()) return maxFileSize.error();
        auto maxFiles = optionalCount(section, "max_files", logging.maxFiles);
        if (maxFiles.isFailure()) return maxFiles.error();

        return logging;
    }

} // anonymous namespace

class HookConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        #ifdef _WIN32
        wchar_t fullPath[MAX_PATH];
        wchar_t widePath[MAX_PATH];
        if (MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, widePath, MAX_PATH) == 0) {
            return ErrorCode::InvalidPath;
        }

        if (!PathCanonicalizeW(fullPath, widePath)) {
            return ErrorCode::InvalidPath;
        }

        char narrowPath[MAX_PATH * 3];
        if (WideCharToMultiByte(CP_UTF8, 0, fullPath, -1,
                                narrowPath, sizeof(narrowPath), nullptr, nullptr) == 0) {
            return ErrorCode::InvalidPath;
        }

        return std::string(narrowPath);
        #else
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
        #endif
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }

        std::string allowed = allowedResult.value();
        if (!allowed.empty() && allowed.back() != '/' && allowed.back() != '\\') {
            allowed += '/';
        }

        if (canonicalPath.length() < allowed.length()) {
            return false;
        }

        #ifdef _WIN32
        if (_strnicmp(canonicalPath.c_str(), allowed.c_str(), allowed.length()) != 0) {
            return false;
        }
        #else
        if (canonicalPath.compare(0, allowed.length(), allowed) != 0) {
            return false;
        }
        #endif

        return true;
    }

    Result<std::string> readFileSecurely(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

        #ifdef _WIN32
        HANDLE hFile = CreateFileA(
            canonPath.c_str(),
            GENERIC_READ,
            FILE_SHARE_READ,
            nullptr,
            OPEN_EXISTING,
            FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN,
            nullptr
        );

        if (hFile == INVALID_HANDLE_VALUE) {
            return ErrorCode::FileNotFound;
        }

        LARGE_INTEGER fileSize;
        if (!GetFileSizeEx(hFile, &fileSize)) {
            CloseHandle(hFile);
            return ErrorCode::IOError;
        }

        if (static_cast<size_t>(fileSize.QuadPart) > options.max_file_size) {
            CloseHandle(hFile);
            return ErrorCode::FileTooLarge;
        }

        std::string data(static_cast<size_t>(fileSize.QuadPart), '\0');
        DWORD bytesRead = 0;
        if (!ReadFile(hFile, data.data(), static_cast<DWORD>(data.size()), &bytesRead, nullptr)) {
            CloseHandle(hFile);
            return ErrorCode::IOError;
        }

        CloseHandle(hFile);

        if (bytesRead != data.size()) {
            return ErrorCode::IOError;
        }

        return data;

        #else
        // O_NOFOLLOW on the canonical path rejects a symlink swapped in after realpath
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW);
        if (fd < 0) {
            return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::AccessDenied;
        }

        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }

        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        std::string data(static_cast<size_t>(st.st_size), '\0');
        size_t total = 0;
        while (total < data.size()) {
            ssize_t bytesRead = read(fd, data.data() + total, data.size() - total);
            if (bytesRead <= 0) {
                break;
            }
            total += static_cast<size_t>(bytesRead);
        }
        close(fd);

        if (total != data.size()) {
            return ErrorCode::IOError;
        }

        return data;
        #endif
    }

    Result<HookConfig> parseConfig(std::string_view text) {
        json document;
        try {
            document = json::parse(text.begin(), text.end());
        } catch (const json::exception&) {
            return ErrorCode::JsonParseFailed;
        }

        if (!document.is_object()) {
            return ErrorCode::InvalidFieldType;
        }

        HookConfig config;

        if (document.contains("logging")) {
            auto logging = parseLogging(document["logging"]);
            if (logging.isFailure()) {
                return logging.error();
            }
            config.logging = std::move(logging.value());
        }

        if (!document.contains("hooks")) {
            return ErrorCode::MissingField;
        }
        const json& hooks = document["hooks"];
        if (!hooks.is_array()) {
            return ErrorCode::InvalidFieldType;
        }

        std::unordered_set<std::string> seen;
        for (const auto& entry : hooks) {
            auto hook = parseHook(entry);
            if (hook.isFailure()) {
                return hook.error();
            }
            if (!seen.insert(hook.value().id).second) {
                return ErrorCode::ConfigInvalid;
            }
            config.hooks.push_back(std::move(hook.value()));
        }

        return config;
    }
};

HookConfigLoader::HookConfigLoader() : HookConfigLoader(Options{}) {}

HookConfigLoader::HookConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

HookConfigLoader::~HookConfigLoader() = default;

Result<HookConfig> HookConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFileSecurely(path);
    if (dataResult.isFailure()) {
        return dataResult.error();
    }

    return loadFromMemory(dataResult.value());
}

Result<HookConfig> HookConfigLoader::loadFromMemory(std::string_view document) {
    return m_impl->parseConfig(document);
}

} // namespace Snare::Config
