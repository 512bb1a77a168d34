/**
 * @file ErrorCodes.cpp
 * @brief Error message tables
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/ErrorCodes.hpp>

namespace Snare {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                return "Success";
        case ErrorCode::SystemError:            return "System error";
        case ErrorCode::NotSupported:           return "Not supported on this platform";
        case ErrorCode::MemoryError:            return "Memory error";
        case ErrorCode::OutOfBounds:            return "Access exceeds module region bounds";
        case ErrorCode::UnreadableMemory:       return "Memory is not readable";
        case ErrorCode::WriteProtected:         return "Memory is write protected";
        case ErrorCode::InvalidAddress:         return "Invalid memory address";
        case ErrorCode::ProtectionChangeFailed: return "Failed to change memory protection";
        case ErrorCode::ScanMemoryError:        return "Memory access failed during scan";
        case ErrorCode::RegionNotFound:         return "Memory region not found";
        case ErrorCode::SignatureNotFound:      return "Signature not found in module";
        case ErrorCode::ModuleNotLoaded:        return "Module not loaded before timeout";
        case ErrorCode::ModuleNotFound:         return "Module not found";
        case ErrorCode::HookError:              return "Hook error";
        case ErrorCode::AlreadyInstalled:       return "Hook already installed";
        case ErrorCode::InvalidState:           return "Invalid hook state for operation";
        case ErrorCode::HookInstallError:       return "Hook installation failed";
        case ErrorCode::HookRemoveError:        return "Hook removal failed";
        case ErrorCode::HookNotFound:           return "Hook not found";
        case ErrorCode::ConfigError:            return "Configuration error";
        case ErrorCode::ConfigInvalid:          return "Invalid configuration value";
        case ErrorCode::IOError:                return "I/O error";
        case ErrorCode::FileNotFound:           return "File not found";
        case ErrorCode::FileTooLarge:           return "File too large";
        case ErrorCode::InvalidPath:            return "Invalid path";
        case ErrorCode::AccessDenied:           return "Access denied";
        case ErrorCode::ParseError:             return "Parse error";
        case ErrorCode::JsonParseFailed:        return "JSON parse failed";
        case ErrorCode::MissingField:           return "Missing required field";
        case ErrorCode::InvalidFieldType:       return "Invalid field type";
        case ErrorCode::PatternSyntaxError:     return "Malformed signature pattern";
        case ErrorCode::InternalError:          return "Internal error";
        case ErrorCode::InvalidArgument:        return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::System:   return "System";
        case ErrorCategory::Memory:   return "Memory";
        case ErrorCategory::Attach:   return "Attach";
        case ErrorCategory::Hook:     return "Hook";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Snare
