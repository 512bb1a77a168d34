/**
 * @file main.cpp
 * @brief Snare attach demo
 *
 * Loads a hook manifest, configures logging from it and attaches every hook
 * to the running process. Without a manifest the demo builds one hook for
 * its own DemoTarget() function and shows the redirect taking effect.
 *
 * Usage: snare_attach_demo [hooks.json]
 *
 * Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/AttachSequencer.hpp>
#include <Snare/Core/Config.hpp>
#include <Snare/Core/Diagnostics.hpp>
#include <Snare/Core/HookPrimitive.hpp>
#include <Snare/Core/HookRegistry.hpp>
#include <Snare/Core/Logger.hpp>
#include <Snare/Core/MemoryAccessor.hpp>
#include <Snare/Core/ModuleLocator.hpp>
#include <Snare/Core/PatternScanner.hpp>
#include <Snare/Core/RegionEnumerator.hpp>

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>

using namespace Snare;
using namespace Snare::Core;

namespace {

    volatile int g_counter = 0;

    __attribute__((noinline)) int DemoTarget(int value) {
        int total = value;
        for (int i = 0; i < 4; ++i) {
            total = total * 31 + g_counter;
            g_counter = g_counter + 1;
        }
        return total;
    }

    __attribute__((noinline)) int DemoReplacement(int value) {
        return -value;
    }

    /**
     * Hook manifest targeting DemoTarget() in this executable, signature taken
     * from the function's first bytes
     */
    Result<Config::HookConfig> buildSelfManifest() {
        Memory::RegionEnumerator enumerator;
        const Address entry = reinterpret_cast<Address>(&DemoTarget);

        auto region = enumerator.findRegionContaining(entry);
        if (region.isFailure()) {
            return region.error();
        }

        const size_t available = region.value().endAddress() - entry;
        const size_t length = available < 24 ? available : 24;
        const auto* bytes = reinterpret_cast<const Byte*>(entry);

        std::string signature;
        for (size_t i = 0; i < length; ++i) {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%02X ", bytes[i]);
            signature += hex;
        }

        Config::HookDefinition hook;
        hook.id = "demo_target";
        hook.signature = signature;
        hook.moduleName = region.value().moduleName;

        Config::HookConfig config;
        config.logging.level = LogLevel::Debug;
        config.hooks.push_back(hook);
        return config;
    }

} // anonymous namespace

int main(int argc, char* argv[]) {
    Result<Config::HookConfig> config = ErrorCode::InternalError;
    if (argc > 1) {
        Config::HookConfigLoader loader;
        config = loader.load(argv[1]);
    } else {
        config = buildSelfManifest();
    }

    if (config.isFailure()) {
        std::cerr << "Failed to load hook manifest: " << getErrorMessage(config.error()) << std::endl;
        return 1;
    }

    auto& logger = Logger::Instance();
    if (!logger.Initialize(config.value().logging.toLoggerOptions())) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    auto diagnostics = std::make_shared<LoggerDiagnosticsSink>();
    Memory::SafeMemoryAccessor accessor;
    Memory::PatternScanner scanner(accessor);
    auto primitive = std::make_shared<Hooks::InlineJumpPrimitive>(accessor);
    Hooks::HookRegistry registry(accessor, primitive, diagnostics);
    Hooks::AttachSequencer sequencer(scanner, accessor, registry, diagnostics);
    ProcessModuleLocator modules;

    const std::unordered_map<std::string, Address> replacements = {
        {"demo_target", reinterpret_cast<Address>(&DemoReplacement)},
    };

    SNARE_LOG_INFO_F("DemoTarget(5) before attach = %d", DemoTarget(5));

    auto attached = sequencer.attachAll(config.value().hooks, modules, replacements);
    if (attached.isFailure()) {
        SNARE_LOG_ERROR_F("Attach aborted: %s", std::string(getErrorMessage(attached.error())).c_str());
        logger.Shutdown();
        return 1;
    }

    SNARE_LOG_INFO_F("Attached %zu of %zu hooks", attached.value(), config.value().hooks.size());
    SNARE_LOG_INFO_F("DemoTarget(5) while hooked = %d", DemoTarget(5));

    for (const auto& id : registry.ids()) {
        auto info = registry.info(id);
        if (info.isSuccess()) {
            SNARE_LOG_INFO_F("  %s at %s: %s", id.c_str(),
                             formatAddress(info.value().target).c_str(), Hooks::toString(info.value().state));
        }
    }

    if (registry.removeAll() != 0) {
        SNARE_LOG_WARNING("Some hooks could not be removed");
    }
    SNARE_LOG_INFO_F("DemoTarget(5) after removal = %d", DemoTarget(5));

    logger.Shutdown();
    return 0;
}
