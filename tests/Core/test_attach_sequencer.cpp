/**
 * @file test_attach_sequencer.cpp
 * @brief Unit tests for module-load-time hook attachment
 * @author Snare Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Snare Project. All rights reserved.
 */

#include <Snare/Core/AttachSequencer.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <thread>

using namespace Snare;
using namespace Snare::Core;
using namespace Snare::Core::Hooks;
using namespace Snare::Core::Memory;
using namespace Snare::Testing;

namespace {

    constexpr Address kGameBase = 0x10000;
    constexpr Address kRenderBase = 0x20000;
    constexpr Address kReplacement = 0x7F00AA00;

    /**
     * Module table keyed by exact name
     */
    class FakeModuleProvider : public ModuleProvider {
    public:
        void add(const std::string& name, const ModuleRegion& region) {
            m_modules[name] = region;
        }

        Result<ModuleRegion> locate(const std::string& moduleName) override {
            ++lookups;
            auto it = m_modules.find(moduleName);
            if (it == m_modules.end()) {
                return ErrorCode::ModuleNotFound;
            }
            return it->second;
        }

        int lookups = 0;

    private:
        std::unordered_map<std::string, ModuleRegion> m_modules;
    };

    Pattern compileOrDie(const char* text) {
        auto result = Pattern::compile(text);
        EXPECT_TRUE(result.isSuccess()) << "bad test pattern: " << text;
        return std::move(result).value();
    }

    Config::HookDefinition definition(const std::string& id, const std::string& signature,
                                      const std::string& module,
                                      Config::FailurePolicy policy = Config::FailurePolicy::Abort) {
        Config::HookDefinition def;
        def.id = id;
        def.signature = signature;
        def.moduleName = module;
        def.onFailure = policy;
        return def;
    }

} // anonymous namespace

// ============================================================================
// Test Fixture
// ============================================================================

class AttachSequencerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<FakeMemoryBackend>();
        accessor = std::make_unique<SafeMemoryAccessor>(backend);

        // game: "update" at +0x20, referenced by a call at +0x08
        ByteBuffer game(0x100, 0xCC);
        const ByteBuffer update = {0x40, 0x53, 0x48, 0x83, 0xEC, 0x20, 0x8B, 0xD9};
        std::copy(update.begin(), update.end(), game.begin() + 0x20);
        const ByteBuffer anchor = {0xE8, 0x13, 0x00, 0x00, 0x00, 0x90, 0x90, 0x90};
        std::copy(anchor.begin(), anchor.end(), game.begin() + 0x08);
        gameRegion = backend->addBlock(kGameBase, game);

        // render: "present" at +0x40
        ByteBuffer render(0x100, 0x90);
        const ByteBuffer present = {0x48, 0x89, 0x5C, 0x24, 0x08, 0x57, 0x48, 0x83};
        std::copy(present.begin(), present.end(), render.begin() + 0x40);
        renderRegion = backend->addBlock(kRenderBase, render);

        modules.add("game.so", gameRegion);
        modules.add("render.so", renderRegion);

        scanner = std::make_unique<PatternScanner>(*accessor);
        primitive = std::make_shared<FakeHookPrimitive>(*accessor);
        registry = std::make_unique<HookRegistry>(*accessor, primitive);
        sink = std::make_shared<RecordingSink>();
        sequencer = std::make_unique<AttachSequencer>(*scanner, *accessor, *registry, sink);
    }

    void TearDown() override {
        sequencer.reset();
        registry.reset();
    }

    std::shared_ptr<FakeMemoryBackend> backend;
    std::unique_ptr<SafeMemoryAccessor> accessor;
    ModuleRegion gameRegion;
    ModuleRegion renderRegion;
    FakeModuleProvider modules;
    std::unique_ptr<PatternScanner> scanner;
    std::shared_ptr<FakeHookPrimitive> primitive;
    std::unique_ptr<HookRegistry> registry;
    std::shared_ptr<RecordingSink> sink;
    std::unique_ptr<AttachSequencer> sequencer;
};

// ============================================================================
// resolve / attach
// ============================================================================

TEST_F(AttachSequencerTest, ResolveReturnsMatchAddress) {
    auto result = sequencer->resolve(gameRegion, compileOrDie("40 53 48 83 EC ?? 8B D9"));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), kGameBase + 0x20);
}

TEST_F(AttachSequencerTest, ResolveAppliesDisplacement) {
    auto result = sequencer->resolve(gameRegion, compileOrDie("E8 ?? ?? ?? ?? 90 90 90"), 0x18);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), kGameBase + 0x20);
}

TEST_F(AttachSequencerTest, DisplacementOutsideRegionIsInvalidAddress) {
    auto past = sequencer->resolve(gameRegion, compileOrDie("40 53 48 83"), 0x1000);
    auto before = sequencer->resolve(gameRegion, compileOrDie("40 53 48 83"), -0x40);

    EXPECT_EQ(past.error(), ErrorCode::InvalidAddress);
    EXPECT_EQ(before.error(), ErrorCode::InvalidAddress);
}

TEST_F(AttachSequencerTest, AttachInstallsHook) {
    auto handle = sequencer->attach("update", gameRegion, compileOrDie("40 53 48 83 EC ?? 8B D9"),
                                    kReplacement);

    ASSERT_TRUE(handle.isSuccess()) << "Attach should succeed";
    EXPECT_EQ(handle.value().target, kGameBase + 0x20);
    EXPECT_EQ(registry->state("update").value(), HookState::Installed);
    EXPECT_EQ(backend->peek(kGameBase + 0x20, 5), FakeHookPrimitive::encode(kReplacement));
}

TEST_F(AttachSequencerTest, ModuleNotReadyTouchesNothing) {
    ReadinessSignal notLoaded;
    AttachOptions options;
    options.timeout = Milliseconds(0);
    options.readiness = &notLoaded;

    auto result = sequencer->attach("update", gameRegion, compileOrDie("40 53 48 83 EC ?? 8B D9"),
                                    kReplacement, options);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::ModuleNotLoaded);
    EXPECT_EQ(registry->state("update").error(), ErrorCode::HookNotFound);
    EXPECT_EQ(backend->writeCalls(), 0u);
    EXPECT_EQ(backend->readCalls(), 0u);
}

TEST_F(AttachSequencerTest, WaitsForModuleWithinTimeout) {
    ReadinessSignal signal;
    AttachOptions options;
    options.timeout = Milliseconds(5000);
    options.readiness = &signal;

    std::thread loader([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        signal.markLoaded();
    });

    auto result = sequencer->attach("update", gameRegion, compileOrDie("40 53 48 83 EC ?? 8B D9"),
                                    kReplacement, options);
    loader.join();

    ASSERT_TRUE(result.isSuccess());
}

TEST_F(AttachSequencerTest, UnboundedTimeoutWaitsForModule) {
    ReadinessSignal signal;
    AttachOptions options;
    options.timeout = Milliseconds::max();
    options.readiness = &signal;

    std::thread loader([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        signal.markLoaded();
    });

    auto result = sequencer->attach("update", gameRegion, compileOrDie("40 53 48 83 EC ?? 8B D9"),
                                    kReplacement, options);
    loader.join();

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(registry->state("update").value(), HookState::Installed);
}

TEST_F(AttachSequencerTest, MissingSignatureCreatesNoHook) {
    auto result = sequencer->attach("update", gameRegion, compileOrDie("DE AD BE EF"), kReplacement);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::SignatureNotFound);
    EXPECT_EQ(registry->state("update").error(), ErrorCode::HookNotFound);
    EXPECT_EQ(backend->writeCalls(), 0u);
}

TEST_F(AttachSequencerTest, UnreadableModuleIsScanMemoryError) {
    backend->setReadable(kGameBase, false);

    auto result = sequencer->attach("update", gameRegion, compileOrDie("40 53 48 83"), kReplacement);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::ScanMemoryError);
}

TEST_F(AttachSequencerTest, RedirectMustFitInRegion) {
    // Signature matches 3 bytes before the end; a 5-byte redirect would overrun
    const Byte tail[] = {0xAB, 0xCD, 0xEF};
    backend->poke(kRenderBase + renderRegion.size - 3, tail);

    auto result = sequencer->attach("tail", renderRegion, compileOrDie("AB CD EF"), kReplacement);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::InvalidAddress);
    EXPECT_EQ(registry->state("tail").error(), ErrorCode::HookNotFound);
}

TEST_F(AttachSequencerTest, DuplicateAttachIsAlreadyInstalled) {
    auto pattern = compileOrDie("40 53 48 83 EC ?? 8B D9");
    ASSERT_TRUE(sequencer->attach("update", gameRegion, pattern, kReplacement).isSuccess());

    auto again = sequencer->attach("update2", gameRegion, pattern, kReplacement);

    ASSERT_TRUE(again.isFailure());
    EXPECT_EQ(again.error(), ErrorCode::AlreadyInstalled);
}

TEST_F(AttachSequencerTest, EmitsStepEvents) {
    ASSERT_TRUE(sequencer->attach("update", gameRegion, compileOrDie("40 53 48 83 EC ?? 8B D9"),
                                  kReplacement).isSuccess());
    ASSERT_TRUE(sequencer->attach("missing", gameRegion, compileOrDie("DE AD BE EF"),
                                  kReplacement).isFailure());

    auto events = sink->events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].component, "AttachSequencer");
    EXPECT_EQ(events[0].field("step"), "install");
    EXPECT_EQ(events[0].field("outcome"), "ok");
    EXPECT_EQ(events[0].field("address"), formatAddress(kGameBase + 0x20));
    EXPECT_EQ(events[1].field("hook"), "missing");
    EXPECT_EQ(events[1].field("step"), "resolve");
    EXPECT_EQ(events[1].field("outcome"), getErrorMessage(ErrorCode::SignatureNotFound));
}

// ============================================================================
// attachAll
// ============================================================================

TEST_F(AttachSequencerTest, AttachAllAttachesEveryHook) {
    std::vector<Config::HookDefinition> defs = {
        definition("update", "40 53 48 83 EC ?? 8B D9", "game.so"),
        definition("present", "48 89 5C 24 08 57", "render.so"),
    };
    std::unordered_map<std::string, Address> replacements = {
        {"update", kReplacement},
        {"present", kReplacement + 0x100},
    };

    auto result = sequencer->attachAll(defs, modules, replacements);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), 2u);
    EXPECT_EQ(registry->state("present").value(), HookState::Installed);
    EXPECT_EQ(backend->peek(kRenderBase + 0x40, 5), FakeHookPrimitive::encode(kReplacement + 0x100));
}

TEST_F(AttachSequencerTest, AttachAllHonorsDisplacement) {
    auto def = definition("update", "E8 ?? ?? ?? ?? 90 90 90", "game.so");
    def.targetDisplacement = 0x18;

    auto result = sequencer->attachAll({def}, modules, {{"update", kReplacement}});

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(registry->info("update").value().target, kGameBase + 0x20);
}

TEST_F(AttachSequencerTest, AttachAllAbortStopsAtFirstFailure) {
    std::vector<Config::HookDefinition> defs = {
        definition("missing", "DE AD BE EF", "game.so", Config::FailurePolicy::Abort),
        definition("present", "48 89 5C 24 08 57", "render.so"),
    };

    auto result = sequencer->attachAll(defs, modules, {{"missing", kReplacement}, {"present", kReplacement}});

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::SignatureNotFound);
    EXPECT_EQ(registry->state("present").error(), ErrorCode::HookNotFound);
}

TEST_F(AttachSequencerTest, AttachAllContinuesWhenAllowed) {
    std::vector<Config::HookDefinition> defs = {
        definition("missing", "DE AD BE EF", "game.so", Config::FailurePolicy::LogAndContinue),
        definition("nomodule", "90 90", "absent.so", Config::FailurePolicy::LogAndContinue),
        definition("present", "48 89 5C 24 08 57", "render.so"),
    };
    std::unordered_map<std::string, Address> replacements = {
        {"missing", kReplacement},
        {"nomodule", kReplacement},
        {"present", kReplacement},
    };

    auto result = sequencer->attachAll(defs, modules, replacements);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), 1u);
    EXPECT_EQ(registry->state("present").value(), HookState::Installed);
}

TEST_F(AttachSequencerTest, AttachAllMissingModuleIsModuleNotFound) {
    auto result = sequencer->attachAll({definition("x", "90 90", "absent.so")}, modules,
                                       {{"x", kReplacement}});

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::ModuleNotFound);
}

TEST_F(AttachSequencerTest, AttachAllRequiresReplacement) {
    auto result = sequencer->attachAll({definition("update", "40 53 48 83", "game.so")}, modules, {});

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::InvalidArgument);
    EXPECT_EQ(modules.lookups, 0);
}

TEST_F(AttachSequencerTest, AttachAllUsesReadiness) {
    ReadinessSignal notLoaded;
    auto def = definition("update", "40 53 48 83", "game.so");
    def.timeout = Milliseconds(0);

    auto result = sequencer->attachAll({def}, modules, {{"update", kReplacement}}, &notLoaded);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::ModuleNotLoaded);
    EXPECT_EQ(backend->writeCalls(), 0u);
}
