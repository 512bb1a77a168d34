/**
 * Snare Core Library - Inline Jump Primitive Tests
 *
 * Copyright (c) 2025 Snare Project. All rights reserved.
 *
 * Argument checks run against an in-memory backend. The live patching test
 * generates a tiny function in an executable page and redirects it.
 */

#include <gtest/gtest.h>
#include <Snare/Core/HookPrimitive.hpp>
#include <Snare/Core/HookRegistry.hpp>
#include "TestHarness.hpp"
#include <Snare/Core/RegionEnumerator.hpp>
#include <atomic>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>

#if defined(__linux__) && defined(__x86_64__)
#include <sys/mman.h>
#include <unistd.h>
#endif

using namespace Snare;
using namespace Snare::Core::Hooks;
using namespace Snare::Core::Memory;
using namespace Snare::Testing;

TEST(InlineJumpPrimitiveTests, EncodesAbsoluteIndirectJump) {
    auto bytes = InlineJumpPrimitive::encodeJump(0x1122334455667788ULL);

    ASSERT_EQ(bytes.size(), InlineJumpPrimitive::kRedirectSize);
    EXPECT_EQ(bytes, (ByteBuffer{0xFF, 0x25, 0x00, 0x00, 0x00, 0x00,
                                 0x88, 0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11}));
}

TEST(InlineJumpPrimitiveTests, RejectsNullReplacement) {
    auto backend = std::make_shared<FakeMemoryBackend>();
    SafeMemoryAccessor accessor(backend);
    auto region = backend->addBlock(0x1000, ByteBuffer(64, 0x90));
    InlineJumpPrimitive primitive(accessor);

    auto result = primitive.install(region, 0x1000, 0);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::InvalidArgument);
    EXPECT_EQ(backend->writeCalls(), 0u);
}

TEST(InlineJumpPrimitiveTests, PatchOutsideRegionIsRejected) {
    auto backend = std::make_shared<FakeMemoryBackend>();
    SafeMemoryAccessor accessor(backend);
    auto region = backend->addBlock(0x1000, ByteBuffer(64, 0x90));
    InlineJumpPrimitive primitive(accessor);
    const ByteBuffer bytes(4, 0xCC);

    auto outside = primitive.patch(region, 0x2000, bytes);
    auto overrun = primitive.patch(region, 0x1000 + 62, bytes);

    EXPECT_EQ(outside.error(), ErrorCode::InvalidAddress);
    EXPECT_EQ(overrun.error(), ErrorCode::OutOfBounds);
    EXPECT_EQ(backend->writeCalls(), 0u);
}

TEST(InlineJumpPrimitiveTests, UninstallUnknownHandle) {
    auto backend = std::make_shared<FakeMemoryBackend>();
    SafeMemoryAccessor accessor(backend);
    InlineJumpPrimitive primitive(accessor);

    HookHandle handle;
    handle.token = 77;

    auto result = primitive.uninstall(handle);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::HookRemoveError);
}

#if defined(__linux__) && defined(__x86_64__)

namespace {

    int snareTestReplacement() {
        return 42;
    }

    using IntFunction = int (*)();

    /**
     * One executable page holding "mov eax, 1; ret" padded with nops
     */
    class GeneratedFunction {
    public:
        GeneratedFunction() {
            m_size = static_cast<size_t>(sysconf(_SC_PAGESIZE));
            void* page = mmap(nullptr, m_size, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
            if (page == MAP_FAILED) {
                return;
            }
            const Byte code[] = {0xB8, 0x01, 0x00, 0x00, 0x00, 0xC3};
            std::memset(page, 0x90, m_size);
            std::memcpy(page, code, sizeof(code));
            if (mprotect(page, m_size, PROT_READ | PROT_EXEC) != 0) {
                munmap(page, m_size);
                return;
            }
            m_page = page;
        }

        ~GeneratedFunction() {
            if (m_page) {
                munmap(m_page, m_size);
            }
        }

        bool valid() const { return m_page != nullptr; }

        int call() const { return reinterpret_cast<IntFunction>(m_page)(); }

        ModuleRegion region() const {
            ModuleRegion r;
            r.base = reinterpret_cast<Address>(m_page);
            r.size = m_size;
            return r;
        }

    private:
        void* m_page = nullptr;
        size_t m_size = 0;
    };

} // anonymous namespace

TEST(InlineJumpPrimitiveTests, RedirectsLiveFunction) {
    GeneratedFunction function;
    ASSERT_TRUE(function.valid()) << "Could not map an executable page";
    ASSERT_EQ(function.call(), 1);

    SafeMemoryAccessor accessor;
    auto primitive = std::make_shared<InlineJumpPrimitive>(accessor);
    HookRegistry registry(accessor, primitive);
    const HookTarget target{function.region(), function.region().base};
    const Address replacement = reinterpret_cast<Address>(&snareTestReplacement);

    ASSERT_TRUE(registry.install("generated", target, replacement).isSuccess());
    EXPECT_EQ(function.call(), 42);

    ASSERT_TRUE(registry.disable("generated").isSuccess());
    EXPECT_EQ(function.call(), 1);

    ASSERT_TRUE(registry.enable("generated").isSuccess());
    EXPECT_EQ(function.call(), 42);

    ASSERT_TRUE(registry.remove("generated").isSuccess());
    EXPECT_EQ(function.call(), 1);
    EXPECT_EQ(primitive->activeCount(), 0u);
}

TEST(InlineJumpPrimitiveTests, RestoresPageProtection) {
    GeneratedFunction function;
    ASSERT_TRUE(function.valid());

    SafeMemoryAccessor accessor;
    InlineJumpPrimitive primitive(accessor);
    const ByteBuffer nops(4, 0x90);

    ASSERT_TRUE(primitive.patch(function.region(), function.region().base + 8, nops).isSuccess());

    // Page is read+execute again, so a plain write through the accessor is refused
    auto write = accessor.write(function.region(), 8, nops);
    ASSERT_TRUE(write.isFailure());
    EXPECT_EQ(write.error(), ErrorCode::WriteProtected);
    EXPECT_EQ(function.call(), 1);
}

TEST(InlineJumpPrimitiveTests, ConcurrentPatchesShareOnePage) {
    GeneratedFunction function;
    ASSERT_TRUE(function.valid());

    SafeMemoryAccessor accessor;
    InlineJumpPrimitive primitive(accessor);
    const ModuleRegion region = function.region();
    const ByteBuffer filler(InlineJumpPrimitive::kRedirectSize, 0xC3);
    const Address offsets[] = {512, 1024, 2048, 3072};

    std::atomic<int> failures{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (Address offset : offsets) {
        threads.emplace_back([&, offset]() {
            while (!go.load()) {}
            for (int i = 0; i < 300; ++i) {
                if (primitive.patch(region, region.base + offset, filler).isFailure()) {
                    failures++;
                }
            }
        });
    }
    go.store(true);
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(function.call(), 1);

    RegionEnumerator enumerator;
    auto page = enumerator.findRegionContaining(region.base);
    ASSERT_TRUE(page.isSuccess());
    EXPECT_EQ(page.value().protection, MemoryProtection::ExecuteRead)
        << "Page must return to read+execute once every patch has finished";
}

#endif
