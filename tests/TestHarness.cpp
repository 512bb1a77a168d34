// tests/TestHarness.cpp
#include "TestHarness.hpp"
#include <algorithm>
#include <cstring>

namespace Snare::Testing {

// ============================================================================
// FakeMemoryBackend
// ============================================================================

ModuleRegion FakeMemoryBackend::addBlock(Address base, ByteBuffer bytes,
                                         bool readable, bool writable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ModuleRegion region;
    region.base = base;
    region.size = bytes.size();

    Block block;
    block.bytes = std::move(bytes);
    block.readable = readable;
    block.writable = writable;
    m_blocks[base] = std::move(block);
    return region;
}

void FakeMemoryBackend::setReadable(Address base, bool readable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_blocks.find(base);
    if (it != m_blocks.end()) {
        it->second.readable = readable;
    }
}

void FakeMemoryBackend::setWritable(Address base, bool writable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_blocks.find(base);
    if (it != m_blocks.end()) {
        it->second.writable = writable;
    }
}

void FakeMemoryBackend::failReadsAt(Address address) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_faults.insert(address);
}

FakeMemoryBackend::Block* FakeMemoryBackend::findBlock(Address address, size_t length) {
    auto it = m_blocks.upper_bound(address);
    if (it == m_blocks.begin()) {
        return nullptr;
    }
    --it;
    const Address base = it->first;
    const size_t size = it->second.bytes.size();
    if (address - base > size || length > size - (address - base)) {
        return nullptr;
    }
    return &it->second;
}

const FakeMemoryBackend::Block* FakeMemoryBackend::findBlock(Address address, size_t length) const {
    return const_cast<FakeMemoryBackend*>(this)->findBlock(address, length);
}

void FakeMemoryBackend::poke(Address address, ByteSpan bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Block* block = findBlock(address, bytes.size());
    if (!block) {
        ADD_FAILURE() << "poke outside registered memory";
        return;
    }
    const Address base = std::prev(m_blocks.upper_bound(address))->first;
    std::copy(bytes.begin(), bytes.end(), block->bytes.begin() + (address - base));
}

ByteBuffer FakeMemoryBackend::peek(Address address, size_t length) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const Block* block = findBlock(address, length);
    if (!block) {
        ADD_FAILURE() << "peek outside registered memory";
        return {};
    }
    const Address base = std::prev(m_blocks.upper_bound(address))->first;
    auto first = block->bytes.begin() + (address - base);
    return ByteBuffer(first, first + length);
}

Result<void> FakeMemoryBackend::read(Address address, MutableByteSpan out) {
    m_readCalls.fetch_add(1);
    std::lock_guard<std::mutex> lock(m_mutex);

    const Block* block = findBlock(address, out.size());
    if (!block || !block->readable) {
        return ErrorCode::UnreadableMemory;
    }
    for (Address fault : m_faults) {
        if (fault >= address && fault - address < out.size()) {
            return ErrorCode::UnreadableMemory;
        }
    }

    const Address base = std::prev(m_blocks.upper_bound(address))->first;
    if (!out.empty()) {
        std::memcpy(out.data(), block->bytes.data() + (address - base), out.size());
    }
    return {};
}

Result<void> FakeMemoryBackend::write(Address address, ByteSpan data) {
    m_writeCalls.fetch_add(1);
    std::lock_guard<std::mutex> lock(m_mutex);

    Block* block = findBlock(address, data.size());
    if (!block || !block->writable) {
        return ErrorCode::WriteProtected;
    }

    const Address base = std::prev(m_blocks.upper_bound(address))->first;
    if (!data.empty()) {
        std::memcpy(block->bytes.data() + (address - base), data.data(), data.size());
    }
    return {};
}

// ============================================================================
// FakeHookPrimitive
// ============================================================================

FakeHookPrimitive::FakeHookPrimitive(Core::Memory::SafeMemoryAccessor& accessor)
    : m_accessor(accessor) {
}

ByteBuffer FakeHookPrimitive::encode(Address replacement) {
    ByteBuffer bytes = {0xE9};
    for (int i = 0; i < 4; ++i) {
        bytes.push_back(static_cast<Byte>((replacement >> (8 * i)) & 0xFF));
    }
    return bytes;
}

Result<Core::Hooks::HookHandle> FakeHookPrimitive::install(const ModuleRegion& region,
                                                           Address target,
                                                           Address replacement) {
    installCalls.fetch_add(1);
    const ByteBuffer redirect = encode(replacement);

    if (failInstall.load()) {
        if (partialWriteOnFailure.load()) {
            auto partial = m_accessor.writeAt(region, target, ByteSpan(redirect.data(), 2));
            EXPECT_TRUE(partial.isSuccess());
        }
        return ErrorCode::HookInstallError;
    }

    auto written = m_accessor.writeAt(region, target, redirect);
    if (written.isFailure()) {
        return written.error();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    Core::Hooks::HookHandle handle;
    handle.token = m_nextToken++;
    handle.target = target;
    handle.replacement = replacement;
    handle.patchSize = redirect.size();
    m_handles.insert(handle.token);
    return handle;
}

Result<void> FakeHookPrimitive::patch(const ModuleRegion& region, Address address, ByteSpan bytes) {
    patchCalls.fetch_add(1);
    if (failPatch.load()) {
        return ErrorCode::WriteProtected;
    }
    return m_accessor.writeAt(region, address, bytes);
}

Result<void> FakeHookPrimitive::uninstall(const Core::Hooks::HookHandle& handle) {
    uninstallCalls.fetch_add(1);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (failUninstall.load() || m_handles.erase(handle.token) == 0) {
        return ErrorCode::HookRemoveError;
    }
    return {};
}

size_t FakeHookPrimitive::activeHandles() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handles.size();
}

// ============================================================================
// RecordingSink
// ============================================================================

void RecordingSink::emit(const DiagnosticEvent& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(event);
}

std::vector<DiagnosticEvent> RecordingSink::events() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

size_t RecordingSink::count(const std::string& component) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_events.begin(), m_events.end(),
        [&](const DiagnosticEvent& e) { return e.component == component; }));
}

size_t RecordingSink::countField(const std::string& key, const std::string& value) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_events.begin(), m_events.end(),
        [&](const DiagnosticEvent& e) { return e.field(key) == value; }));
}

void RecordingSink::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
}

} // namespace Snare::Testing
