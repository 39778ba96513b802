#include "OffHeap/MemoryManager/MemoryManager.hpp"
#include "OffHeap/Buffer/DetachedBuffer.hpp"
#include "OffHeap/Buffer/WriteBuffer.hpp"

#include <stdexcept>
#include <thread>

MemoryManager::MemoryManager(const AllocatorConfig& config)
    : config_(config), allocator_(config) {}

MemoryManager::MemoryManager(const AllocatorConfig& config, BlockPool& pool)
    : config_(config), allocator_(config, pool) {}

MemoryManager::~MemoryManager() {
    close();
}

Reference MemoryManager::allocate(uint32_t user_size) {
    WriterPin_ pin(*this);

    if (user_size > UINT32_MAX - config_.header_size) {
        throw std::invalid_argument("allocation size overflows a 32-bit length");
    }

    // 只覆盖切分和写头部；之后的写入由调用方自己持有 enterRead()
    EpochGuard guard(epochs_);

    const uint32_t total = user_size + config_.header_size;
    Reference ref = allocator_.allocate(total == 0 ? 1 : total);
    ref.length = total;

    std::byte* region = allocator_.blockMemory(ref.block_id) + ref.position;
    HeaderCodec::stamp(region, config_.header_size, user_size, config_.byte_order);
    return ref;
}

UnboundBuffer MemoryManager::newUnboundBuffer() const {
    checkOpen_();
    return UnboundBuffer(*this);
}

WriteBuffer MemoryManager::newWriteBuffer(const Reference& ref) {
    return WriteBuffer(*this, ref);
}

std::byte* MemoryManager::writableRegion(const Reference& ref) {
    checkOpen_();
    assert(ref.isValid() && ref.length >= config_.header_size);
    return allocator_.blockMemory(ref.block_id) + ref.position;
}

RegionHeader MemoryManager::readHeader(const Reference& ref) const {
    BlockView view = resolve(ref);
    return HeaderCodec::decode(view.data(), config_.header_size,
                               ref.userLength(config_.header_size), config_.byte_order);
}

void MemoryManager::retireBlock(uint32_t block_id) {
    checkOpen_();
    allocator_.sealBlock(block_id);
    epochs_.retireBlock(&allocator_, block_id, &MemoryManager::reclaimBlock_);
}

size_t MemoryManager::tryReclaim() {
    checkOpen_();
    return epochs_.tryReclaim();
}

void MemoryManager::reclaimBlock_(void* ctx, uint32_t block_id, const ReclaimToken& token) {
    static_cast<NativeMemoryAllocator*>(ctx)->reclaim(block_id, token);
}

void MemoryManager::close() {
    if (closed_.exchange(true, std::memory_order_seq_cst)) {
        return;
    }

    // 等已经通过检查的写者写完，之后再也不会有新的写者
    while (writers_in_flight_.load(std::memory_order_acquire) != 0) {
        std::this_thread::yield();
    }

    // 关闭之后不会再有合法的读者，待回收的 Block 直接归还
    epochs_.drain();
    allocator_.close();
}
