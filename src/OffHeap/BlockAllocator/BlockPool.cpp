#include "OffHeap/BlockAllocator/BlockPool.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>

BlockPool& BlockPool::GetInstance() {
    static BlockPool instance(kDefaultBlockSize);
    return instance;
}

BlockPool::BlockPool(size_t block_size, size_t max_pooled_blocks)
    : block_size_(block_size), max_pooled_blocks_(max_pooled_blocks) {
    assert(block_size_ > 0 && block_size_ % kPageSize == 0);
}

BlockPool::~BlockPool() {
    free_list_.drain([this](std::byte* block) {
        SystemBlockAllocator::Unmap(block, block_size_);
    });
}

void* BlockPool::fetchBlock() {
    if (std::byte* cached = free_list_.try_pop()) {
        return cached;
    }

    void* ptr = SystemBlockAllocator::Map(block_size_);
    if (ptr == nullptr) {
        std::cerr << "[BlockPool::fetchBlock] mmap failed (OOM), block size "
                  << block_size_ << "." << std::endl;
    }
    return ptr;
}

void BlockPool::returnBlock(void* ptr) {
    if (ptr == nullptr) {
        return;
    }

    assert((reinterpret_cast<uintptr_t>(ptr) & (SystemBlockAllocator::AlignmentFor(block_size_) - 1)) == 0);

    // 超过水位线的直接还给操作系统
    if (!free_list_.try_push(static_cast<std::byte*>(ptr), max_pooled_blocks_)) {
        SystemBlockAllocator::Unmap(ptr, block_size_);
    }
}

size_t BlockPool::getFreeBlockCount() const {
    return free_list_.size();
}
