#include "OffHeap/BlockAllocator/Block.hpp"

#include <cassert>

Block::Block(uint32_t id, uint32_t capacity) noexcept
    : id_(id), capacity_(capacity) {
    assert(id != kInvalidBlockId);
}

void Block::attach(std::byte* base) noexcept {
    assert(base != nullptr);
    assert(base_ == nullptr && "Block is already backed by memory");

    base_ = base;
    handed_out_.store(0, std::memory_order_relaxed);
    bump_offset_.store(0, std::memory_order_release);
}

std::byte* Block::detach() noexcept {
    std::byte* base = base_;
    base_ = nullptr;
    bump_offset_.store(capacity_, std::memory_order_release);
    return base;
}

uint32_t Block::allocate(uint32_t size) noexcept {
    const uint64_t aligned = AlignedSize(size);
    uint64_t cur = bump_offset_.load(std::memory_order_relaxed);

    do {
        // capacity 是页大小的整数倍，cur 始终按 kAllocAlignment 对齐
        if (cur + aligned > capacity_) {
            return kNoSpace;
        }
    } while (!bump_offset_.compare_exchange_weak(
        cur,
        cur + aligned,
        std::memory_order_acq_rel,
        std::memory_order_relaxed));

    handed_out_.fetch_add(aligned, std::memory_order_relaxed);
    return static_cast<uint32_t>(cur);
}

void Block::seal() noexcept {
    bump_offset_.store(capacity_, std::memory_order_release);
}

uint64_t Block::allocatedBytes() const noexcept {
    return handed_out_.load(std::memory_order_relaxed);
}

uint64_t Block::remaining() const noexcept {
    uint64_t used = bump_offset_.load(std::memory_order_acquire);
    return used >= capacity_ ? 0 : capacity_ - used;
}
