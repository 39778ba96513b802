#include "OffHeap/BlockAllocator/BlockFreelist.hpp"

#include <cassert>

std::byte* BlockFreelist::try_pop() {
    SpinLockGuard guard(lock_);

    FreeNode* node = head_;
    if (node == nullptr) {
        assert(count_.load(std::memory_order_relaxed) == 0);
        return nullptr;
    }

    head_ = node->next;
    count_.fetch_sub(1, std::memory_order_relaxed);
    return reinterpret_cast<std::byte*>(node);
}

bool BlockFreelist::try_push(std::byte* block, size_t limit) {
    assert(block != nullptr);

    SpinLockGuard guard(lock_);
    // 水位线判断和入链在同一把锁下，并发归还不会超过 limit
    if (count_.load(std::memory_order_relaxed) >= limit) {
        return false;
    }

    FreeNode* node = reinterpret_cast<FreeNode*>(block);
    node->next = head_;
    head_ = node;
    count_.fetch_add(1, std::memory_order_relaxed);
    return true;
}
