#pragma once

#include "EBRManager/ReclaimToken.hpp"

#include <atomic>
#include <cstdint>

// 一个待回收的 Block，记录退休时的全局 epoch
struct RetiredNode {
    RetiredNode* next = nullptr;
    uint64_t epoch = 0;
    void* ctx = nullptr;
    uint32_t block_id = 0;
    ReclaimFn reclaim = nullptr;
};

// 多生产者推入、一次性整体摘取的无锁单链表
class LockFreeSingleLinkedList {
public:
    LockFreeSingleLinkedList() noexcept = default;
    ~LockFreeSingleLinkedList() = default;

    // 禁用拷贝和移动 (std::atomic 不可拷贝)
    LockFreeSingleLinkedList(const LockFreeSingleLinkedList&) = delete;
    LockFreeSingleLinkedList& operator=(const LockFreeSingleLinkedList&) = delete;
    LockFreeSingleLinkedList(LockFreeSingleLinkedList&&) = delete;
    LockFreeSingleLinkedList& operator=(LockFreeSingleLinkedList&&) = delete;

    void push(RetiredNode* node) noexcept {
        if(node == nullptr)
            return;

        RetiredNode* old_node = head_.load(std::memory_order_relaxed);

        do {
            node->next = old_node;
        } while (!head_.compare_exchange_weak(
            old_node,
            node,
            std::memory_order_release,
            std::memory_order_relaxed));
    }

    [[nodiscard]] RetiredNode* steal_all() noexcept {
        return head_.exchange(nullptr, std::memory_order_acq_rel);
    }

    [[nodiscard]] bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == nullptr;
    }

private:
    std::atomic<RetiredNode*> head_{nullptr};
};
