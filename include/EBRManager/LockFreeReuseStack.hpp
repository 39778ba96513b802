#pragma once

#include "OffHeap/common/SpinLock.hpp"

#include <atomic>

// 侵入式的复用栈，T 必须带有 T* next_free 字段。
// push 无锁；pop 之间用自旋锁串行化，这样 pop 看到的 next 不会被并发 pop 改掉 (没有 ABA)。
template<typename T>
class LockFreeReuseStack {
public:
    LockFreeReuseStack() noexcept = default;

    LockFreeReuseStack(const LockFreeReuseStack&) = delete;
    LockFreeReuseStack& operator=(const LockFreeReuseStack&) = delete;

    void push(T* node) noexcept {
        if(node == nullptr)
            return;

        T* old_head = head_.load(std::memory_order_relaxed);
        do {
            node->next_free = old_head;
        } while (!head_.compare_exchange_weak(
            old_head,
            node,
            std::memory_order_release,
            std::memory_order_relaxed));
    }

    [[nodiscard]] T* pop() noexcept {
        SpinLockGuard guard(pop_lock_);

        T* old_head = head_.load(std::memory_order_acquire);
        while (old_head != nullptr &&
               !head_.compare_exchange_weak(
                   old_head,
                   old_head->next_free,
                   std::memory_order_acquire,
                   std::memory_order_acquire)) {
        }

        if (old_head != nullptr) {
            old_head->next_free = nullptr;
        }
        return old_head;
    }

    [[nodiscard]] bool empty() const noexcept {
        return head_.load(std::memory_order_acquire) == nullptr;
    }

private:
    std::atomic<T*> head_{nullptr};
    SpinLock pop_lock_;
};
