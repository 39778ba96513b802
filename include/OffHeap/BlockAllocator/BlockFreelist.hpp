#pragma once

#include "OffHeap/common/SpinLock.hpp"

#include <atomic>
#include <cstddef>

// 归还的 Block 内存缓存 (LIFO)。
// 空闲 Block 的前 8 字节被复用为 next 指针，所以不需要额外的节点内存。
class BlockFreelist {
public:
    BlockFreelist() = default;
    ~BlockFreelist() = default;

    BlockFreelist(const BlockFreelist&) = delete;
    BlockFreelist& operator=(const BlockFreelist&) = delete;

    [[nodiscard]] std::byte* try_pop();

    // 缓存已达 limit 时不入链，返回 false，由调用方直接归还操作系统
    [[nodiscard]] bool try_push(std::byte* block, size_t limit);

    // 摘下全部缓存，逐个交给 fn
    template<typename Fn>
    size_t drain(Fn&& fn) {
        FreeNode* chain = nullptr;
        {
            SpinLockGuard guard(lock_);
            chain = head_;
            head_ = nullptr;
            count_.store(0, std::memory_order_relaxed);
        }

        size_t n = 0;
        while (chain) {
            FreeNode* next = chain->next;
            fn(reinterpret_cast<std::byte*>(chain));
            chain = next;
            ++n;
        }
        return n;
    }

    [[nodiscard]] size_t size() const noexcept { return count_.load(std::memory_order_relaxed); }

private:
    struct FreeNode {
        FreeNode* next;
    };

    FreeNode* head_ = nullptr;
    std::atomic<size_t> count_{0};

    SpinLock lock_;
};
