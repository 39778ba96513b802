#pragma once

#include "OffHeap/common/GlobalConfig.hpp"

#include <atomic>
#include <cstdint>

// 每个线程在每个 EBRManager 里独占一个槽位
struct alignas(kCacheLineSize) ThreadSlot {
    std::atomic<uint64_t> local_epoch{0};
    std::atomic<bool> active{false};

    // 只由持有线程读写
    uint32_t nesting = 0;

    // LockFreeReuseStack 的链接字段
    ThreadSlot* next_free = nullptr;

    void reset() noexcept {
        nesting = 0;
        active.store(false, std::memory_order_release);
        local_epoch.store(0, std::memory_order_relaxed);
    }
};
