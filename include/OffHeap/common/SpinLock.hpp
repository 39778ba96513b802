#pragma once

#include <atomic>
#include <thread>
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    #include <immintrin.h>
    #define OFFHEAP_CPU_RELAX() _mm_pause()
#else
    #define OFFHEAP_CPU_RELAX() std::this_thread::yield()
#endif

// test-and-test-and-set 自旋锁。
// 临界区都很短 (摘链、装 Block、改 ID 表)，自旋 kSpinsBeforeYield 次仍拿不到就让出时间片。
class SpinLock {
public:
    static constexpr int kSpinsBeforeYield = 64;

    SpinLock() = default;
    SpinLock(const SpinLock&) = delete;
    SpinLock& operator=(const SpinLock&) = delete;

    [[nodiscard]] bool try_lock() noexcept {
        return !locked_.load(std::memory_order_relaxed) &&
               !locked_.exchange(true, std::memory_order_acquire);
    }

    void lock() noexcept {
        int spins = 0;
        while (!try_lock()) {
            // 只读等待，不抢缓存行
            while (locked_.load(std::memory_order_relaxed)) {
                if (++spins < kSpinsBeforeYield) {
                    OFFHEAP_CPU_RELAX();
                } else {
                    spins = 0;
                    std::this_thread::yield();
                }
            }
        }
    }

    void unlock() noexcept {
        locked_.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> locked_{false};
};


class SpinLockGuard {
public:
    explicit SpinLockGuard(SpinLock& lock) : lock_(lock) { lock_.lock(); }
    ~SpinLockGuard() { lock_.unlock(); }

    SpinLockGuard(const SpinLockGuard&) = delete;
    SpinLockGuard& operator=(const SpinLockGuard&) = delete;

private:
    SpinLock& lock_;
};
