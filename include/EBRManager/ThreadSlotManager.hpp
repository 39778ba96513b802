#pragma once

#include <vector>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "EBRManager/LockFreeReuseStack.hpp"
#include "EBRManager/ThreadSlot.hpp"

// 为每个线程分配槽位。
// 一个进程里可以同时存在多个 ThreadSlotManager (每个 MemoryManager 一个)，
// 所以线程本地缓存按实例 ID 区分，而不是只缓存一个槽位。
class ThreadSlotManager {
public:
    ThreadSlotManager();
    ~ThreadSlotManager();

    // 返回 nullptr 表示槽位扩容失败
    ThreadSlot* getLocalSlot();

    template<typename Callable>
    void forEachSlot(Callable func) const;

    [[nodiscard]] size_t capacity() const noexcept {
        return state_->capacity.load(std::memory_order_relaxed);
    }

    // 禁用拷贝和移动
    ThreadSlotManager(const ThreadSlotManager&) = delete;
    ThreadSlotManager& operator=(const ThreadSlotManager&) = delete;
    ThreadSlotManager(ThreadSlotManager&&) = delete;
    ThreadSlotManager& operator=(ThreadSlotManager&&) = delete;

private:
    struct Segment {
        std::unique_ptr<ThreadSlot[]> slots; // 自动管理内存释放 (使用系统 delete[])
        size_t count;                        // 记录这个段有多少个槽位
    };

    // 槽位存储。线程退出时可能晚于 manager 析构，所以由 shared_ptr 托管，
    // 线程本地缓存只持有 weak_ptr。
    struct State {
        ThreadSlot* acquireSlot();
        void releaseSlot(ThreadSlot* slot) noexcept;
        ThreadSlot* expandAndAcquire();

        LockFreeReuseStack<ThreadSlot> free_slots;
        std::vector<Segment> segments;
        std::atomic<size_t> capacity{0};
        mutable std::mutex resize_lock;
    };

    class LocalSlotCache {
    public:
        LocalSlotCache() = default;
        ~LocalSlotCache();

        LocalSlotCache(const LocalSlotCache&) = delete;
        LocalSlotCache& operator=(const LocalSlotCache&) = delete;

        [[nodiscard]] ThreadSlot* find(uint64_t owner_id) noexcept;
        void add(uint64_t owner_id, const std::shared_ptr<State>& state, ThreadSlot* slot);

    private:
        struct Entry {
            uint64_t owner_id;
            std::weak_ptr<State> state;
            ThreadSlot* slot;
        };

        void pruneExpired_();

        std::vector<Entry> entries_;
        size_t last_hit_ = 0;
    };

    static LocalSlotCache& localCache_();

    static constexpr size_t kInitialCapacity = 32;

    const uint64_t instance_id_;
    std::shared_ptr<State> state_;
};


template<typename Callable>
void ThreadSlotManager::forEachSlot(Callable func) const {
    // 加锁以确保在遍历期间 segments 向量不会被其他线程修改（例如扩容）。
    std::lock_guard<std::mutex> lock(state_->resize_lock);

    for (const auto& segment : state_->segments) {
        const ThreadSlot* slots_array = segment.slots.get();
        const size_t count = segment.count;

        for (size_t i = 0; i < count; ++i) {
            func(slots_array[i]);
        }
    }
}
