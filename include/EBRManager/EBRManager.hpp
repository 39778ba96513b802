//EBRManager/EBRManager.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include "EBRManager/ThreadSlotManager.hpp"
#include "EBRManager/LockFreeSingleLinkedList.hpp"
#include "EBRManager/ReclaimToken.hpp"

// 基于 epoch 的延迟回收。
// 读者在访问堆外内存期间处于 enter()/leave() 之间；退休的 Block
// 只有在全局 epoch 比退休时刻前进两步之后才会被回收，
// 此时不可能再有读者持有它的视图。
class EBRManager {
public:
    EBRManager();
    ~EBRManager();

    EBRManager(const EBRManager&) = delete;
    EBRManager& operator=(const EBRManager&) = delete;
    EBRManager(EBRManager&&) = delete;
    EBRManager& operator=(EBRManager&&) = delete;

    // 可重入：同一线程嵌套调用只有最外层生效
    void enter();
    void leave();

    [[nodiscard]] bool isPinned();

    // 退休一个 Block，宽限期结束后以 ReclaimToken 调用 reclaim(ctx, block_id, token)
    void retireBlock(void* ctx, uint32_t block_id, ReclaimFn reclaim);

    // 不依赖 leave()，主动尝试推进 epoch 并回收过了宽限期的 Block。
    // 有读者停在旧 epoch 时推进失败，返回 0。
    size_t tryReclaim();

    // 无条件回收所有待回收的 Block。调用方保证此时已没有读者。
    size_t drain();

    [[nodiscard]] uint64_t currentEpoch() const noexcept {
        return global_epoch_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t pendingCount() const noexcept {
        return pending_count_.load(std::memory_order_acquire);
    }

public:
    static constexpr size_t kNumEpochLists = 3;

private:
    bool tryAdvanceEpoch_(size_t* reclaimed = nullptr);
    size_t collectGarbage_(uint64_t new_epoch);
    ThreadSlot* getLocalSlot_();
    static void reclaimNode_(RetiredNode* node, uint64_t epoch);

private:
    alignas(64) std::atomic<uint64_t> global_epoch_;
    LockFreeSingleLinkedList garbage_lists_[kNumEpochLists];
    std::atomic<size_t> pending_count_{0};

    ThreadSlotManager slot_manager_;
};


// RAII 读保护，和 SpinLockGuard 用法一致
class EpochGuard {
public:
    explicit EpochGuard(EBRManager& manager) : manager_(manager) {
        manager_.enter();
    }

    ~EpochGuard() {
        manager_.leave();
    }

    EpochGuard(const EpochGuard&) = delete;
    EpochGuard& operator=(const EpochGuard&) = delete;

private:
    EBRManager& manager_;
};
