#pragma once

#include "OffHeap/BlockAllocator/Block.hpp"
#include "OffHeap/BlockAllocator/BlockPool.hpp"
#include "OffHeap/common/AllocatorConfig.hpp"
#include "OffHeap/common/Reference.hpp"
#include "OffHeap/common/SpinLock.hpp"
#include "EBRManager/ReclaimToken.hpp"

#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// Block 分配器：管理全部 Block，按 bump 指针切分区域，按 Block 粒度回收。
//
// 注意：本类不是引用可见性的同步点。写者发布 Reference 必须由上层索引
// 结构用 release 语义完成，读者用 acquire 语义读取。
class NativeMemoryAllocator {
public:
    // block_size 为默认值时使用进程级 BlockPool，否则创建私有池
    explicit NativeMemoryAllocator(const AllocatorConfig& config);
    NativeMemoryAllocator(const AllocatorConfig& config, BlockPool& pool);
    ~NativeMemoryAllocator();

    // size 为包含头部在内的总字节数。
    // 超过上限时抛出 OutOfMemoryError，size 为 0 或大于 Block 时抛出 std::invalid_argument，
    // 关闭之后 (包括与 close() 并发、没能装上新 Block 的调用) 抛出 MemoryManagerClosedError
    [[nodiscard]] Reference allocate(uint32_t size);

    // 前置条件：block_id 指向一个存活的 Block (不检查，只在 Debug 下断言)
    [[nodiscard]] std::byte* blockMemory(uint32_t block_id) const noexcept {
        assert(block_id != kInvalidBlockId && block_id <= max_blocks_);
        const Block* block = blocks_[block_id].get();
        assert(block != nullptr && block->isLive() && "stale or invalid block id");
        return block->base();
    }

    // 停止在该 Block 上继续分配 (退休前调用)
    void sealBlock(uint32_t block_id);

    // 归还 Block 内存并回收 ID，凭证只能由 EBRManager 签发
    void reclaim(uint32_t block_id, const ReclaimToken& token) noexcept;

    // 幂等；归还全部 Block
    void close();

    [[nodiscard]] bool isClosed() const noexcept { return closed_.load(std::memory_order_acquire); }
    [[nodiscard]] size_t allocated() const noexcept { return allocated_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint32_t numBlocks() const noexcept { return num_blocks_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint32_t maxBlocks() const noexcept { return max_blocks_; }
    [[nodiscard]] size_t blockSize() const noexcept { return config_.block_size; }
    [[nodiscard]] size_t capacityLimit() const noexcept { return config_.capacity_limit; }
    [[nodiscard]] bool isLiveBlock(uint32_t block_id) const;

    NativeMemoryAllocator(const NativeMemoryAllocator&) = delete;
    NativeMemoryAllocator& operator=(const NativeMemoryAllocator&) = delete;

private:
    enum class InstallResult { kInstalled, kRaced, kCapacityExceeded, kSystemRefused, kClosed };

    InstallResult installBlock_(Block* expected);
    [[nodiscard]] uint32_t acquireBlockId_();

private:
    const AllocatorConfig config_;
    std::unique_ptr<BlockPool> owned_pool_;
    BlockPool* pool_;
    const uint32_t max_blocks_;

    // 下标即 Block ID，0 号保留。Block 对象按 ID 常驻直到析构
    std::unique_ptr<std::unique_ptr<Block>[]> blocks_;
    alignas(kCacheLineSize) std::atomic<Block*> current_block_{nullptr};

    // 以下成员受 install_lock_ 保护
    mutable SpinLock install_lock_;
    std::vector<uint32_t> free_ids_;
    uint32_t next_id_ = kInvalidBlockId + 1;

    std::atomic<size_t> allocated_{0};
    std::atomic<uint32_t> num_blocks_{0};
    std::atomic<bool> closed_{false};
};
