#pragma once

#include "OffHeap/BlockAllocator/BlockFreelist.hpp"
#include "OffHeap/BlockAllocator/SystemBlockAllocator.hpp"
#include "OffHeap/common/GlobalConfig.hpp"

#include <cstddef>

// Block 内存池：优先复用归还的 Block，缓存超过水位线时直接还给操作系统。
// 一个 BlockPool 只管理一种大小的 Block。
class BlockPool {
public:
    // 进程级共享池，管理 kDefaultBlockSize 大小的 Block
    static BlockPool& GetInstance();

    explicit BlockPool(size_t block_size, size_t max_pooled_blocks = kMaxPooledBlocks);
    ~BlockPool();

    // 返回 nullptr 表示操作系统拒绝分配
    [[nodiscard]] void* fetchBlock();
    void returnBlock(void* ptr);

    [[nodiscard]] size_t getFreeBlockCount() const;
    [[nodiscard]] size_t blockSize() const noexcept { return block_size_; }
    [[nodiscard]] size_t maxPooledBlocks() const noexcept { return max_pooled_blocks_; }

    // 严禁拷贝/移动
    BlockPool(const BlockPool&) = delete;
    BlockPool& operator=(const BlockPool&) = delete;
    BlockPool(BlockPool&&) = delete;
    BlockPool& operator=(BlockPool&&) = delete;

private:
    const size_t block_size_;
    const size_t max_pooled_blocks_;

    BlockFreelist free_list_;
};
