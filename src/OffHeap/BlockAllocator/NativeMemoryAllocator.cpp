#include "OffHeap/BlockAllocator/NativeMemoryAllocator.hpp"
#include "OffHeap/common/OffHeapError.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

BlockPool& checkedPool(BlockPool& pool, const AllocatorConfig& config) {
    if (pool.blockSize() != config.block_size) {
        throw std::invalid_argument("BlockPool block size does not match allocator block size");
    }
    return pool;
}

const AllocatorConfig& validated(const AllocatorConfig& config) {
    config.validate();
    return config;
}

}

NativeMemoryAllocator::NativeMemoryAllocator(const AllocatorConfig& config)
    : config_(validated(config)),
      owned_pool_(config.block_size == kDefaultBlockSize ? nullptr
                                                         : std::make_unique<BlockPool>(config.block_size)),
      pool_(owned_pool_ ? owned_pool_.get() : &BlockPool::GetInstance()),
      max_blocks_(config.maxBlocks()),
      blocks_(std::make_unique<std::unique_ptr<Block>[]>(max_blocks_ + 1)) {}

NativeMemoryAllocator::NativeMemoryAllocator(const AllocatorConfig& config, BlockPool& pool)
    : config_(validated(config)),
      pool_(&checkedPool(pool, config)),
      max_blocks_(config.maxBlocks()),
      blocks_(std::make_unique<std::unique_ptr<Block>[]>(max_blocks_ + 1)) {}

NativeMemoryAllocator::~NativeMemoryAllocator() {
    close();
}

Reference NativeMemoryAllocator::allocate(uint32_t size) {
    if (isClosed()) [[unlikely]] {
        throw MemoryManagerClosedError();
    }

    if (size == 0 || size > config_.block_size) {
        throw std::invalid_argument("allocation size must be in (0, block_size]");
    }

    while (true) {
        Block* current = current_block_.load(std::memory_order_acquire);
        if (current != nullptr) {
            uint32_t position = current->allocate(size);
            if (position != Block::kNoSpace) {
                // 与 close() 竞争时，切到的区域可能已经随 Block 归还
                if (isClosed()) [[unlikely]] {
                    throw MemoryManagerClosedError();
                }
                allocated_.fetch_add(Block::AlignedSize(size), std::memory_order_relaxed);
                return Reference(current->id(), position, size);
            }
        }

        switch (installBlock_(current)) {
            case InstallResult::kInstalled:
            case InstallResult::kRaced:
                continue;
            case InstallResult::kCapacityExceeded: {
                std::ostringstream msg;
                msg << "off-heap capacity limit " << config_.capacity_limit
                    << " bytes reached (" << numBlocks() << " blocks of " << config_.block_size << ")";
                std::cerr << "[NativeMemoryAllocator::allocate] OOM: " << msg.str() << std::endl;
                throw OutOfMemoryError(msg.str());
            }
            case InstallResult::kSystemRefused:
                std::cerr << "[NativeMemoryAllocator::allocate] OOM: system refused a new block." << std::endl;
                throw OutOfMemoryError("system refused to map a new block");
            case InstallResult::kClosed:
                throw MemoryManagerClosedError();
        }
    }
}

NativeMemoryAllocator::InstallResult NativeMemoryAllocator::installBlock_(Block* expected) {
    if (current_block_.load(std::memory_order_acquire) != expected) {
        return InstallResult::kRaced;
    }

    // 在锁外取内存：BlockPool 可能要走 mmap 系统调用
    void* memory = pool_->fetchBlock();
    if (memory == nullptr) {
        return InstallResult::kSystemRefused;
    }

    {
        SpinLockGuard guard(install_lock_);

        // close() 已经清空了 Block 表，不能再装新的 Block
        if (isClosed()) {
            pool_->returnBlock(memory);
            return InstallResult::kClosed;
        }

        // Double Check: 别的线程已经装上了新的 Block
        if (current_block_.load(std::memory_order_relaxed) != expected) {
            pool_->returnBlock(memory);
            return InstallResult::kRaced;
        }

        uint32_t id = kInvalidBlockId;
        if (num_blocks_.load(std::memory_order_relaxed) < max_blocks_) {
            id = acquireBlockId_();
        }
        if (id != kInvalidBlockId) {
            std::unique_ptr<Block>& slot = blocks_[id];
            if (!slot) {
                slot = std::make_unique<Block>(id, static_cast<uint32_t>(config_.block_size));
            }
            slot->attach(static_cast<std::byte*>(memory));

            num_blocks_.fetch_add(1, std::memory_order_relaxed);
            current_block_.store(slot.get(), std::memory_order_release);
            return InstallResult::kInstalled;
        }
    }

    pool_->returnBlock(memory);
    return InstallResult::kCapacityExceeded;
}

uint32_t NativeMemoryAllocator::acquireBlockId_() {
    if (!free_ids_.empty()) {
        uint32_t id = free_ids_.back();
        free_ids_.pop_back();
        return id;
    }
    if (next_id_ <= max_blocks_) {
        return next_id_++;
    }
    return kInvalidBlockId;
}

void NativeMemoryAllocator::sealBlock(uint32_t block_id) {
    SpinLockGuard guard(install_lock_);

    assert(block_id != kInvalidBlockId && block_id <= max_blocks_);
    Block* block = blocks_[block_id].get();
    if (block == nullptr || !block->isLive()) {
        return;
    }

    Block* expected = block;
    current_block_.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel);
    block->seal();
}

void NativeMemoryAllocator::reclaim(uint32_t block_id, const ReclaimToken& token) noexcept {
    (void)token;
    std::byte* memory = nullptr;

    {
        SpinLockGuard guard(install_lock_);

        // close() 已经归还了全部 Block
        if (isClosed()) {
            return;
        }

        assert(block_id != kInvalidBlockId && block_id <= max_blocks_);
        Block* block = blocks_[block_id].get();
        assert(block != nullptr && block->isLive() && "reclaiming a block that is not live");

        Block* expected = block;
        current_block_.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel);

        allocated_.fetch_sub(block->allocatedBytes(), std::memory_order_relaxed);
        memory = block->detach();
        num_blocks_.fetch_sub(1, std::memory_order_relaxed);
        free_ids_.push_back(block_id);
    }

    pool_->returnBlock(memory);
}

void NativeMemoryAllocator::close() {
    std::vector<std::byte*> to_return;

    {
        SpinLockGuard guard(install_lock_);
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }

        current_block_.store(nullptr, std::memory_order_release);
        for (uint32_t id = kInvalidBlockId + 1; id <= max_blocks_; ++id) {
            std::unique_ptr<Block>& slot = blocks_[id];
            // Block 对象留到析构：关闭前读到 current_block_ 的线程可能还在用它
            if (slot && slot->isLive()) {
                to_return.push_back(slot->detach());
            }
        }
        free_ids_.clear();
        num_blocks_.store(0, std::memory_order_relaxed);
        allocated_.store(0, std::memory_order_relaxed);
    }

    for (std::byte* memory : to_return) {
        pool_->returnBlock(memory);
    }
}

bool NativeMemoryAllocator::isLiveBlock(uint32_t block_id) const {
    if (block_id == kInvalidBlockId || block_id > max_blocks_) {
        return false;
    }
    SpinLockGuard guard(install_lock_);
    const Block* block = blocks_[block_id].get();
    return block != nullptr && block->isLive();
}
