#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <map>
#include <thread>
#include <vector>

#include "OffHeap/BlockAllocator/NativeMemoryAllocator.hpp"
#include "OffHeap/common/OffHeapError.hpp"
#include "EBRManager/EBRManager.hpp"

class NativeMemoryAllocatorTest : public ::testing::Test {
protected:
    static constexpr size_t kBlockSize = 64 * 1024;

    AllocatorConfig MakeConfig(size_t blocks) {
        AllocatorConfig config;
        config.block_size = kBlockSize;
        config.capacity_limit = blocks * kBlockSize;
        return config;
    }

    // 经由 EBR 拿到回收凭证
    static void ReclaimThunk(void* ctx, uint32_t block_id, const ReclaimToken& token) {
        static_cast<NativeMemoryAllocator*>(ctx)->reclaim(block_id, token);
    }

    void RetireAndDrain(NativeMemoryAllocator& allocator, uint32_t block_id) {
        allocator.sealBlock(block_id);
        ebr_.retireBlock(&allocator, block_id, &ReclaimThunk);
        ebr_.drain();
    }

    BlockPool pool_{kBlockSize, 4};
    EBRManager ebr_;
};

// 1. 同一个 Block 内连续切分
TEST_F(NativeMemoryAllocatorTest, AllocatesFromCurrentBlock) {
    NativeMemoryAllocator allocator(MakeConfig(4), pool_);

    Reference a = allocator.allocate(100);
    Reference b = allocator.allocate(20);

    EXPECT_TRUE(a.isValid());
    EXPECT_EQ(a.block_id, b.block_id);
    EXPECT_EQ(a.position, 0u);
    EXPECT_EQ(a.length, 100u);
    EXPECT_EQ(b.position, 104u);
    EXPECT_EQ(b.length, 20u);

    EXPECT_EQ(allocator.numBlocks(), 1u);
    EXPECT_EQ(allocator.allocated(), 104u + 24u);
    EXPECT_NE(allocator.blockMemory(a.block_id), nullptr);
}

// 2. 非法大小
TEST_F(NativeMemoryAllocatorTest, RejectsImpossibleSizes) {
    NativeMemoryAllocator allocator(MakeConfig(2), pool_);

    EXPECT_THROW((void)allocator.allocate(0), std::invalid_argument);
    EXPECT_THROW((void)allocator.allocate(kBlockSize + 1), std::invalid_argument);

    Reference whole = allocator.allocate(kBlockSize);
    EXPECT_EQ(whole.position, 0u);
    EXPECT_EQ(whole.length, kBlockSize);
}

// 3. 略小于 Block 的分配跨越多个 Block，彼此可独立解析且不重叠
TEST_F(NativeMemoryAllocatorTest, ExhaustionSpansMultipleBlocks) {
    NativeMemoryAllocator allocator(MakeConfig(8), pool_);
    const uint32_t size = kBlockSize / 2 - 64;

    std::vector<Reference> refs;
    for (int i = 0; i < 7; ++i) {
        refs.push_back(allocator.allocate(size));
    }
    EXPECT_GT(allocator.numBlocks(), 1u);

    // 每个区域写入自己的编号
    for (size_t i = 0; i < refs.size(); ++i) {
        std::byte* region = allocator.blockMemory(refs[i].block_id) + refs[i].position;
        std::memset(region, static_cast<int>(i + 1), refs[i].length);
    }

    for (size_t i = 0; i < refs.size(); ++i) {
        const std::byte* region = allocator.blockMemory(refs[i].block_id) + refs[i].position;
        EXPECT_EQ(static_cast<int>(region[0]), static_cast<int>(i + 1));
        EXPECT_EQ(static_cast<int>(region[refs[i].length - 1]), static_cast<int>(i + 1));
    }

    std::map<uint32_t, std::vector<std::pair<uint32_t, uint32_t>>> per_block;
    for (const Reference& r : refs) {
        EXPECT_LE(r.end(), kBlockSize);
        per_block[r.block_id].push_back({r.position, r.position + r.length});
    }
    for (auto& [id, ranges] : per_block) {
        std::sort(ranges.begin(), ranges.end());
        for (size_t i = 1; i < ranges.size(); ++i) {
            EXPECT_GE(ranges[i].first, ranges[i - 1].second) << "Overlap inside block " << id;
        }
    }
}

// 4. 达到上限抛出 OutOfMemoryError，已有区域不受影响
TEST_F(NativeMemoryAllocatorTest, CapacityLimitThrowsOutOfMemory) {
    NativeMemoryAllocator allocator(MakeConfig(2), pool_);

    Reference first = allocator.allocate(kBlockSize);
    Reference second = allocator.allocate(kBlockSize);
    EXPECT_NE(first.block_id, second.block_id);

    EXPECT_THROW((void)allocator.allocate(16), OutOfMemoryError);
    EXPECT_EQ(allocator.numBlocks(), 2u);
    EXPECT_NE(allocator.blockMemory(first.block_id), nullptr);
}

// 5. 回收后 Block 内存回到池中，ID 被复用，容量重新可用
TEST_F(NativeMemoryAllocatorTest, ReclaimReturnsMemoryAndRecyclesId) {
    NativeMemoryAllocator allocator(MakeConfig(1), pool_);

    Reference r = allocator.allocate(128);
    EXPECT_THROW((void)allocator.allocate(kBlockSize), OutOfMemoryError);

    const size_t pooled_before = pool_.getFreeBlockCount();
    RetireAndDrain(allocator, r.block_id);

    EXPECT_FALSE(allocator.isLiveBlock(r.block_id));
    EXPECT_EQ(allocator.numBlocks(), 0u);
    EXPECT_EQ(allocator.allocated(), 0u);
    EXPECT_EQ(pool_.getFreeBlockCount(), pooled_before + 1);

    Reference again = allocator.allocate(kBlockSize);
    EXPECT_EQ(again.block_id, r.block_id);
    EXPECT_EQ(again.position, 0u);
    EXPECT_TRUE(allocator.isLiveBlock(again.block_id));
}

// 6. 封存当前 Block 后，新的分配落到新 Block
TEST_F(NativeMemoryAllocatorTest, SealedBlockIsNotReused) {
    NativeMemoryAllocator allocator(MakeConfig(4), pool_);

    Reference a = allocator.allocate(64);
    allocator.sealBlock(a.block_id);

    Reference b = allocator.allocate(64);
    EXPECT_NE(a.block_id, b.block_id);
    EXPECT_TRUE(allocator.isLiveBlock(a.block_id));
}

// 7. close 幂等，并把所有 Block 还给池
TEST_F(NativeMemoryAllocatorTest, CloseReturnsAllBlocks) {
    NativeMemoryAllocator allocator(MakeConfig(4), pool_);

    (void)allocator.allocate(kBlockSize);
    (void)allocator.allocate(kBlockSize);
    (void)allocator.allocate(kBlockSize);
    EXPECT_EQ(allocator.numBlocks(), 3u);

    allocator.close();
    EXPECT_TRUE(allocator.isClosed());
    EXPECT_EQ(allocator.numBlocks(), 0u);
    EXPECT_EQ(pool_.getFreeBlockCount(), 3u);

    allocator.close();
    EXPECT_EQ(pool_.getFreeBlockCount(), 3u);
}

// 7b. 关闭之后分配立即失败
TEST_F(NativeMemoryAllocatorTest, AllocateAfterCloseThrows) {
    NativeMemoryAllocator allocator(MakeConfig(4), pool_);
    (void)allocator.allocate(64);

    allocator.close();
    EXPECT_THROW((void)allocator.allocate(64), MemoryManagerClosedError);
    EXPECT_THROW((void)allocator.allocate(kBlockSize), MemoryManagerClosedError);
    EXPECT_EQ(allocator.numBlocks(), 0u);
}

// 7c. 与 close() 并发的分配不会在关闭后装上新 Block
TEST_F(NativeMemoryAllocatorTest, ConcurrentCloseLeavesNoLiveBlocks) {
    const int kTrials = 200;
    const int kThreads = 4;

    for (int trial = 0; trial < kTrials; ++trial) {
        NativeMemoryAllocator allocator(MakeConfig(64), pool_);
        std::atomic<bool> start_flag{false};
        std::atomic<int> closed_errors{0};
        std::vector<std::thread> threads;

        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&]() {
                while (!start_flag.load(std::memory_order_acquire));
                // 每次请求整块，迫使每次分配都去装新的 Block
                for (int i = 0; i < 8; ++i) {
                    try {
                        (void)allocator.allocate(kBlockSize);
                    } catch (const MemoryManagerClosedError&) {
                        closed_errors.fetch_add(1);
                        return;
                    } catch (const OutOfMemoryError&) {
                        return;
                    }
                }
            });
        }

        start_flag.store(true, std::memory_order_release);
        allocator.close();
        for (auto& th : threads) th.join();

        ASSERT_EQ(allocator.numBlocks(), 0u) << "trial " << trial;
        ASSERT_THROW((void)allocator.allocate(64), MemoryManagerClosedError);
    }
}

// 8. 配置校验
TEST_F(NativeMemoryAllocatorTest, InvalidConfigurationIsRejected) {
    AllocatorConfig bad = MakeConfig(4);
    bad.block_size = 1000;
    EXPECT_THROW(NativeMemoryAllocator a(bad), std::invalid_argument);

    AllocatorConfig tiny = MakeConfig(4);
    tiny.capacity_limit = kBlockSize / 2;
    EXPECT_THROW(NativeMemoryAllocator a(tiny), std::invalid_argument);

    AllocatorConfig mismatch = MakeConfig(4);
    mismatch.block_size = 2 * kBlockSize;
    EXPECT_THROW(NativeMemoryAllocator a(mismatch, pool_), std::invalid_argument);
}

// 9. 多线程并发分配：所有区域互不重叠，写入的标记互不干扰
TEST_F(NativeMemoryAllocatorTest, ConcurrentAllocationStress) {
    NativeMemoryAllocator allocator(MakeConfig(64), pool_);
    const int kThreads = 8;
    const int kAllocsPerThread = 2000;
    const uint32_t kSize = 40;

    std::vector<std::vector<Reference>> refs(kThreads);
    std::atomic<bool> start_flag{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            while (!start_flag.load(std::memory_order_relaxed));
            for (int i = 0; i < kAllocsPerThread; ++i) {
                Reference r = allocator.allocate(kSize);
                std::byte* region = allocator.blockMemory(r.block_id) + r.position;
                int64_t tag = (static_cast<int64_t>(t) << 32) | i;
                for (uint32_t off = 0; off + sizeof(tag) <= kSize; off += sizeof(tag)) {
                    std::memcpy(region + off, &tag, sizeof(tag));
                }
                refs[t].push_back(r);
            }
        });
    }

    start_flag.store(true);
    for (auto& th : threads) th.join();

    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kAllocsPerThread; ++i) {
            const Reference& r = refs[t][i];
            const std::byte* region = allocator.blockMemory(r.block_id) + r.position;
            int64_t expected = (static_cast<int64_t>(t) << 32) | i;
            for (uint32_t off = 0; off + sizeof(expected) <= kSize; off += sizeof(expected)) {
                int64_t actual;
                std::memcpy(&actual, region + off, sizeof(actual));
                ASSERT_EQ(actual, expected) << "Region of thread " << t << " #" << i << " was overwritten";
            }
        }
    }

    EXPECT_EQ(allocator.allocated(), static_cast<size_t>(kThreads) * kAllocsPerThread * Block::AlignedSize(kSize));
}
