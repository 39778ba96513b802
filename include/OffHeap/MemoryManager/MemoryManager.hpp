#pragma once

#include "OffHeap/BlockAllocator/NativeMemoryAllocator.hpp"
#include "OffHeap/Buffer/BlockView.hpp"
#include "OffHeap/MemoryManager/HeaderCodec.hpp"
#include "OffHeap/common/AllocatorConfig.hpp"
#include "OffHeap/common/OffHeapError.hpp"
#include "OffHeap/common/Reference.hpp"
#include "EBRManager/EBRManager.hpp"

#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>

class UnboundBuffer;
class WriteBuffer;

// map 使用的门面：分配、解析 Reference、退休 Block、关闭。
//
// 状态机 Open -> Closed，单向、幂等。关闭后每次 resolve / allocate / 读取
// 都会抛出 MemoryManagerClosedError (每次调用一次原子读)。
//
// 本类不负责写者与读者之间的可见性顺序：写者写完数据后由索引结构以 release
// 语义发布 Reference，读者以 acquire 语义读取后再 resolve。
//
// 写者必须在 allocate、写入、发布整个过程中持有 enterRead() (或 EpochGuard)，
// 否则并发的 retireBlock 可能在数据写完之前回收它所在的 Block。
class MemoryManager {
public:
    explicit MemoryManager(const AllocatorConfig& config = AllocatorConfig{});
    MemoryManager(const AllocatorConfig& config, BlockPool& pool);
    ~MemoryManager();

    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    // 分配 user_size 字节的用户数据 (另加 headerSize 字节头部) 并写好头部。
    // 总长度为 0 的区域同样占用一个对齐单位，Reference 总是落在真实的 Block 内
    [[nodiscard]] Reference allocate(uint32_t user_size);

    [[nodiscard]] UnboundBuffer newUnboundBuffer() const;
    [[nodiscard]] WriteBuffer newWriteBuffer(const Reference& ref);

    // 热路径：无堆分配，返回覆盖 [position, position + length) 的视图
    [[nodiscard]] BlockView resolve(const Reference& ref) const {
        checkOpen_();
        assert(ref.isValid() && "resolving an invalid reference");
        const std::byte* base = allocator_.blockMemory(ref.block_id);
        assert(ref.end() <= allocator_.blockSize());
        return BlockView(base + ref.position, ref.length, config_.byte_order);
    }

    // DetachedBuffer 的每次读取都经过这里
    [[nodiscard]] const std::byte* blockBase(uint32_t block_id) const {
        checkOpen_();
        return allocator_.blockMemory(block_id);
    }

    // 只给尚未发布的区域使用 (WriteBuffer)。返回的地址在 close() 之后失效
    [[nodiscard]] std::byte* writableRegion(const Reference& ref);

    // 写入用户数据 (index 相对头部之后)。写入期间 close() 会等待它完成
    template<typename T>
    void storeUserData(const Reference& ref, uint32_t index, T value) {
        WriterPin_ pin(*this);
        assert(static_cast<uint64_t>(index) + sizeof(T) <= ref.userLength(config_.header_size));
        std::byte* region = allocator_.blockMemory(ref.block_id) + ref.position;
        storeAs<T>(region + config_.header_size + index, value, config_.byte_order);
    }

    [[nodiscard]] RegionHeader readHeader(const Reference& ref) const;

    // 封存 Block 并交给 EBR，宽限期过后回收
    void retireBlock(uint32_t block_id);

    // 没有新的 enter/leave 时主动推进 epoch，返回本次回收的 Block 数
    size_t tryReclaim();

    // 读保护：扫描期间持有，保证看到的 Block 不会被回收
    void enterRead() { epochs_.enter(); }
    void leaveRead() { epochs_.leave(); }
    [[nodiscard]] EBRManager& epochs() noexcept { return epochs_; }

    void close();
    [[nodiscard]] bool isClosed() const noexcept { return closed_.load(std::memory_order_acquire); }

    [[nodiscard]] uint32_t headerSize() const noexcept { return config_.header_size; }
    [[nodiscard]] ByteOrder byteOrder() const noexcept { return config_.byte_order; }
    [[nodiscard]] size_t allocated() const noexcept { return allocator_.allocated(); }
    [[nodiscard]] const NativeMemoryAllocator& allocator() const noexcept { return allocator_; }
    [[nodiscard]] const AllocatorConfig& config() const noexcept { return config_; }

private:
    void checkOpen_() const {
        if (closed_.load(std::memory_order_acquire)) [[unlikely]] {
            throw MemoryManagerClosedError();
        }
    }

    // 写者计数：close() 置位后等它归零再归还内存
    class WriterPin_ {
    public:
        explicit WriterPin_(MemoryManager& manager) : manager_(manager) {
            manager_.writers_in_flight_.fetch_add(1, std::memory_order_seq_cst);
            if (manager_.closed_.load(std::memory_order_seq_cst)) [[unlikely]] {
                manager_.writers_in_flight_.fetch_sub(1, std::memory_order_release);
                throw MemoryManagerClosedError();
            }
        }
        ~WriterPin_() { manager_.writers_in_flight_.fetch_sub(1, std::memory_order_release); }

        WriterPin_(const WriterPin_&) = delete;
        WriterPin_& operator=(const WriterPin_&) = delete;

    private:
        MemoryManager& manager_;
    };

    static void reclaimBlock_(void* ctx, uint32_t block_id, const ReclaimToken& token);

private:
    const AllocatorConfig config_;
    std::atomic<bool> closed_{false};
    std::atomic<uint32_t> writers_in_flight_{0};

    NativeMemoryAllocator allocator_;
    // 析构顺序：epochs_ 先于 allocator_，剩余的退休 Block 还能归还
    EBRManager epochs_;
};
