#pragma once

#include "OffHeap/common/GlobalConfig.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

// 一段连续的堆外内存，分配与回收的粗粒度单位。
// Block 对象本身常驻 (按 ID 复用)，回收时只交还它背后的内存。
class Block {
public:
    static constexpr uint32_t kNoSpace = UINT32_MAX;
    static constexpr uint32_t kAllocAlignment = 8;

    Block(uint32_t id, uint32_t capacity) noexcept;

    // 绑定/解绑背后的内存 (由 NativeMemoryAllocator 在锁内调用)
    void attach(std::byte* base) noexcept;
    [[nodiscard]] std::byte* detach() noexcept;

    // bump 分配：返回块内偏移，空间不足返回 kNoSpace
    [[nodiscard]] uint32_t allocate(uint32_t size) noexcept;

    // 封存：之后所有 allocate 都会失败
    void seal() noexcept;

    [[nodiscard]] uint32_t id() const noexcept { return id_; }
    [[nodiscard]] uint32_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::byte* base() const noexcept { return base_; }
    [[nodiscard]] bool isLive() const noexcept { return base_ != nullptr; }

    // 已分出的字节数 (按 kAllocAlignment 向上取整后累计)
    [[nodiscard]] uint64_t allocatedBytes() const noexcept;
    [[nodiscard]] uint64_t remaining() const noexcept;

    [[nodiscard]] static constexpr uint64_t AlignedSize(uint32_t size) noexcept {
        return (static_cast<uint64_t>(size) + kAllocAlignment - 1) & ~static_cast<uint64_t>(kAllocAlignment - 1);
    }

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

private:
    const uint32_t id_;
    const uint32_t capacity_;
    std::byte* base_ = nullptr;

    alignas(kCacheLineSize) std::atomic<uint64_t> bump_offset_{0};
    std::atomic<uint64_t> handed_out_{0};
};
