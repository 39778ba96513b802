#pragma once

#include "OffHeap/common/GlobalConfig.hpp"

#include <cstdint>

// 逻辑地址三元组：(blockId, position, length)
// 它不是指针，必须经过 MemoryManager 解析才有意义。
// length 包含头部，用户可见长度为 length - headerSize。
struct Reference {
    uint32_t block_id = kInvalidBlockId;
    uint32_t position = 0;
    uint32_t length = 0;

    constexpr Reference() noexcept = default;
    constexpr Reference(uint32_t id, uint32_t pos, uint32_t len) noexcept
        : block_id(id), position(pos), length(len) {}

    [[nodiscard]] static constexpr Reference Invalid() noexcept { return Reference{}; }

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return block_id != kInvalidBlockId;
    }

    [[nodiscard]] constexpr uint32_t userLength(uint32_t header_size) const noexcept {
        return length - header_size;
    }

    // 区域在 Block 内的结束偏移 (开区间)
    [[nodiscard]] constexpr uint64_t end() const noexcept {
        return static_cast<uint64_t>(position) + length;
    }

    friend constexpr bool operator==(const Reference& a, const Reference& b) noexcept {
        return a.block_id == b.block_id && a.position == b.position && a.length == b.length;
    }
    friend constexpr bool operator!=(const Reference& a, const Reference& b) noexcept {
        return !(a == b);
    }
};
