#pragma once

#include "OffHeap/common/ByteOrder.hpp"
#include "OffHeap/common/GlobalConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>

// 运行期可调参数，缺省值来自 GlobalConfig.hpp
struct AllocatorConfig {
    size_t block_size = kDefaultBlockSize;
    size_t capacity_limit = kDefaultCapacityLimit;
    uint32_t header_size = 0;
    ByteOrder byte_order = nativeOrder();

    void validate() const {
        if (block_size == 0 || block_size % kPageSize != 0) {
            throw std::invalid_argument("block_size must be a positive multiple of the page size");
        }
        if (block_size > UINT32_MAX) {
            throw std::invalid_argument("block_size must fit in a 32-bit position");
        }
        if (capacity_limit < block_size) {
            throw std::invalid_argument("capacity_limit must hold at least one block");
        }
        if (header_size >= block_size) {
            throw std::invalid_argument("header_size must be smaller than block_size");
        }
    }

    // 上限内最多可以同时存活的 Block 数
    [[nodiscard]] uint32_t maxBlocks() const noexcept {
        size_t n = capacity_limit / block_size;
        return n >= kMaxBlockCount ? kMaxBlockCount - 1 : static_cast<uint32_t>(n);
    }
};
