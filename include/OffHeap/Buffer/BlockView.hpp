#pragma once

#include "OffHeap/common/ByteOrder.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>

// resolve() 返回的轻量句柄：不拥有内存，不做分配，也不做边界检查 (只在 Debug 下断言)。
// 它的有效期不超过所指 Block 被回收的时刻。
class BlockView {
public:
    constexpr BlockView(const std::byte* data, uint32_t length, ByteOrder order) noexcept
        : data_(data), length_(length), order_(order) {}

    [[nodiscard]] const std::byte* data() const noexcept { return data_; }
    [[nodiscard]] uint32_t size() const noexcept { return length_; }
    [[nodiscard]] ByteOrder order() const noexcept { return order_; }

    template<typename T>
    [[nodiscard]] T read(uint32_t offset) const noexcept {
        assert(static_cast<uint64_t>(offset) + sizeof(T) <= length_);
        return loadAs<T>(data_ + offset, order_);
    }

private:
    const std::byte* data_;
    uint32_t length_;
    ByteOrder order_;
};
