#pragma once

#include "OffHeap/Buffer/ReadOnlySlice.hpp"

#include <cstdint>

// 直接访问能力：给序列化等需要与底层内存交互的调用方使用。
// 调用方承担义务：不越过 length() 读写，不在下一次 rebind 或 Block 回收之后保留地址。
class UnsafeDirectBuffer {
public:
    virtual ~UnsafeDirectBuffer() = default;

    // 恰好覆盖用户数据的只读句柄，偏移相对该句柄为 0
    [[nodiscard]] virtual ReadOnlySlice rawView() const = 0;
    [[nodiscard]] virtual uint32_t offset() const = 0;
    [[nodiscard]] virtual uint32_t length() const = 0;

    // 第一个用户字节的绝对地址
    [[nodiscard]] virtual uintptr_t nativeAddress() const = 0;
};
