#pragma once

#include "OffHeap/common/ByteOrder.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

// 只读、带边界检查的切片。
// transform() 每次调用都新建一个只覆盖用户数据的切片交给调用方，
// 任何越界访问都会抛出 std::out_of_range，调用方无法读到头部或区域之外的字节。
class ReadOnlySlice {
public:
    ReadOnlySlice(const std::byte* data, size_t size, ByteOrder order) noexcept
        : data_(data), size_(size), order_(order) {}

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] ByteOrder order() const noexcept { return order_; }

    [[nodiscard]] int8_t byteAt(size_t index) const { return get<int8_t>(index); }
    [[nodiscard]] char16_t charAt(size_t index) const { return get<char16_t>(index); }
    [[nodiscard]] int16_t shortAt(size_t index) const { return get<int16_t>(index); }
    [[nodiscard]] int32_t intAt(size_t index) const { return get<int32_t>(index); }
    [[nodiscard]] int64_t longAt(size_t index) const { return get<int64_t>(index); }
    [[nodiscard]] float floatAt(size_t index) const { return get<float>(index); }
    [[nodiscard]] double doubleAt(size_t index) const { return get<double>(index); }

    template<typename T>
    [[nodiscard]] T get(size_t index) const {
        checkRange_(index, sizeof(T));
        return loadAs<T>(data_ + index, order_);
    }

    // 子切片同样受边界约束
    [[nodiscard]] ReadOnlySlice slice(size_t offset, size_t length) const {
        checkRange_(offset, length);
        return ReadOnlySlice(data_ + offset, length, order_);
    }

    void copyTo(void* dst, size_t offset, size_t length) const {
        checkRange_(offset, length);
        std::memcpy(dst, data_ + offset, length);
    }

    [[nodiscard]] std::string toString() const {
        return std::string(reinterpret_cast<const char*>(data_), size_);
    }

private:
    void checkRange_(size_t offset, size_t length) const {
        if (offset > size_ || length > size_ - offset) {
            throw std::out_of_range("ReadOnlySlice: access [" + std::to_string(offset) + ", " +
                                    std::to_string(offset + length) + ") outside slice of size " +
                                    std::to_string(size_));
        }
    }

    const std::byte* data_;
    size_t size_;
    ByteOrder order_;
};
