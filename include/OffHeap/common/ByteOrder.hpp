#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

// 区域的字节序是区域自身的属性，读写多字节值时必须遵守
enum class ByteOrder : uint8_t {
    LittleEndian,
    BigEndian,
};

[[nodiscard]] constexpr ByteOrder nativeOrder() noexcept {
    return std::endian::native == std::endian::little ? ByteOrder::LittleEndian
                                                      : ByteOrder::BigEndian;
}

[[nodiscard]] constexpr const char* toString(ByteOrder order) noexcept {
    return order == ByteOrder::LittleEndian ? "LITTLE_ENDIAN" : "BIG_ENDIAN";
}

namespace detail {

template<size_t N> struct UIntOf;
template<> struct UIntOf<1> { using type = uint8_t; };
template<> struct UIntOf<2> { using type = uint16_t; };
template<> struct UIntOf<4> { using type = uint32_t; };
template<> struct UIntOf<8> { using type = uint64_t; };

inline uint8_t byteSwap(uint8_t v) noexcept { return v; }
inline uint16_t byteSwap(uint16_t v) noexcept { return __builtin_bswap16(v); }
inline uint32_t byteSwap(uint32_t v) noexcept { return __builtin_bswap32(v); }
inline uint64_t byteSwap(uint64_t v) noexcept { return __builtin_bswap64(v); }

}

// 从任意 (可能未对齐的) 地址按给定字节序读取 T
template<typename T>
[[nodiscard]] inline T loadAs(const std::byte* src, ByteOrder order) noexcept {
    static_assert(std::is_trivially_copyable_v<T>);
    using Bits = typename detail::UIntOf<sizeof(T)>::type;

    Bits bits;
    std::memcpy(&bits, src, sizeof(T));
    if (order != nativeOrder()) {
        bits = detail::byteSwap(bits);
    }

    T value;
    std::memcpy(&value, &bits, sizeof(T));
    return value;
}

template<typename T>
inline void storeAs(std::byte* dst, T value, ByteOrder order) noexcept {
    static_assert(std::is_trivially_copyable_v<T>);
    using Bits = typename detail::UIntOf<sizeof(T)>::type;

    Bits bits;
    std::memcpy(&bits, &value, sizeof(T));
    if (order != nativeOrder()) {
        bits = detail::byteSwap(bits);
    }
    std::memcpy(dst, &bits, sizeof(T));
}
