#pragma once

#include "OffHeap/common/ByteOrder.hpp"
#include "OffHeap/common/GlobalConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>

struct RegionHeader {
    uint32_t user_length = 0;
    uint32_t version = 0;
};

// 区域头部编码：
//   header_size >= kEncodedHeaderSize 时 [0,4) userLength, [4,8) version，其余补零；
//   更小的非零头部整体补零；header_size == 0 时没有头部。
class HeaderCodec {
public:
    [[nodiscard]] static constexpr bool isEncoded(uint32_t header_size) noexcept {
        return header_size >= kEncodedHeaderSize;
    }

    static void stamp(std::byte* region, uint32_t header_size, uint32_t user_length, ByteOrder order) noexcept {
        if (header_size == 0) {
            return;
        }

        std::memset(region, 0, header_size);
        if (isEncoded(header_size)) {
            storeAs<uint32_t>(region, user_length, order);
            storeAs<uint32_t>(region + sizeof(uint32_t), kInitialHeaderVersion, order);
        }
    }

    // 未编码的头部只能给出 version 0
    [[nodiscard]] static RegionHeader decode(const std::byte* region, uint32_t header_size,
                                             uint32_t fallback_length, ByteOrder order) noexcept {
        if (!isEncoded(header_size)) {
            return RegionHeader{fallback_length, 0};
        }
        return RegionHeader{
            loadAs<uint32_t>(region, order),
            loadAs<uint32_t>(region + sizeof(uint32_t), order),
        };
    }
};
