#pragma once

#include "OffHeap/MemoryManager/MemoryManager.hpp"
#include "OffHeap/common/ByteOrder.hpp"
#include "OffHeap/common/Reference.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>

// 写者在发布 Reference 之前填充数据用。
// 下标与字节序规则和 DetachedBuffer 完全一致；发布之后不应再写。
// 不缓存地址：每次写入都经过 MemoryManager，关闭之后抛出 MemoryManagerClosedError。
class WriteBuffer {
public:
    WriteBuffer(MemoryManager& manager, const Reference& ref);

    [[nodiscard]] uint32_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] ByteOrder order() const noexcept { return order_; }
    [[nodiscard]] const Reference& reference() const noexcept { return ref_; }

    // 批量拷贝用，长度为 capacity()。地址不能跨过 close() 保留
    [[nodiscard]] std::byte* writableData() const {
        return manager_->writableRegion(ref_) + header_size_;
    }

    WriteBuffer& putByte(uint32_t index, int8_t value) { return put_(index, value); }
    WriteBuffer& putChar(uint32_t index, char16_t value) { return put_(index, value); }
    WriteBuffer& putShort(uint32_t index, int16_t value) { return put_(index, value); }
    WriteBuffer& putInt(uint32_t index, int32_t value) { return put_(index, value); }
    WriteBuffer& putLong(uint32_t index, int64_t value) { return put_(index, value); }
    WriteBuffer& putFloat(uint32_t index, float value) { return put_(index, value); }
    WriteBuffer& putDouble(uint32_t index, double value) { return put_(index, value); }

private:
    template<typename T>
    WriteBuffer& put_(uint32_t index, T value) {
        assert(static_cast<uint64_t>(index) + sizeof(T) <= capacity_);
        manager_->storeUserData<T>(ref_, index, value);
        return *this;
    }

    MemoryManager* manager_;
    Reference ref_;
    uint32_t header_size_;
    uint32_t capacity_;
    ByteOrder order_;
};
