#pragma once

#include "OffHeap/Buffer/ReadOnlySlice.hpp"
#include "OffHeap/Buffer/UnsafeDirectBuffer.hpp"
#include "OffHeap/MemoryManager/MemoryManager.hpp"
#include "OffHeap/common/ByteOrder.hpp"
#include "OffHeap/common/Reference.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

class DetachedBuffer;

// 未绑定状态：没有任何读接口，只能 bind() 出一个 DetachedBuffer。
// 这样“未绑定就读取”在编译期就不可能发生。
class UnboundBuffer {
public:
    explicit UnboundBuffer(const MemoryManager& manager) noexcept
        : manager_(&manager), header_size_(manager.headerSize()) {}

    [[nodiscard]] DetachedBuffer bind(const Reference& ref) const;

    [[nodiscard]] uint32_t headerSize() const noexcept { return header_size_; }

private:
    const MemoryManager* manager_;
    uint32_t header_size_;
};


// 可复用的零拷贝只读视图。
// 一次性用法：绑定一个 Reference，读若干次后丢弃。
// 复用用法：扫描时只保留一个实例，每访问一个条目调用一次 rebind()，
// rebind 之后由上一次绑定得到的 rawView / nativeAddress 全部失效。
//
// 不持有任何锁：调用方 (扫描) 在整个使用期间持有 epoch，保证所指 Block 不被回收。
class DetachedBuffer final : public UnsafeDirectBuffer {
public:
    DetachedBuffer(const MemoryManager& manager, const Reference& ref) noexcept
        : manager_(&manager),
          ref_(ref),
          header_size_(manager.headerSize()),
          order_(manager.byteOrder()) {
        assert(ref_.isValid() && ref_.length >= header_size_);
    }

    void rebind(const Reference& ref) noexcept {
        assert(ref.isValid() && ref.length >= header_size_);
        ref_ = ref;
    }

    void setPosition(uint32_t position) noexcept { ref_.position = position; }
    void setLength(uint32_t length) noexcept {
        assert(length >= header_size_);
        ref_.length = length;
    }

    [[nodiscard]] const Reference& reference() const noexcept { return ref_; }
    [[nodiscard]] uint32_t headerSize() const noexcept { return header_size_; }
    [[nodiscard]] ByteOrder order() const noexcept { return order_; }

    // 用户可见长度，不含头部
    [[nodiscard]] uint32_t capacity() const noexcept { return ref_.length - header_size_; }

    [[nodiscard]] int8_t byteAt(uint32_t index) const { return get_<int8_t>(index); }
    [[nodiscard]] char16_t charAt(uint32_t index) const { return get_<char16_t>(index); }
    [[nodiscard]] int16_t shortAt(uint32_t index) const { return get_<int16_t>(index); }
    [[nodiscard]] int32_t intAt(uint32_t index) const { return get_<int32_t>(index); }
    [[nodiscard]] int64_t longAt(uint32_t index) const { return get_<int64_t>(index); }
    [[nodiscard]] float floatAt(uint32_t index) const { return get_<float>(index); }
    [[nodiscard]] double doubleAt(uint32_t index) const { return get_<double>(index); }

    // 每次调用都新建一个只覆盖用户数据的只读切片交给 func
    template<typename F>
    auto transform(F&& func) const -> std::invoke_result_t<F, const ReadOnlySlice&> {
        const ReadOnlySlice slice(userData_(), capacity(), order_);
        return std::forward<F>(func)(slice);
    }

    /*-------------- UnsafeDirectBuffer --------------*/

    [[nodiscard]] ReadOnlySlice rawView() const override;
    [[nodiscard]] uint32_t offset() const override { return 0; }
    [[nodiscard]] uint32_t length() const override { return capacity(); }
    [[nodiscard]] uintptr_t nativeAddress() const override;

private:
    // 关闭检查在 MemoryManager::blockBase 里完成
    [[nodiscard]] const std::byte* userData_() const {
        return manager_->blockBase(ref_.block_id) + ref_.position + header_size_;
    }

    template<typename T>
    [[nodiscard]] T get_(uint32_t index) const {
        assert(static_cast<uint64_t>(index) + sizeof(T) <= capacity());
        return loadAs<T>(userData_() + index, order_);
    }

    const MemoryManager* manager_;
    Reference ref_;
    uint32_t header_size_;
    ByteOrder order_;
};
