#pragma once

#include <cstddef>

// 直接向操作系统映射/解除映射 Block 内存 (匿名、私有、不预留 swap)
class SystemBlockAllocator {
public:
    // 返回按 AlignmentFor(size) 对齐的地址，失败返回 nullptr
    [[nodiscard]] static void* Map(size_t size);

    // 失败只记录日志：此时地址空间状态已无法恢复
    static void Unmap(void* ptr, size_t size) noexcept;

    // Block 大小是大页整数倍时按大页对齐 (并建议内核使用透明大页)，否则按页对齐
    [[nodiscard]] static size_t AlignmentFor(size_t size) noexcept;

    SystemBlockAllocator() = delete;
};
