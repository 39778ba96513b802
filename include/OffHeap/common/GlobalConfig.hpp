
#pragma once

#include <cstddef>
#include <cstdint>

// =========================================================
// 全局配置参数 (Global Configuration)
// =========================================================

// 系统页大小，Block 大小必须是它的整数倍
constexpr size_t kPageSize = 4 * 1024;

// 大页大小：Block 大小是它的整数倍时按 2MB 对齐 (Huge Page 兼容)
constexpr size_t kHugePageSize = 2 * 1024 * 1024;

// 默认 Block 大小：8MB
// 这是分配与回收的粗粒度单位，用来摊薄每个 Block 的簿记开销
constexpr size_t kDefaultBlockSize = 4 * kHugePageSize;

// 默认堆外内存上限：16GB
constexpr size_t kDefaultCapacityLimit = size_t{16} * 1024 * 1024 * 1024;

// BlockPool 最大缓存 Block 数量 (水位线)
constexpr size_t kMaxPooledBlocks = 16;

// Block ID 上限 (ID 0 保留为哨兵)
constexpr uint32_t kMaxBlockCount = 1u << 20;

// 无效 Block ID 哨兵：永远不会指向存活的 Block
constexpr uint32_t kInvalidBlockId = 0;

// 编码头部 (userLength + version) 需要的最小字节数
constexpr uint32_t kEncodedHeaderSize = 8;

constexpr uint32_t kInitialHeaderVersion = 1;

// 缓存行大小
inline constexpr size_t kCacheLineSize = 64;
