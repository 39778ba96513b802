#pragma once

#include <stdexcept>
#include <string>

// 资源耗尽：allocate 超过堆外内存上限，或者操作系统拒绝映射新的 Block。
// 调用方可以恢复 (例如在 map 层触发淘汰后重试)。
struct OutOfMemoryError : public std::runtime_error {
    explicit OutOfMemoryError(const std::string& what) : std::runtime_error(what) {}
};

// MemoryManager 关闭之后的任何访问都属于编程错误，必须立即、明确地失败
struct MemoryManagerClosedError : public std::logic_error {
    MemoryManagerClosedError() : std::logic_error("memory manager is closed") {}
};
