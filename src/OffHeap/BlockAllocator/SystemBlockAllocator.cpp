#include "OffHeap/BlockAllocator/SystemBlockAllocator.hpp"
#include "OffHeap/common/GlobalConfig.hpp"

#include <sys/mman.h>

#include <cassert>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>

namespace {

void logErrno(const char* tag, const char* what, size_t size) {
    const int err = errno;
    std::cerr << tag << " " << what << " failed for " << size << " bytes: "
              << std::strerror(err) << " (errno=" << err << ")." << std::endl;
}

}

size_t SystemBlockAllocator::AlignmentFor(size_t size) noexcept {
    return (size % kHugePageSize == 0) ? kHugePageSize : kPageSize;
}

void* SystemBlockAllocator::Map(size_t size) {
    assert(size > 0 && size % kPageSize == 0 && "block size must be a positive multiple of kPageSize");

    const size_t alignment = AlignmentFor(size);

    // 页对齐的请求 mmap 本身就能满足
    const size_t mapped = (alignment == kPageSize) ? size : size + alignment;
    void* raw = mmap(nullptr, mapped, PROT_READ | PROT_WRITE,
                     MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    if (raw == MAP_FAILED) {
        logErrno("[SystemBlockAllocator::Map]", "mmap", mapped);
        return nullptr;
    }
    if (mapped == size) {
        return raw;
    }

    // 多映射一个对齐单位，再把首尾多出来的部分还回去
    const uintptr_t begin = reinterpret_cast<uintptr_t>(raw);
    const uintptr_t aligned = (begin + alignment - 1) & ~(alignment - 1);
    const size_t head = aligned - begin;
    const size_t tail = mapped - head - size;

    if (head > 0) {
        munmap(raw, head);
    }
    if (tail > 0) {
        munmap(reinterpret_cast<void*>(aligned + size), tail);
    }

#ifdef MADV_HUGEPAGE
    // 只是建议，内核不支持时忽略
    (void)madvise(reinterpret_cast<void*>(aligned), size, MADV_HUGEPAGE);
#endif

    return reinterpret_cast<void*>(aligned);
}

void SystemBlockAllocator::Unmap(void* ptr, size_t size) noexcept {
    assert(ptr != nullptr && size > 0);

    if (munmap(ptr, size) != 0) {
        logErrno("[FATAL] SystemBlockAllocator::Unmap:", "munmap", size);
    }
}
