#pragma once

#include <cstdint>

class EBRManager;

// 回收凭证：只有 EBRManager 能构造。
// 持有它说明对应的 Block 已经过了宽限期，没有读者还能看到它。
class ReclaimToken {
public:
    [[nodiscard]] uint64_t epoch() const noexcept { return epoch_; }

    ReclaimToken(const ReclaimToken&) = delete;
    ReclaimToken& operator=(const ReclaimToken&) = delete;

private:
    friend class EBRManager;
    explicit ReclaimToken(uint64_t epoch) noexcept : epoch_(epoch) {}

    const uint64_t epoch_;
};

// 延迟回收回调：ctx 通常是 NativeMemoryAllocator
using ReclaimFn = void (*)(void* ctx, uint32_t block_id, const ReclaimToken& token);
