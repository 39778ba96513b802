#include "EBRManager/EBRManager.hpp"

#include <cassert>
#include <new>

EBRManager::EBRManager() : global_epoch_(0) {}

EBRManager::~EBRManager() {
    drain();
}

ThreadSlot* EBRManager::getLocalSlot_() {
    ThreadSlot* slot = slot_manager_.getLocalSlot();
    if (slot == nullptr) {
        throw std::bad_alloc();
    }
    return slot;
}

void EBRManager::enter() {
    ThreadSlot* slot = getLocalSlot_();

    if (slot->nesting++ > 0) {
        return;
    }

    // 先公布自己观察到的 epoch，再置 active，最后的全屏障保证
    // 之后对堆外内存的读取不会被重排到公布之前
    slot->local_epoch.store(global_epoch_.load(std::memory_order_acquire), std::memory_order_relaxed);
    slot->active.store(true, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

void EBRManager::leave() {
    ThreadSlot* slot = getLocalSlot_();
    assert(slot->nesting > 0 && "leave() without matching enter()");

    if (--slot->nesting > 0) {
        return;
    }

    slot->active.store(false, std::memory_order_release);

    if (pending_count_.load(std::memory_order_relaxed) > 0) {
        tryAdvanceEpoch_();
    }
}

bool EBRManager::isPinned() {
    return getLocalSlot_()->nesting > 0;
}

void EBRManager::retireBlock(void* ctx, uint32_t block_id, ReclaimFn reclaim) {
    assert(reclaim != nullptr);

    RetiredNode* node = new RetiredNode();
    node->ctx = ctx;
    node->block_id = block_id;
    node->reclaim = reclaim;

    // 在临界区内读取 epoch，保证标记值不小于任何仍可能看到该 Block 的读者
    enter();
    node->epoch = global_epoch_.load(std::memory_order_acquire);
    pending_count_.fetch_add(1, std::memory_order_relaxed);
    garbage_lists_[node->epoch % kNumEpochLists].push(node);
    leave();
}

size_t EBRManager::tryReclaim() {
    size_t reclaimed = 0;

    // 退休时刻的 epoch 需要再前进两步，第一步通常已由 retireBlock 内的 leave() 完成
    for (size_t i = 0; i + 1 < kNumEpochLists; ++i) {
        if (pending_count_.load(std::memory_order_acquire) == 0) {
            break;
        }
        size_t n = 0;
        if (!tryAdvanceEpoch_(&n)) {
            break;
        }
        reclaimed += n;
    }
    return reclaimed;
}

bool EBRManager::tryAdvanceEpoch_(size_t* reclaimed) {
    uint64_t current = global_epoch_.load(std::memory_order_seq_cst);

    bool all_caught_up = true;
    slot_manager_.forEachSlot([&](const ThreadSlot& slot) {
        if (slot.active.load(std::memory_order_seq_cst) &&
            slot.local_epoch.load(std::memory_order_seq_cst) != current) {
            all_caught_up = false;
        }
    });

    if (!all_caught_up) {
        return false;
    }

    if (!global_epoch_.compare_exchange_strong(current, current + 1, std::memory_order_acq_rel)) {
        return false;
    }

    const size_t n = collectGarbage_(current + 1);
    if (reclaimed) {
        *reclaimed = n;
    }
    return true;
}

size_t EBRManager::collectGarbage_(uint64_t new_epoch) {
    // new_epoch - 2 对应的链表；落后的收集者可能看到更新 epoch 的节点，按标记逐个判断
    LockFreeSingleLinkedList& list = garbage_lists_[(new_epoch + 1) % kNumEpochLists];

    size_t reclaimed = 0;
    RetiredNode* node = list.steal_all();
    while (node) {
        RetiredNode* next = node->next;
        if (node->epoch + 2 <= new_epoch) {
            reclaimNode_(node, new_epoch);
            pending_count_.fetch_sub(1, std::memory_order_relaxed);
            ++reclaimed;
        } else {
            list.push(node);
        }
        node = next;
    }
    return reclaimed;
}

size_t EBRManager::drain() {
    const uint64_t epoch = global_epoch_.load(std::memory_order_acquire);
    size_t reclaimed = 0;

    for (auto& list : garbage_lists_) {
        RetiredNode* node = list.steal_all();
        while (node) {
            RetiredNode* next = node->next;
            reclaimNode_(node, epoch);
            pending_count_.fetch_sub(1, std::memory_order_relaxed);
            ++reclaimed;
            node = next;
        }
    }
    return reclaimed;
}

void EBRManager::reclaimNode_(RetiredNode* node, uint64_t epoch) {
    ReclaimToken token(epoch);
    node->reclaim(node->ctx, node->block_id, token);
    delete node;
}
