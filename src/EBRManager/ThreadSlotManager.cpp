#include "EBRManager/ThreadSlotManager.hpp"
#include <utility>
#include <new>      // for std::nothrow
#include <mutex>

namespace {
std::atomic<uint64_t> g_next_instance_id{1};
}

ThreadSlotManager::ThreadSlotManager()
    : instance_id_(g_next_instance_id.fetch_add(1, std::memory_order_relaxed)),
      state_(std::make_shared<State>()) {}

ThreadSlotManager::~ThreadSlotManager() {}


ThreadSlot* ThreadSlotManager::getLocalSlot() {
    LocalSlotCache& cache = localCache_();

    ThreadSlot* slot = cache.find(instance_id_);
    if (slot) {
        return slot;
    }

    slot = state_->acquireSlot();
    if (!slot) {
        return nullptr;
    }
    cache.add(instance_id_, state_, slot);
    return slot;
}

ThreadSlotManager::LocalSlotCache& ThreadSlotManager::localCache_() {
    thread_local LocalSlotCache g_local_slot_cache;
    return g_local_slot_cache;
}

void ThreadSlotManager::State::releaseSlot(ThreadSlot* slot) noexcept {
    slot->reset();
    free_slots.push(slot);
}

ThreadSlot* ThreadSlotManager::State::acquireSlot() {

    ThreadSlot* slot = free_slots.pop();
    if(slot) {
        return slot;
    }

    return expandAndAcquire();
}

ThreadSlot* ThreadSlotManager::State::expandAndAcquire() {
    std::lock_guard<std::mutex> lock(resize_lock);

    // Double Check: 再次检查空闲链表
    ThreadSlot* slot = free_slots.pop();
    if(slot) {
        return slot;
    }

    const size_t current_capacity = capacity.load(std::memory_order_relaxed);
    const size_t new_slots_to_add = (current_capacity == 0) ? kInitialCapacity : current_capacity;

    // 使用 std::nothrow 以便在失败时返回 nullptr，而不是抛出异常
    ThreadSlot* new_slots_array = new (std::nothrow) ThreadSlot[new_slots_to_add];

    if (!new_slots_array) {
        return nullptr;
    }

    Segment new_segment;
    new_segment.slots.reset(new_slots_array);
    new_segment.count = new_slots_to_add;

    // 前 N-1 个槽位放入空闲链表，最后一个直接给当前请求者
    for(size_t i = 0; i < new_slots_to_add - 1; ++i) {
        free_slots.push(&new_slots_array[i]);
    }

    segments.push_back(std::move(new_segment));

    capacity.fetch_add(new_slots_to_add, std::memory_order_relaxed);

    return &new_slots_array[new_slots_to_add - 1];
}

ThreadSlot* ThreadSlotManager::LocalSlotCache::find(uint64_t owner_id) noexcept {
    if (last_hit_ < entries_.size() && entries_[last_hit_].owner_id == owner_id) {
        return entries_[last_hit_].slot;
    }

    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].owner_id == owner_id) {
            last_hit_ = i;
            return entries_[i].slot;
        }
    }
    return nullptr;
}

void ThreadSlotManager::LocalSlotCache::add(uint64_t owner_id,
                                            const std::shared_ptr<State>& state,
                                            ThreadSlot* slot) {
    pruneExpired_();
    entries_.push_back(Entry{owner_id, state, slot});
    last_hit_ = entries_.size() - 1;
}

void ThreadSlotManager::LocalSlotCache::pruneExpired_() {
    // 已析构的 manager 留下的条目直接丢弃，槽位随 State 一起释放
    std::erase_if(entries_, [](const Entry& e) { return e.state.expired(); });
    last_hit_ = 0;
}

ThreadSlotManager::LocalSlotCache::~LocalSlotCache() {
    for (Entry& e : entries_) {
        if (auto state = e.state.lock()) {
            state->releaseSlot(e.slot);
        }
    }
}
