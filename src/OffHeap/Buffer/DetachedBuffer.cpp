#include "OffHeap/Buffer/DetachedBuffer.hpp"

DetachedBuffer UnboundBuffer::bind(const Reference& ref) const {
    return DetachedBuffer(*manager_, ref);
}

ReadOnlySlice DetachedBuffer::rawView() const {
    return ReadOnlySlice(userData_(), capacity(), order_);
}

uintptr_t DetachedBuffer::nativeAddress() const {
    return reinterpret_cast<uintptr_t>(userData_());
}
