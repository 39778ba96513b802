#include "OffHeap/Buffer/WriteBuffer.hpp"

WriteBuffer::WriteBuffer(MemoryManager& manager, const Reference& ref)
    : manager_(&manager),
      ref_(ref),
      header_size_(manager.headerSize()),
      capacity_(ref.userLength(manager.headerSize())),
      order_(manager.byteOrder()) {
    if (manager.isClosed()) {
        throw MemoryManagerClosedError();
    }
    assert(ref_.isValid() && ref_.length >= header_size_);
}
