#include "NC_MemoryManager.hpp"

#include <QMutexLocker>

#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string>

#ifdef __GLIBC__
#include <malloc.h>
#endif

using namespace NC;

//===================================================================================================================//

MemoryManager::MemoryManager(ulong memoryLimit) : memoryLimit(memoryLimit) {}

//===================================================================================================================//

MemoryManager::~MemoryManager() {
  // Anything still registered here was leaked by its owner; reclaim it so the process does not.
  for (const auto& [ptr, size] : this->allocations) {
    std::free(const_cast<void*>(ptr));
  }
}

//===================================================================================================================//
//-- Allocation --//
//===================================================================================================================//

void* MemoryManager::allocate(ulong size, ulong alignment) {
  if (size == 0) {
    Error::report(ErrorType::INVALID_ARGUMENT, "allocation size must be greater than zero");
    return nullptr;
  }

  if (alignment == 0 || (alignment & (alignment - 1)) != 0) {
    Error::report(ErrorType::INVALID_ARGUMENT, "alignment must be a power of two, got " + std::to_string(alignment));
    return nullptr;
  }

  // aligned_alloc needs an alignment the platform supports and a size that is a multiple of it
  ulong actualAlignment = std::max(alignment, static_cast<ulong>(alignof(std::max_align_t)));

  if (size > ULONG_MAX - (actualAlignment - 1)) {
    Error::report(ErrorType::MEMORY_ALLOCATION, "request of " + std::to_string(size) + " bytes cannot be padded");
    return nullptr;
  }

  ulong paddedSize = ((size + actualAlignment - 1) / actualAlignment) * actualAlignment;

  QMutexLocker locker(&this->mutex);

  if (this->memoryLimit > 0 && this->counters.usedMemory + size > this->memoryLimit) {
    Error::report(ErrorType::MEMORY_ALLOCATION, "request of " + std::to_string(size) + " bytes exceeds the memory limit of " +
                                                std::to_string(this->memoryLimit) + " bytes");
    return nullptr;
  }

  void* ptr = std::aligned_alloc(actualAlignment, paddedSize);

  if (ptr == nullptr) {
    Error::report(ErrorType::MEMORY_ALLOCATION, "failed to allocate " + std::to_string(size) + " bytes");
    return nullptr;
  }

  std::memset(ptr, 0, paddedSize);

  try {
    this->allocations.emplace(ptr, size);
  } catch (const std::bad_alloc&) {
    std::free(ptr);
    Error::report(ErrorType::MEMORY_ALLOCATION, "failed to record allocation of " + std::to_string(size) + " bytes");
    return nullptr;
  }

  this->counters.totalMemory += size;
  this->counters.usedMemory += size;
  this->counters.allocationCount++;

  if (this->counters.usedMemory > this->counters.peakMemory) {
    this->counters.peakMemory = this->counters.usedMemory;
  }

  return ptr;
}

//===================================================================================================================//

ErrorType MemoryManager::free(void* ptr) {
  if (ptr == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "cannot free a null pointer");
  }

  QMutexLocker locker(&this->mutex);

  auto it = this->allocations.find(ptr);

  if (it == this->allocations.end()) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "pointer was not allocated by this manager or was already freed");
  }

  this->counters.usedMemory -= it->second;
  this->counters.deallocationCount++;
  this->allocations.erase(it);

  std::free(ptr);

  return ErrorType::SUCCESS;
}

//===================================================================================================================//
//-- Statistics --//
//===================================================================================================================//

MemoryStats MemoryManager::stats() const {
  QMutexLocker locker(&this->mutex);

  MemoryStats result = this->counters;

  if (result.peakMemory > 0) {
    result.fragmentationRatio =
      static_cast<double>(result.peakMemory - result.usedMemory) / static_cast<double>(result.peakMemory);
  } else {
    result.fragmentationRatio = 0.0;
  }

  return result;
}

//===================================================================================================================//

ulong MemoryManager::liveAllocations() const {
  QMutexLocker locker(&this->mutex);

  return this->allocations.size();
}

//===================================================================================================================//

bool MemoryManager::owns(const void* ptr) const {
  QMutexLocker locker(&this->mutex);

  return this->allocations.find(ptr) != this->allocations.end();
}

//===================================================================================================================//
//-- Maintenance --//
//===================================================================================================================//

ErrorType MemoryManager::optimize() {
  QMutexLocker locker(&this->mutex);

#ifdef __GLIBC__
  malloc_trim(0);
#endif

  // Headroom above current usage has been handed back, so the high-water mark restarts here.
  this->counters.peakMemory = this->counters.usedMemory;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

void MemoryManager::setMemoryLimit(ulong memoryLimit) {
  QMutexLocker locker(&this->mutex);

  this->memoryLimit = memoryLimit;
}

//===================================================================================================================//

ulong MemoryManager::getMemoryLimit() const {
  QMutexLocker locker(&this->mutex);

  return this->memoryLimit;
}
