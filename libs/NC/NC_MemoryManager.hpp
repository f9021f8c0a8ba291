#ifndef NC_MEMORYMANAGER_HPP
#define NC_MEMORYMANAGER_HPP

#include "NC_Error.hpp"

#include <QMutex>

#include <sys/types.h>

#include <climits>
#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace NC {
  struct MemoryStats {
    ulong totalMemory = 0;        // Bytes ever handed out
    ulong usedMemory = 0;         // Bytes currently live
    ulong peakMemory = 0;         // High-water mark of usedMemory
    ulong allocationCount = 0;
    ulong deallocationCount = 0;
    double fragmentationRatio = 0.0;  // (peak - used) / peak, 0 when nothing was ever allocated
  };

  class MemoryManager {
    public:
      static constexpr ulong defaultAlignment = 64;

      //-- Constructor --//
      // memoryLimit caps usedMemory in bytes; 0 means unlimited.
      explicit MemoryManager(ulong memoryLimit = 0);
      ~MemoryManager();

      MemoryManager(const MemoryManager&) = delete;
      MemoryManager& operator=(const MemoryManager&) = delete;

      //-- Allocation --//
      // Returns zero-filled memory, or nullptr with the error recorded in Error::getLast().
      void* allocate(ulong size, ulong alignment = defaultAlignment);
      ErrorType free(void* ptr);

      template <typename T>
      T* allocateArray(ulong count, ulong alignment = defaultAlignment) {
        if (count == 0) {
          Error::report(ErrorType::INVALID_ARGUMENT, "cannot allocate an empty array");
          return nullptr;
        }

        if (count > ULONG_MAX / sizeof(T)) {
          Error::report(ErrorType::MEMORY_ALLOCATION,
                        "array of " + std::to_string(count) + " elements overflows its byte size");
          return nullptr;
        }

        return static_cast<T*>(this->allocate(count * sizeof(T), alignment));
      }

      //-- Statistics --//
      MemoryStats stats() const;
      ulong liveAllocations() const;
      bool owns(const void* ptr) const;

      //-- Maintenance --//
      ErrorType optimize();
      void setMemoryLimit(ulong memoryLimit);
      ulong getMemoryLimit() const;

    private:
      mutable QMutex mutex;
      std::unordered_map<const void*, ulong> allocations;  // Live pointer -> requested size
      MemoryStats counters;
      ulong memoryLimit;
  };
}

#endif // NC_MEMORYMANAGER_HPP
