#ifndef NC_BUFFER_HPP
#define NC_BUFFER_HPP

#include "NC_Error.hpp"
#include "NC_MemoryManager.hpp"

#include <sys/types.h>

#include <utility>

//===================================================================================================================//

namespace NC {
  // Move-only owner of a typed allocation made through a MemoryManager.
  template <typename T>
  class Buffer {
    public:
      Buffer() = default;

      // Destructors cannot report; callers that care use release() directly.
      ~Buffer() { this->release(); }

      Buffer(const Buffer&) = delete;
      Buffer& operator=(const Buffer&) = delete;

      Buffer(Buffer&& other) noexcept
          : memoryManager(std::exchange(other.memoryManager, nullptr)),
            ptr(std::exchange(other.ptr, nullptr)),
            count(std::exchange(other.count, 0)) {}

      Buffer& operator=(Buffer&& other) noexcept {
        if (this != &other) {
          this->release();
          this->memoryManager = std::exchange(other.memoryManager, nullptr);
          this->ptr = std::exchange(other.ptr, nullptr);
          this->count = std::exchange(other.count, 0);
        }

        return *this;
      }

      ErrorType allocate(MemoryManager& memoryManager, ulong count, ulong alignment = MemoryManager::defaultAlignment) {
        ErrorType errorType = this->release();

        if (errorType != ErrorType::SUCCESS) {
          return errorType;
        }

        T* newPtr = memoryManager.allocateArray<T>(count, alignment);

        if (newPtr == nullptr) {
          return Error::getLastType();
        }

        this->memoryManager = &memoryManager;
        this->ptr = newPtr;
        this->count = count;

        return ErrorType::SUCCESS;
      }

      ErrorType release() {
        if (this->ptr == nullptr) {
          return ErrorType::SUCCESS;
        }

        ErrorType errorType = this->memoryManager->free(this->ptr);

        this->ptr = nullptr;
        this->count = 0;
        this->memoryManager = nullptr;

        return errorType;
      }

      T* data() { return this->ptr; }
      const T* data() const { return this->ptr; }

      ulong size() const { return this->count; }
      bool empty() const { return this->ptr == nullptr; }

      T& operator[](ulong i) { return this->ptr[i]; }
      const T& operator[](ulong i) const { return this->ptr[i]; }

      T* begin() { return this->ptr; }
      T* end() { return this->ptr + this->count; }
      const T* begin() const { return this->ptr; }
      const T* end() const { return this->ptr + this->count; }

    private:
      MemoryManager* memoryManager = nullptr;
      T* ptr = nullptr;
      ulong count = 0;
  };
}

#endif // NC_BUFFER_HPP
