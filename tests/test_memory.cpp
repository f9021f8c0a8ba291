#include "test_helpers.hpp"

#include <NC_Buffer.hpp>
#include <NC_Error.hpp>
#include <NC_MemoryManager.hpp>

#include <QThreadPool>
#include <QVector>
#include <QtConcurrent>

#include <climits>
#include <cstdint>
#include <vector>

static void testAllocateAndFree() {
  std::cout << "  testAllocateAndFree... ";

  NC::MemoryManager memoryManager;

  void* ptr = memoryManager.allocate(100, 64);

  CHECK(ptr != nullptr, "Allocate: pointer returned");
  CHECK(reinterpret_cast<std::uintptr_t>(ptr) % 64 == 0, "Allocate: 64-byte aligned");
  CHECK(memoryManager.owns(ptr), "Allocate: manager owns pointer");

  bool zeroed = true;
  for (int i = 0; i < 100; i++) {
    if (static_cast<unsigned char*>(ptr)[i] != 0) zeroed = false;
  }
  CHECK(zeroed, "Allocate: memory is zero-filled");

  NC::MemoryStats stats = memoryManager.stats();
  CHECK(stats.usedMemory == 100, "Allocate: used memory counts requested bytes");
  CHECK(stats.allocationCount == 1, "Allocate: one allocation");

  CHECK(memoryManager.free(ptr) == NC::ErrorType::SUCCESS, "Free: success");

  stats = memoryManager.stats();
  CHECK(stats.usedMemory == 0, "Free: used memory back to zero");
  CHECK(stats.peakMemory == 100, "Free: peak memory kept");
  CHECK(stats.deallocationCount == 1, "Free: one deallocation");
  CHECK(memoryManager.liveAllocations() == 0, "Free: no live allocations");
  std::cout << std::endl;
}

static void testAllocateInvalid() {
  std::cout << "  testAllocateInvalid... ";

  NC::MemoryManager memoryManager;

  CHECK(memoryManager.allocate(0) == nullptr, "Allocate zero bytes: nullptr");
  CHECK(NC::Error::getLastType() == NC::ErrorType::INVALID_ARGUMENT, "Allocate zero bytes: INVALID_ARGUMENT");

  CHECK(memoryManager.allocate(16, 24) == nullptr, "Allocate bad alignment: nullptr");
  CHECK(NC::Error::getLastType() == NC::ErrorType::INVALID_ARGUMENT, "Allocate bad alignment: INVALID_ARGUMENT");

  CHECK(memoryManager.free(nullptr) == NC::ErrorType::NULL_POINTER, "Free null: NULL_POINTER");

  int local = 0;
  CHECK(memoryManager.free(&local) == NC::ErrorType::INVALID_ARGUMENT, "Free foreign pointer: INVALID_ARGUMENT");

  CHECK(memoryManager.allocateArray<double>(ULONG_MAX / sizeof(double) + 1) == nullptr,
        "Allocate array overflowing byte size: nullptr");
  CHECK(NC::Error::getLastType() == NC::ErrorType::MEMORY_ALLOCATION,
        "Allocate array overflowing byte size: MEMORY_ALLOCATION");
  CHECK(memoryManager.allocate(ULONG_MAX) == nullptr, "Allocate unpaddable size: nullptr");
  CHECK(NC::Error::getLastType() == NC::ErrorType::MEMORY_ALLOCATION, "Allocate unpaddable size: MEMORY_ALLOCATION");
  CHECK(memoryManager.stats().allocationCount == 0, "Allocate invalid: nothing counted");

  void* ptr = memoryManager.allocate(8);
  CHECK(memoryManager.free(ptr) == NC::ErrorType::SUCCESS, "Double free: first free succeeds");
  CHECK(memoryManager.free(ptr) == NC::ErrorType::INVALID_ARGUMENT, "Double free: second free rejected");
  std::cout << std::endl;
}

static void testMemoryLimit() {
  std::cout << "  testMemoryLimit... ";

  NC::MemoryManager memoryManager(256);

  void* first = memoryManager.allocate(200);
  CHECK(first != nullptr, "Memory limit: allocation within limit");

  void* second = memoryManager.allocate(100);
  CHECK(second == nullptr, "Memory limit: allocation over limit fails");
  CHECK(NC::Error::getLastType() == NC::ErrorType::MEMORY_ALLOCATION, "Memory limit: MEMORY_ALLOCATION");

  CHECK(memoryManager.free(first) == NC::ErrorType::SUCCESS, "Memory limit: free");

  memoryManager.setMemoryLimit(0);
  CHECK(memoryManager.getMemoryLimit() == 0, "Memory limit: removed");

  void* large = memoryManager.allocate(1024);
  CHECK(large != nullptr, "Memory limit: unlimited allocation succeeds");
  CHECK(memoryManager.free(large) == NC::ErrorType::SUCCESS, "Memory limit: free large");
  std::cout << std::endl;
}

static void testBufferOwnership() {
  std::cout << "  testBufferOwnership... ";

  NC::MemoryManager memoryManager;

  {
    NC::Buffer<double> buffer;
    CHECK(buffer.allocate(memoryManager, 10) == NC::ErrorType::SUCCESS, "Buffer: allocate");
    CHECK(buffer.size() == 10, "Buffer: size");
    CHECK(buffer[3] == 0.0, "Buffer: zero-initialized");

    buffer[3] = 2.5;

    NC::Buffer<double> moved(std::move(buffer));
    CHECK(buffer.empty(), "Buffer: moved-from is empty");
    CHECK(moved[3] == 2.5, "Buffer: moved-to keeps data");
    CHECK(memoryManager.liveAllocations() == 1, "Buffer: one live allocation after move");
  }

  CHECK(memoryManager.liveAllocations() == 0, "Buffer: released on destruction");
  CHECK(memoryManager.stats().usedMemory == 0, "Buffer: no memory in use");
  std::cout << std::endl;
}

static void testFragmentationRatio() {
  std::cout << "  testFragmentationRatio... ";

  NC::MemoryManager memoryManager;

  CHECK(memoryManager.stats().fragmentationRatio == 0.0, "Fragmentation: zero before any allocation");

  void* a = memoryManager.allocate(300);
  void* b = memoryManager.allocate(100);
  CHECK(memoryManager.free(a) == NC::ErrorType::SUCCESS, "Fragmentation: free first block");

  CHECK_NEAR(memoryManager.stats().fragmentationRatio, 0.75, 1e-12, "Fragmentation: (peak - used) / peak");

  CHECK(memoryManager.free(b) == NC::ErrorType::SUCCESS, "Fragmentation: free second block");
  CHECK(memoryManager.optimize() == NC::ErrorType::SUCCESS, "Optimize: success");
  std::cout << std::endl;
}

static void testConcurrentAllocateAndFree() {
  std::cout << "  testConcurrentAllocateAndFree... ";

  const ulong numWorkers = 8;
  const ulong rounds = 200;

  NC::MemoryManager memoryManager;
  std::vector<ulong> failures(numWorkers, 0);
  QVector<ulong> workerIndices(numWorkers);

  for (ulong w = 0; w < numWorkers; w++) {
    workerIndices[w] = w;
  }

  QThreadPool pool;
  pool.setMaxThreadCount(static_cast<int>(numWorkers));

  QtConcurrent::blockingMap(&pool, workerIndices, [&](ulong w) {
    std::vector<void*> held;

    for (ulong r = 0; r < rounds; r++) {
      void* ptr = memoryManager.allocate(16 + (w * rounds + r) % 97);

      if (ptr == nullptr) {
        failures[w]++;
        continue;
      }

      held.push_back(ptr);

      // Keep a few blocks live so frees interleave with other workers' allocations
      if (held.size() == 4) {
        for (void* block : held) {
          if (memoryManager.free(block) != NC::ErrorType::SUCCESS) failures[w]++;
        }

        held.clear();
      }
    }

    for (void* block : held) {
      if (memoryManager.free(block) != NC::ErrorType::SUCCESS) failures[w]++;
    }
  });

  ulong totalFailures = 0;
  for (ulong count : failures) totalFailures += count;

  NC::MemoryStats stats = memoryManager.stats();
  CHECK(totalFailures == 0, "Concurrent: every allocate and free succeeded");
  CHECK(stats.allocationCount == numWorkers * rounds, "Concurrent: allocation count");
  CHECK(stats.deallocationCount == numWorkers * rounds, "Concurrent: deallocation count");
  CHECK(stats.usedMemory == 0, "Concurrent: no memory in use");
  CHECK(memoryManager.liveAllocations() == 0, "Concurrent: no live allocations");
  CHECK(stats.peakMemory >= 16 && stats.peakMemory <= stats.totalMemory, "Concurrent: peak within total");
  std::cout << std::endl;
}

void runMemoryTests() {
  testAllocateAndFree();
  testAllocateInvalid();
  testMemoryLimit();
  testBufferOwnership();
  testFragmentationRatio();
  testConcurrentAllocateAndFree();
}
