#ifndef NC_SYSTEM_HPP
#define NC_SYSTEM_HPP

#include "NC_Error.hpp"
#include "NC_LogLevel.hpp"
#include "NC_MemoryManager.hpp"

#include <sys/types.h>

#include <string>

//===================================================================================================================//

namespace NC {
  struct OptimizationConfig {
    bool useSimd = true;
    int numThreads = 0;  // 0 = QThread::idealThreadCount()
    // Networks created afterwards align every buffer to the larger of these two (both powers of two).
    ulong memoryAlignment = MemoryManager::defaultAlignment;
    ulong cacheLineSize = 64;
    LogLevel logLevel = LogLevel::ERROR;
  };

  // Process-wide runtime settings. Everything here is safe to call from any thread.
  class System {
    public:
      static ErrorType init(const OptimizationConfig& config = OptimizationConfig());
      static ErrorType cleanup();
      static bool isInitialized();

      static std::string getVersion();
      static std::string getInfo();

      static OptimizationConfig getOptimizationConfig();
      static ErrorType setOptimizationConfig(const OptimizationConfig& config);

      //-- Capabilities --//
      static bool isSimdSupported();

      // True when the accelerated kernels are both requested and runnable.
      static bool isAccelerationEnabled();

      // Resolves a caller thread count: > 0 is kept, otherwise the configured count, otherwise the ideal count.
      static int resolveNumThreads(int numThreads);

      // Shared manager used by callers that do not bring their own (the CLI).
      static MemoryManager& getMemoryManager();
  };
}

#endif // NC_SYSTEM_HPP
