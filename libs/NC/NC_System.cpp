#include "NC_System.hpp"
#include "NC_Simd.hpp"

#include <QMutex>
#include <QMutexLocker>
#include <QThread>

#include <algorithm>
#include <atomic>
#include <iostream>
#include <sstream>

using namespace NC;

//===================================================================================================================//

namespace {
  QMutex configMutex;
  OptimizationConfig optimizationConfig;
  bool initialized = false;

  // Read on every matrix multiply, so it lives outside the mutex.
  std::atomic<bool> accelerationEnabled{Simd::isSupported()};

  ErrorType validate(const OptimizationConfig& config) {
    if (config.numThreads < 0) {
      return Error::report(ErrorType::INVALID_ARGUMENT, "numThreads must not be negative");
    }

    if (config.memoryAlignment == 0 || (config.memoryAlignment & (config.memoryAlignment - 1)) != 0) {
      return Error::report(ErrorType::INVALID_ARGUMENT, "memoryAlignment must be a power of two");
    }

    if (config.cacheLineSize == 0 || (config.cacheLineSize & (config.cacheLineSize - 1)) != 0) {
      return Error::report(ErrorType::INVALID_ARGUMENT, "cacheLineSize must be a power of two");
    }

    return ErrorType::SUCCESS;
  }
}

//===================================================================================================================//

ErrorType System::init(const OptimizationConfig& config) {
  ErrorType errorType = validate(config);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  QMutexLocker locker(&configMutex);

  optimizationConfig = config;
  accelerationEnabled = config.useSimd && Simd::isSupported();
  initialized = true;

  if (config.logLevel >= LogLevel::INFO) {
    std::cout << "NeuralCore " << System::getVersion() << " initialized (SIMD: " << Simd::getInstructionSet()
              << ", acceleration " << (accelerationEnabled ? "on" : "off") << ")\n";
  }

  if (config.useSimd && !Simd::isSupported() && config.logLevel >= LogLevel::WARNING) {
    std::cerr << "Warning: SIMD requested but not supported, using scalar kernels\n";
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType System::cleanup() {
  QMutexLocker locker(&configMutex);

  if (!initialized) {
    return Error::report(ErrorType::INVALID_OPERATION, "cleanup called without a matching init");
  }

  MemoryStats stats = System::getMemoryManager().stats();

  if (stats.usedMemory > 0 && optimizationConfig.logLevel >= LogLevel::WARNING) {
    std::cerr << "Warning: " << stats.usedMemory << " bytes still allocated at cleanup\n";
  }

  ErrorType errorType = System::getMemoryManager().optimize();

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  optimizationConfig = OptimizationConfig();
  accelerationEnabled = Simd::isSupported();
  initialized = false;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

bool System::isInitialized() {
  QMutexLocker locker(&configMutex);
  return initialized;
}

//===================================================================================================================//

std::string System::getVersion() {
  return "1.0.0";
}

//===================================================================================================================//

std::string System::getInfo() {
  OptimizationConfig config = System::getOptimizationConfig();

  std::ostringstream info;
  info << "NeuralCore " << System::getVersion() << "\n";
  info << "  SIMD:            " << Simd::getInstructionSet() << (Simd::isCompiledIn() ? "" : " (not compiled in)") << "\n";
  info << "  Acceleration:    " << (System::isAccelerationEnabled() ? "enabled" : "disabled") << "\n";
  info << "  Threads:         " << System::resolveNumThreads(0) << "\n";
  info << "  Alignment:       " << config.memoryAlignment << " bytes\n";
  info << "  Cache line size: " << config.cacheLineSize << " bytes";

  return info.str();
}

//===================================================================================================================//

OptimizationConfig System::getOptimizationConfig() {
  QMutexLocker locker(&configMutex);
  return optimizationConfig;
}

//===================================================================================================================//

ErrorType System::setOptimizationConfig(const OptimizationConfig& config) {
  ErrorType errorType = validate(config);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  QMutexLocker locker(&configMutex);

  optimizationConfig = config;
  accelerationEnabled = config.useSimd && Simd::isSupported();

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

bool System::isSimdSupported() {
  return Simd::isSupported();
}

//===================================================================================================================//

bool System::isAccelerationEnabled() {
  return accelerationEnabled;
}

//===================================================================================================================//

int System::resolveNumThreads(int numThreads) {
  if (numThreads > 0) {
    return numThreads;
  }

  int configured = System::getOptimizationConfig().numThreads;

  if (configured > 0) {
    return configured;
  }

  return std::max(1, QThread::idealThreadCount());
}

//===================================================================================================================//

MemoryManager& System::getMemoryManager() {
  static MemoryManager memoryManager;
  return memoryManager;
}
