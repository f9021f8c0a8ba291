#ifndef NC_PROFILER_HPP
#define NC_PROFILER_HPP

#include "NC_Error.hpp"

#include <QMutex>

#include <sys/types.h>

#include <chrono>
#include <map>
#include <string>

//===================================================================================================================//

namespace NC {
  struct PerformanceMetrics {
    double forwardPassTime = 0;   // Seconds
    double backwardPassTime = 0;
    double trainingTime = 0;
    double inferenceTime = 0;
    double operationsPerSecond = 0;
  };

  // Named start/stop timers. Totals accumulate across measurements until reset().
  class Profiler {
    public:
      //-- Well-known timer names feeding PerformanceMetrics --//
      static const std::string forwardPass;
      static const std::string backwardPass;
      static const std::string training;
      static const std::string inference;

      ErrorType start(const std::string& name);

      // INVALID_OPERATION when the timer is not running. elapsedSeconds may be null.
      ErrorType stop(const std::string& name, double* elapsedSeconds = nullptr);

      bool isRunning(const std::string& name) const;
      double getTotal(const std::string& name) const;
      ulong getCount(const std::string& name) const;

      // Adds an externally measured duration, as one measurement, to a timer that need not be running.
      // The engines feed forwardPass and backwardPass of global() this way, from any thread.
      void record(const std::string& name, double seconds);

      // Work units (samples, batches) counted towards operationsPerSecond
      void addOperations(ulong count);

      PerformanceMetrics getMetrics() const;
      void reset();

      // Phase timings recorded by ForwardEngine and Trainer
      static Profiler& global();

    private:
      struct Timer {
        std::chrono::steady_clock::time_point startTime;
        bool running = false;
        double total = 0;
        ulong count = 0;
      };

      mutable QMutex mutex;
      std::map<std::string, Timer> timers;
      ulong operations = 0;
  };
}

#endif // NC_PROFILER_HPP
