#include "NC_Profiler.hpp"

#include <QMutexLocker>

using namespace NC;

//===================================================================================================================//

const std::string Profiler::forwardPass = "forward_pass";
const std::string Profiler::backwardPass = "backward_pass";
const std::string Profiler::training = "training";
const std::string Profiler::inference = "inference";

//===================================================================================================================//

ErrorType Profiler::start(const std::string& name) {
  if (name.empty()) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "timer name must not be empty");
  }

  QMutexLocker locker(&this->mutex);

  Timer& timer = this->timers[name];

  if (timer.running) {
    return Error::report(ErrorType::INVALID_OPERATION, "timer '" + name + "' is already running");
  }

  timer.running = true;
  timer.startTime = std::chrono::steady_clock::now();

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Profiler::stop(const std::string& name, double* elapsedSeconds) {
  auto now = std::chrono::steady_clock::now();

  QMutexLocker locker(&this->mutex);

  auto it = this->timers.find(name);

  if (it == this->timers.end() || !it->second.running) {
    return Error::report(ErrorType::INVALID_OPERATION, "timer '" + name + "' was not started");
  }

  Timer& timer = it->second;
  std::chrono::duration<double> elapsed = now - timer.startTime;

  timer.running = false;
  timer.total += elapsed.count();
  timer.count++;

  if (elapsedSeconds != nullptr) {
    *elapsedSeconds = elapsed.count();
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

bool Profiler::isRunning(const std::string& name) const {
  QMutexLocker locker(&this->mutex);

  auto it = this->timers.find(name);
  return it != this->timers.end() && it->second.running;
}

//===================================================================================================================//

double Profiler::getTotal(const std::string& name) const {
  QMutexLocker locker(&this->mutex);

  auto it = this->timers.find(name);
  return (it != this->timers.end()) ? it->second.total : 0.0;
}

//===================================================================================================================//

ulong Profiler::getCount(const std::string& name) const {
  QMutexLocker locker(&this->mutex);

  auto it = this->timers.find(name);
  return (it != this->timers.end()) ? it->second.count : 0;
}

//===================================================================================================================//

void Profiler::record(const std::string& name, double seconds) {
  QMutexLocker locker(&this->mutex);

  Timer& timer = this->timers[name];
  timer.total += seconds;
  timer.count++;
}

//===================================================================================================================//

void Profiler::addOperations(ulong count) {
  QMutexLocker locker(&this->mutex);

  this->operations += count;
}

//===================================================================================================================//

PerformanceMetrics Profiler::getMetrics() const {
  QMutexLocker locker(&this->mutex);

  auto totalOf = [this](const std::string& name) {
    auto it = this->timers.find(name);
    return (it != this->timers.end()) ? it->second.total : 0.0;
  };

  PerformanceMetrics metrics;
  metrics.forwardPassTime = totalOf(Profiler::forwardPass);
  metrics.backwardPassTime = totalOf(Profiler::backwardPass);
  metrics.trainingTime = totalOf(Profiler::training);
  metrics.inferenceTime = totalOf(Profiler::inference);

  double busyTime = metrics.trainingTime + metrics.inferenceTime;

  if (busyTime > 0) {
    metrics.operationsPerSecond = static_cast<double>(this->operations) / busyTime;
  }

  return metrics;
}

//===================================================================================================================//

void Profiler::reset() {
  QMutexLocker locker(&this->mutex);

  this->timers.clear();
  this->operations = 0;
}

//===================================================================================================================//

Profiler& Profiler::global() {
  static Profiler profiler;
  return profiler;
}
