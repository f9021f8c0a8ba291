#include "NC_ForwardEngine.hpp"
#include "NC_ActvFunc.hpp"
#include "NC_Profiler.hpp"
#include "NC_System.hpp"
#include "NC_TensorOps.hpp"

#include <QThreadPool>
#include <QVector>
#include <QtConcurrent>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <vector>

using namespace NC;

//===================================================================================================================//

ErrorType ForwardEngine::forwardPass(Network* network, const double* input, double* output, ulong batchSize) {
  if (network == nullptr || input == nullptr || output == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "forwardPass requires a network, an input and an output");
  }

  if (batchSize == 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "batchSize must be greater than zero");
  }

  ulong inputSize = network->getInputSize();
  ulong outputSize = network->getOutputSize();
  auto startTime = std::chrono::steady_clock::now();

  for (ulong s = 0; s < batchSize; s++) {
    ErrorType errorType = runSample(*network, input + s * inputSize, output + s * outputSize,
                                    network->getInputBuffer(), network->getOutputBuffer());

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }
  }

  Profiler::global().record(Profiler::forwardPass,
                            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count());

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType ForwardEngine::processBatchParallel(Network* network, const double* input, double* output, ulong batchSize,
                                              int numThreads) {
  if (network == nullptr || input == nullptr || output == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "processBatchParallel requires a network, an input and an output");
  }

  if (batchSize == 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "batchSize must be greater than zero");
  }

  if (numThreads < 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "numThreads must not be negative");
  }

  const Network& model = *network;
  ulong inputSize = model.getInputSize();
  ulong outputSize = model.getOutputSize();
  ulong width = model.getMaxLayerWidth();

  ulong numWorkers = std::min(static_cast<ulong>(System::resolveNumThreads(numThreads)), batchSize);
  ulong chunkSize = (batchSize + numWorkers - 1) / numWorkers;

  struct Worker {
    std::vector<double> bufferA;
    std::vector<double> bufferB;
    ErrorType errorType = ErrorType::SUCCESS;
    std::string errorMessage;
  };

  std::vector<Worker> workers(numWorkers);
  QVector<ulong> workerIndices(numWorkers);

  for (ulong w = 0; w < numWorkers; w++) {
    workers[w].bufferA.resize(width);
    workers[w].bufferB.resize(width);
    workerIndices[w] = w;
  }

  auto startTime = std::chrono::steady_clock::now();

  QThreadPool pool;
  pool.setMaxThreadCount(static_cast<int>(numWorkers));

  QtConcurrent::blockingMap(&pool, workerIndices, [&](ulong w) {
    Worker& worker = workers[w];
    ulong begin = w * chunkSize;
    ulong end = std::min(begin + chunkSize, batchSize);

    for (ulong s = begin; s < end; s++) {
      worker.errorType = runSample(model, input + s * inputSize, output + s * outputSize,
                                   worker.bufferA.data(), worker.bufferB.data());

      if (worker.errorType != ErrorType::SUCCESS) {
        // Last-error state is per thread; carry the message back to the caller.
        worker.errorMessage = Error::getLast();
        return;
      }
    }
  });

  for (const Worker& worker : workers) {
    if (worker.errorType != ErrorType::SUCCESS) {
      return Error::report(worker.errorType, "worker failed: " + worker.errorMessage);
    }
  }

  Profiler::global().record(Profiler::forwardPass,
                            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count());

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

void ForwardEngine::allocateCache(const Network& network, ForwardCache& cache) {
  ulong numLayers = network.getNumLayers();

  cache.linears.resize(numLayers);
  cache.zs.resize(numLayers);
  cache.actvs.resize(numLayers);
  cache.dropoutMasks.resize(numLayers);

  for (ulong l = 0; l < numLayers; l++) {
    ulong numNeurons = network.getLayer(l).outputSize;

    cache.linears[l].resize(numNeurons);
    cache.zs[l].resize(numNeurons);
    cache.actvs[l].resize(numNeurons);
    cache.dropoutMasks[l].clear();
  }
}

//===================================================================================================================//

ErrorType ForwardEngine::propagate(const Network& network, const double* input, ForwardCache& cache, std::mt19937* rng) {
  if (input == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "propagate requires an input");
  }

  ulong numLayers = network.getNumLayers();

  if (cache.actvs.size() != numLayers) {
    ForwardEngine::allocateCache(network, cache);
  }

  const NetworkConfig& config = network.getConfig();
  const double* x = input;

  for (ulong l = 0; l < numLayers; l++) {
    const Layer& layer = network.getLayer(l);

    ErrorType errorType = computeLayer(layer, x, cache.linears[l].data(), cache.zs[l].data(), cache.actvs[l].data());

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }

    // Inverted dropout on every layer but the output one
    bool applyDropout = rng != nullptr && config.useDropout && config.dropoutRate > 0 && layer.isTraining &&
                        l + 1 < numLayers;

    if (applyDropout) {
      std::bernoulli_distribution keep(1.0 - config.dropoutRate);
      double keptScale = 1.0 / (1.0 - config.dropoutRate);
      std::vector<double>& mask = cache.dropoutMasks[l];

      mask.resize(layer.outputSize);

      for (ulong j = 0; j < layer.outputSize; j++) {
        mask[j] = keep(*rng) ? keptScale : 0.0;
        cache.actvs[l][j] *= mask[j];
      }
    } else {
      cache.dropoutMasks[l].clear();
    }

    x = cache.actvs[l].data();
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType ForwardEngine::computeLayer(const Layer& layer, const double* x, double* linear, double* zs, double* actvs) {
  ErrorType errorType = TensorOps<double>::matrixVectorAdd(layer.weights.data(), x, layer.biases.data(), linear,
                                                           layer.outputSize, layer.inputSize);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  if (layer.hasBatchNorm()) {
    for (ulong j = 0; j < layer.outputSize; j++) {
      double zHat = (linear[j] - layer.bnMean[j]) / std::sqrt(layer.bnVariance[j] + Network::batchNormEpsilon);
      zs[j] = layer.bnScale[j] * zHat + layer.bnShift[j];
    }
  } else if (zs != linear) {
    std::copy(linear, linear + layer.outputSize, zs);
  }

  return ActvFunc::apply(zs, actvs, layer.outputSize, layer.actvFuncType);
}

//===================================================================================================================//

ErrorType ForwardEngine::runSample(const Network& network, const double* input, double* output, double* bufferA,
                                   double* bufferB) {
  ulong numLayers = network.getNumLayers();

  std::copy(input, input + network.getInputSize(), bufferA);

  // Ping-pong: current holds the layer input, next receives its output
  double* current = bufferA;
  double* next = bufferB;

  for (ulong l = 0; l < numLayers; l++) {
    ErrorType errorType = computeLayer(network.getLayer(l), current, next, next, next);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }

    std::swap(current, next);
  }

  std::copy(current, current + network.getOutputSize(), output);

  return ErrorType::SUCCESS;
}
