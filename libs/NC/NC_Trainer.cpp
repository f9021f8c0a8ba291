#include "NC_Trainer.hpp"
#include "NC_ActvFunc.hpp"
#include "NC_Profiler.hpp"
#include "NC_System.hpp"

#include <QThreadPool>
#include <QVector>
#include <QtConcurrent>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <iterator>

using namespace NC;

//===================================================================================================================//

ErrorType Trainer::trainBatch(Network* network, const double* input, const double* target, ulong batchSize,
                              double* loss) {
  return Trainer::trainBatchParallel(network, input, target, batchSize, 1, loss);
}

//===================================================================================================================//

ErrorType Trainer::trainBatchParallel(Network* network, const double* input, const double* target, ulong batchSize,
                                      int numThreads, double* loss) {
  if (network == nullptr || input == nullptr || target == nullptr || loss == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "trainBatch requires a network, input, target and loss");
  }

  ErrorType errorType = Trainer::runBatch(network, input, target, nullptr, batchSize, numThreads, loss, true);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  errorType = Trainer::applyGradients(network);

  if (errorType == ErrorType::SUCCESS && network->getConfig().logLevel >= LogLevel::DEBUG) {
    std::cout << "Batch of " << batchSize << " trained, loss " << *loss << "\n";
  }

  return errorType;
}

//===================================================================================================================//

ErrorType Trainer::backwardPass(Network* network, const double* input, const double* target, double* gradients,
                                ulong batchSize) {
  if (network == nullptr || input == nullptr || target == nullptr || gradients == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "backwardPass requires a network, input, target and gradients");
  }

  double loss = 0;

  return Trainer::runBatch(network, input, target, gradients, batchSize, 1, &loss, false);
}

//===================================================================================================================//

ErrorType Trainer::applyGradients(Network* network) {
  if (network == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "applyGradients requires a network");
  }

  const NetworkConfig& config = network->getConfig();
  double learningRate = config.learningRate;
  double momentum = config.momentum;

  for (ulong l = 0; l < network->getNumLayers(); l++) {
    Layer& layer = network->getLayer(l);

    for (ulong i = 0; i < layer.weights.size(); i++) {
      layer.weightVelocities[i] = momentum * layer.weightVelocities[i] - learningRate * layer.dCost_dWeights[i];
      layer.weights[i] += layer.weightVelocities[i];
    }

    for (ulong j = 0; j < layer.biases.size(); j++) {
      layer.biasVelocities[j] = momentum * layer.biasVelocities[j] - learningRate * layer.dCost_dBiases[j];
      layer.biases[j] += layer.biasVelocities[j];
    }

    if (layer.hasBatchNorm()) {
      for (ulong j = 0; j < layer.outputSize; j++) {
        layer.bnScale[j] -= learningRate * layer.dCost_dBnScale[j];
        layer.bnShift[j] -= learningRate * layer.dCost_dBnShift[j];
      }
    }
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Trainer::evaluate(Network* network, const double* input, const double* target, ulong batchSize,
                            int numThreads, TestResult<double>* result) {
  if (network == nullptr || input == nullptr || target == nullptr || result == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "evaluate requires a network, input, target and result");
  }

  if (batchSize == 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "batchSize must be greater than zero");
  }

  ulong outputSize = network->getOutputSize();
  std::vector<double> outputs(batchSize * outputSize);

  ErrorType errorType = ForwardEngine::processBatchParallel(network, input, outputs.data(), batchSize, numThreads);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  double totalLoss = 0;
  ulong numCorrect = 0;

  for (ulong s = 0; s < batchSize; s++) {
    const double* output = outputs.data() + s * outputSize;
    const double* expected = target + s * outputSize;
    double sampleLoss = 0;

    errorType = Trainer::calculateLoss(output, expected, outputSize, &sampleLoss);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }

    totalLoss += sampleLoss;

    if (outputSize == 1) {
      if (std::fabs(output[0] - expected[0]) < 0.5) {
        numCorrect++;
      }
    } else {
      auto predIdx = std::distance(output, std::max_element(output, output + outputSize));
      auto expIdx = std::distance(expected, std::max_element(expected, expected + outputSize));

      if (predIdx == expIdx) {
        numCorrect++;
      }
    }
  }

  result->numSamples = batchSize;
  result->totalLoss = totalLoss;
  result->averageLoss = totalLoss / static_cast<double>(batchSize);
  result->numCorrect = numCorrect;
  result->accuracy = static_cast<double>(numCorrect) / static_cast<double>(batchSize) * 100.0;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Trainer::calculateLoss(const double* output, const double* target, ulong size, double* loss) {
  if (output == nullptr || target == nullptr || loss == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "calculateLoss requires output, target and loss");
  }

  if (size == 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "cannot compute a loss over zero outputs");
  }

  double sum = 0;

  for (ulong i = 0; i < size; i++) {
    double diff = target[i] - output[i];
    sum += diff * diff;
  }

  *loss = sum / static_cast<double>(size);

  return ErrorType::SUCCESS;
}

//===================================================================================================================//
//-- Batch driver --//
//===================================================================================================================//

ErrorType Trainer::runBatch(Network* network, const double* input, const double* target, double* gradients,
                            ulong batchSize, int numThreads, double* loss, bool updateRunningStats) {
  if (batchSize == 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "batchSize must be greater than zero");
  }

  if (numThreads < 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "numThreads must not be negative");
  }

  ulong numWorkers = std::min(static_cast<ulong>(System::resolveNumThreads(numThreads)), batchSize);
  ulong chunkSize = (batchSize + numWorkers - 1) / numWorkers;

  std::vector<TrainingWorker> workers(numWorkers);

  // Seeds drawn in worker order keep dropout reproducible for a seeded network.
  for (TrainingWorker& worker : workers) {
    Trainer::allocateWorker(*network, worker);
    worker.rng.seed(network->getRng()());
  }

  bool wasTraining = network->isTraining();
  network->setTraining(true);

  const Network& model = *network;

  auto runWorker = [&](ulong w) {
    ulong begin = w * chunkSize;
    ulong end = std::min(begin + chunkSize, batchSize);
    TrainingWorker& worker = workers[w];

    worker.errorType = Trainer::processChunk(model, input, target, gradients, begin, end, batchSize, worker);

    if (worker.errorType != ErrorType::SUCCESS) {
      worker.errorMessage = Error::getLast();
    }
  };

  if (numWorkers == 1) {
    runWorker(0);
  } else {
    QVector<ulong> workerIndices(numWorkers);

    for (ulong w = 0; w < numWorkers; w++) {
      workerIndices[w] = w;
    }

    QThreadPool pool;
    pool.setMaxThreadCount(static_cast<int>(numWorkers));
    QtConcurrent::blockingMap(&pool, workerIndices, runWorker);
  }

  network->setTraining(wasTraining);

  for (const TrainingWorker& worker : workers) {
    if (worker.errorType != ErrorType::SUCCESS) {
      return Error::report(worker.errorType, "training worker failed: " + worker.errorMessage);
    }
  }

  Trainer::mergeWorkers(*network, workers);

  double totalLoss = 0;
  double forwardSeconds = 0;
  double backwardSeconds = 0;

  for (const TrainingWorker& worker : workers) {
    totalLoss += worker.accum_loss;
    forwardSeconds += worker.forwardSeconds;
    backwardSeconds += worker.backwardSeconds;
  }

  // Summed over workers, so these are busy times rather than wall times.
  Profiler::global().record(Profiler::forwardPass, forwardSeconds);
  Profiler::global().record(Profiler::backwardPass, backwardSeconds);

  *loss = totalLoss / static_cast<double>(batchSize);

  if (updateRunningStats) {
    Trainer::updateRunningStats(*network, workers, batchSize);
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

void Trainer::allocateWorker(const Network& network, TrainingWorker& worker) {
  ulong numLayers = network.getNumLayers();

  ForwardEngine::allocateCache(network, worker.cache);

  worker.dCost_dActvs.resize(numLayers);
  worker.dCost_dZs.resize(numLayers);
  worker.dCost_dLinears.resize(numLayers);
  worker.accum_dCost_dWeights.resize(numLayers);
  worker.accum_dCost_dBiases.resize(numLayers);
  worker.accum_dCost_dBnScale.resize(numLayers);
  worker.accum_dCost_dBnShift.resize(numLayers);
  worker.accum_linearSums.resize(numLayers);
  worker.accum_linearSquareSums.resize(numLayers);

  for (ulong l = 0; l < numLayers; l++) {
    const Layer& layer = network.getLayer(l);
    ulong numNeurons = layer.outputSize;
    ulong numBnNeurons = layer.hasBatchNorm() ? numNeurons : 0;

    worker.dCost_dActvs[l].resize(numNeurons);
    worker.dCost_dZs[l].resize(numNeurons);
    worker.dCost_dLinears[l].resize(numNeurons);
    worker.accum_dCost_dWeights[l].resize(layer.inputSize * numNeurons);
    worker.accum_dCost_dBiases[l].resize(numNeurons);
    worker.accum_dCost_dBnScale[l].resize(numBnNeurons);
    worker.accum_dCost_dBnShift[l].resize(numBnNeurons);
    worker.accum_linearSums[l].resize(numBnNeurons);
    worker.accum_linearSquareSums[l].resize(numBnNeurons);
  }

  Trainer::resetWorker(worker);
}

//===================================================================================================================//

void Trainer::resetWorker(TrainingWorker& worker) {
  Tensor2D<double>* accumulators[] = {&worker.accum_dCost_dWeights, &worker.accum_dCost_dBiases,
                                      &worker.accum_dCost_dBnScale, &worker.accum_dCost_dBnShift,
                                      &worker.accum_linearSums,     &worker.accum_linearSquareSums};

  for (Tensor2D<double>* accumulator : accumulators) {
    for (Tensor1D<double>& row : *accumulator) {
      std::fill(row.begin(), row.end(), 0.0);
    }
  }

  worker.accum_loss = 0;
  worker.forwardSeconds = 0;
  worker.backwardSeconds = 0;
  worker.errorType = ErrorType::SUCCESS;
  worker.errorMessage.clear();
}

//===================================================================================================================//

ErrorType Trainer::processChunk(const Network& network, const double* input, const double* target, double* gradients,
                                ulong begin, ulong end, ulong batchSize, TrainingWorker& worker) {
  ulong inputSize = network.getInputSize();
  ulong outputSize = network.getOutputSize();
  ulong numLayers = network.getNumLayers();
  double sampleWeight = 1.0 / static_cast<double>(batchSize);

  for (ulong s = begin; s < end; s++) {
    const double* sampleInput = input + s * inputSize;
    const double* sampleTarget = target + s * outputSize;
    double* outputGradient = (gradients != nullptr) ? gradients + s * outputSize : nullptr;

    auto forwardStart = std::chrono::steady_clock::now();

    ErrorType errorType = ForwardEngine::propagate(network, sampleInput, worker.cache, &worker.rng);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }

    auto backwardStart = std::chrono::steady_clock::now();
    worker.forwardSeconds += std::chrono::duration<double>(backwardStart - forwardStart).count();

    double sampleLoss = 0;
    errorType = Trainer::calculateLoss(worker.cache.actvs[numLayers - 1].data(), sampleTarget, outputSize, &sampleLoss);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }

    worker.accum_loss += sampleLoss;

    // Batch statistics of the pre-normalization values
    for (ulong l = 0; l < numLayers; l++) {
      std::vector<double>& sums = worker.accum_linearSums[l];
      std::vector<double>& squareSums = worker.accum_linearSquareSums[l];
      const std::vector<double>& linear = worker.cache.linears[l];

      for (ulong j = 0; j < sums.size(); j++) {
        sums[j] += linear[j];
        squareSums[j] += linear[j] * linear[j];
      }
    }

    errorType = Trainer::backpropagate(network, sampleInput, sampleTarget, outputGradient, sampleWeight, worker);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }

    worker.backwardSeconds +=
      std::chrono::duration<double>(std::chrono::steady_clock::now() - backwardStart).count();
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Trainer::backpropagate(const Network& network, const double* input, const double* target,
                                 double* outputGradient, double sampleWeight, TrainingWorker& worker) {
  ulong numLayers = network.getNumLayers();
  ulong outputSize = network.getOutputSize();
  const ForwardCache& cache = worker.cache;

  // dLoss/dOutput of the per-sample mean squared error
  const std::vector<double>& output = cache.actvs[numLayers - 1];
  std::vector<double>& dCost_dOutput = worker.dCost_dActvs[numLayers - 1];

  for (ulong j = 0; j < outputSize; j++) {
    dCost_dOutput[j] = 2.0 * (output[j] - target[j]) / static_cast<double>(outputSize);
  }

  if (outputGradient != nullptr) {
    std::copy(dCost_dOutput.begin(), dCost_dOutput.end(), outputGradient);
  }

  for (ulong l = numLayers; l-- > 0;) {
    const Layer& layer = network.getLayer(l);
    ulong numNeurons = layer.outputSize;
    ulong prevNumNeurons = layer.inputSize;

    std::vector<double>& dCost_dActvs = worker.dCost_dActvs[l];
    std::vector<double>& dCost_dZs = worker.dCost_dZs[l];
    std::vector<double>& dCost_dLinears = worker.dCost_dLinears[l];
    const std::vector<double>& mask = cache.dropoutMasks[l];

    if (!mask.empty()) {
      for (ulong j = 0; j < numNeurons; j++) {
        dCost_dActvs[j] *= mask[j];
      }
    }

    ErrorType errorType = ActvFunc::backward(cache.zs[l].data(), dCost_dActvs.data(), dCost_dZs.data(), numNeurons,
                                             layer.actvFuncType);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }

    // Normalization statistics are constants here; only scale and shift are learned.
    if (layer.hasBatchNorm()) {
      for (ulong j = 0; j < numNeurons; j++) {
        double invStd = 1.0 / std::sqrt(layer.bnVariance[j] + Network::batchNormEpsilon);
        double zHat = (cache.linears[l][j] - layer.bnMean[j]) * invStd;

        worker.accum_dCost_dBnScale[l][j] += dCost_dZs[j] * zHat * sampleWeight;
        worker.accum_dCost_dBnShift[l][j] += dCost_dZs[j] * sampleWeight;
        dCost_dLinears[j] = dCost_dZs[j] * layer.bnScale[j] * invStd;
      }
    } else {
      std::copy(dCost_dZs.begin(), dCost_dZs.end(), dCost_dLinears.begin());
    }

    const double* x = (l == 0) ? input : cache.actvs[l - 1].data();
    std::vector<double>& accumWeights = worker.accum_dCost_dWeights[l];
    std::vector<double>& accumBiases = worker.accum_dCost_dBiases[l];

    for (ulong j = 0; j < numNeurons; j++) {
      double delta = dCost_dLinears[j] * sampleWeight;
      accumBiases[j] += delta;

      for (ulong k = 0; k < prevNumNeurons; k++) {
        accumWeights[j * prevNumNeurons + k] += delta * x[k];
      }
    }

    if (l == 0) {
      break;
    }

    std::vector<double>& dCost_dPrevActvs = worker.dCost_dActvs[l - 1];

    for (ulong k = 0; k < prevNumNeurons; k++) {
      double sum = 0;

      for (ulong j = 0; j < numNeurons; j++) {
        sum += layer.weights[j * prevNumNeurons + k] * dCost_dLinears[j];
      }

      dCost_dPrevActvs[k] = sum;
    }
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

void Trainer::mergeWorkers(Network& network, const std::vector<TrainingWorker>& workers) {
  for (ulong l = 0; l < network.getNumLayers(); l++) {
    Layer& layer = network.getLayer(l);

    std::fill(layer.dCost_dWeights.begin(), layer.dCost_dWeights.end(), 0.0);
    std::fill(layer.dCost_dBiases.begin(), layer.dCost_dBiases.end(), 0.0);

    if (layer.hasBatchNorm()) {
      std::fill(layer.dCost_dBnScale.begin(), layer.dCost_dBnScale.end(), 0.0);
      std::fill(layer.dCost_dBnShift.begin(), layer.dCost_dBnShift.end(), 0.0);
    }

    for (const TrainingWorker& worker : workers) {
      for (ulong i = 0; i < layer.dCost_dWeights.size(); i++) {
        layer.dCost_dWeights[i] += worker.accum_dCost_dWeights[l][i];
      }

      for (ulong j = 0; j < layer.dCost_dBiases.size(); j++) {
        layer.dCost_dBiases[j] += worker.accum_dCost_dBiases[l][j];
      }

      if (layer.hasBatchNorm()) {
        for (ulong j = 0; j < layer.outputSize; j++) {
          layer.dCost_dBnScale[j] += worker.accum_dCost_dBnScale[l][j];
          layer.dCost_dBnShift[j] += worker.accum_dCost_dBnShift[l][j];
        }
      }
    }
  }
}

//===================================================================================================================//

void Trainer::updateRunningStats(Network& network, const std::vector<TrainingWorker>& workers, ulong batchSize) {
  // A single sample has no variance to learn from.
  if (batchSize < 2) {
    return;
  }

  double momentum = Network::batchNormMomentum;
  double n = static_cast<double>(batchSize);

  for (ulong l = 0; l < network.getNumLayers(); l++) {
    Layer& layer = network.getLayer(l);

    if (!layer.hasBatchNorm()) {
      continue;
    }

    for (ulong j = 0; j < layer.outputSize; j++) {
      double sum = 0;
      double squareSum = 0;

      for (const TrainingWorker& worker : workers) {
        sum += worker.accum_linearSums[l][j];
        squareSum += worker.accum_linearSquareSums[l][j];
      }

      double batchMean = sum / n;
      double batchVariance = std::max(0.0, squareSum / n - batchMean * batchMean);

      layer.bnMean[j] = (1.0 - momentum) * layer.bnMean[j] + momentum * batchMean;
      layer.bnVariance[j] = (1.0 - momentum) * layer.bnVariance[j] + momentum * batchVariance;
    }
  }
}
