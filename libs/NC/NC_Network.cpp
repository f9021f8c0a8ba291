#include "NC_Network.hpp"
#include "NC_System.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <iostream>
#include <new>
#include <string>

using namespace NC;

//===================================================================================================================//

namespace {
  // Keeps the first failure while letting every release run.
  void keepFirst(ErrorType& result, ErrorType errorType) {
    if (result == ErrorType::SUCCESS && errorType != ErrorType::SUCCESS) {
      result = errorType;
    }
  }

  ErrorType copyInto(const std::vector<double>& source, Buffer<double>& destination, const std::string& name) {
    if (source.size() != destination.size()) {
      return Error::report(ErrorType::INVALID_ARGUMENT, name + " has " + std::to_string(source.size()) +
                                                          " values, expected " + std::to_string(destination.size()));
    }

    std::copy(source.begin(), source.end(), destination.begin());

    return ErrorType::SUCCESS;
  }
}

//===================================================================================================================//
//-- Lifecycle --//
//===================================================================================================================//

std::unique_ptr<Network> Network::create(const NetworkConfig& config, MemoryManager& memoryManager) {
  if (Network::validate(config) != ErrorType::SUCCESS) {
    return nullptr;
  }

  std::unique_ptr<Network> network;

  try {
    network.reset(new Network(config, memoryManager));

    ErrorType errorType = network->buildLayers();

    if (errorType == ErrorType::SUCCESS) {
      errorType = network->allocateWorkingBuffers();
    }

    if (errorType != ErrorType::SUCCESS) {
      std::string reason = Error::getLast();

      if (network->releaseAll() != ErrorType::SUCCESS && config.logLevel >= LogLevel::ERROR) {
        std::cerr << "Error: rollback after failed network creation: " << Error::getLast() << "\n";
      }

      Error::report(errorType, "network creation rolled back (" + reason + ")");
      return nullptr;
    }
  } catch (const std::bad_alloc&) {
    // Buffers already handed out are returned by the Network destructor as the handle unwinds.
    Error::report(ErrorType::MEMORY_ALLOCATION, "out of memory while building the layer arena");
    return nullptr;
  }

  if (config.logLevel >= LogLevel::DEBUG) {
    std::cout << "Network created: " << network->getNumLayers() << " layers, " << network->getNumParameters()
              << " parameters\n";
  }

  return network;
}

//===================================================================================================================//

ErrorType Network::destroy(std::unique_ptr<Network>& network) {
  if (!network) {
    return Error::report(ErrorType::NULL_POINTER, "network was already destroyed or never created");
  }

  ErrorType errorType = network->releaseAll();
  network.reset();

  return errorType;
}

//===================================================================================================================//

ErrorType Network::validate(const NetworkConfig& config) {
  if (config.inputSize == 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "inputSize must be greater than zero");
  }

  if (config.outputSize == 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "outputSize must be greater than zero");
  }

  if (config.hiddenLayerSizes.size() != config.hiddenLayersCount) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "hiddenLayersCount is " + std::to_string(config.hiddenLayersCount) +
                                                        " but " + std::to_string(config.hiddenLayerSizes.size()) +
                                                        " hidden layer sizes were given");
  }

  for (ulong i = 0; i < config.hiddenLayerSizes.size(); i++) {
    if (config.hiddenLayerSizes[i] == 0) {
      return Error::report(ErrorType::INVALID_ARGUMENT, "hidden layer " + std::to_string(i) + " has zero neurons");
    }
  }

  // Layer shapes in construction order: inputSize x inputSize, then each hidden size, then outputSize
  const ulong maxElements = ULONG_MAX / sizeof(double);
  ulong prevSize = config.inputSize;
  std::vector<ulong> layerSizes = {config.inputSize};
  layerSizes.insert(layerSizes.end(), config.hiddenLayerSizes.begin(), config.hiddenLayerSizes.end());
  layerSizes.push_back(config.outputSize);

  for (ulong l = 0; l < layerSizes.size(); l++) {
    ulong size = layerSizes[l];

    if (size > maxElements / prevSize) {
      return Error::report(ErrorType::INVALID_ARGUMENT, "layer " + std::to_string(l) + " shape " +
                                                          std::to_string(prevSize) + "x" + std::to_string(size) +
                                                          " is too large to address");
    }

    prevSize = size;
  }

  if (!std::isfinite(config.learningRate) || config.learningRate < 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "learningRate must be a finite, non-negative number");
  }

  if (!(config.momentum >= 0 && config.momentum < 1)) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "momentum must be in [0, 1)");
  }

  if (!(config.dropoutRate >= 0 && config.dropoutRate < 1)) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "dropoutRate must be in [0, 1)");
  }

  if (config.maxBatchSize == 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "maxBatchSize must be greater than zero");
  }

  if (config.hiddenActvFuncType == ActvFuncType::UNKNOWN || config.outputActvFuncType == ActvFuncType::UNKNOWN) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "unknown activation function in network config");
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

Network::Network(const NetworkConfig& config, MemoryManager& memoryManager)
    : config(config), memoryManager(memoryManager),
      alignment(std::max(System::getOptimizationConfig().memoryAlignment,
                         System::getOptimizationConfig().cacheLineSize)),
      rng(static_cast<std::mt19937::result_type>(Network::resolveSeed(config.seed))) {}

//===================================================================================================================//

ulong Network::resolveSeed(ulong seed) {
  return (seed != 0) ? seed : std::random_device{}();
}

//===================================================================================================================//

Network::~Network() {
  // Destructors cannot report, so a failed release is only logged.
  if (this->releaseAll() != ErrorType::SUCCESS && this->config.logLevel >= LogLevel::ERROR) {
    std::cerr << "Error: releasing network buffers: " << Error::getLast() << "\n";
  }
}

//===================================================================================================================//
//-- Configuration --//
//===================================================================================================================//

ErrorType Network::setBatchNormalization(bool enabled) {
  ulong numLayers = this->layers.size();

  if (enabled) {
    // The output layer is never normalized.
    for (ulong l = 0; l + 1 < numLayers; l++) {
      if (this->layers[l].hasBatchNorm()) {
        continue;
      }

      ErrorType errorType = this->allocateBatchNorm(this->layers[l]);

      if (errorType != ErrorType::SUCCESS) {
        std::string reason = Error::getLast();

        for (Layer& layer : this->layers) {
          if (this->releaseBatchNorm(layer) != ErrorType::SUCCESS) {
            return Error::getLastType();
          }
        }

        this->config.useBatchNormalization = false;
        return Error::report(errorType, reason);
      }
    }
  } else {
    ErrorType result = ErrorType::SUCCESS;

    for (Layer& layer : this->layers) {
      keepFirst(result, this->releaseBatchNorm(layer));
    }

    if (result != ErrorType::SUCCESS) {
      return result;
    }
  }

  this->config.useBatchNormalization = enabled;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Network::setDropout(bool enabled, double rate) {
  if (!(rate >= 0 && rate < 1)) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "dropout rate must be in [0, 1), got " + std::to_string(rate));
  }

  this->config.useDropout = enabled;
  this->config.dropoutRate = rate;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Network::setLearningRate(double learningRate) {
  if (!std::isfinite(learningRate) || learningRate < 0) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "learningRate must be a finite, non-negative number");
  }

  this->config.learningRate = learningRate;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Network::setMomentum(double momentum) {
  if (!(momentum >= 0 && momentum < 1)) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "momentum must be in [0, 1)");
  }

  this->config.momentum = momentum;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

void Network::setTraining(bool isTraining) {
  for (Layer& layer : this->layers) {
    layer.isTraining = isTraining;
  }
}

//===================================================================================================================//

bool Network::isTraining() const {
  return !this->layers.empty() && this->layers.front().isTraining;
}

//===================================================================================================================//

ErrorType Network::setLayerActvFunc(ulong layerIndex, ActvFuncType actvFuncType) {
  if (layerIndex >= this->layers.size()) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "layer index " + std::to_string(layerIndex) + " out of range");
  }

  if (actvFuncType == ActvFuncType::UNKNOWN) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "unknown activation function");
  }

  this->layers[layerIndex].actvFuncType = actvFuncType;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Network::setParameters(ulong layerIndex, const std::vector<double>& weights, const std::vector<double>& biases) {
  if (layerIndex >= this->layers.size()) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "layer index " + std::to_string(layerIndex) + " out of range");
  }

  Layer& layer = this->layers[layerIndex];

  // Check both before writing either
  if (weights.size() != layer.weights.size() || biases.size() != layer.biases.size()) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "layer " + std::to_string(layerIndex) + " expects " +
                                                        std::to_string(layer.weights.size()) + " weights and " +
                                                        std::to_string(layer.biases.size()) + " biases");
  }

  ErrorType errorType = copyInto(weights, layer.weights, "weights");

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  return copyInto(biases, layer.biases, "biases");
}

//===================================================================================================================//

ErrorType Network::setBatchNormParameters(ulong layerIndex, const std::vector<double>& mean,
                                          const std::vector<double>& variance, const std::vector<double>& scale,
                                          const std::vector<double>& shift) {
  if (layerIndex >= this->layers.size()) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "layer index " + std::to_string(layerIndex) + " out of range");
  }

  Layer& layer = this->layers[layerIndex];

  if (!layer.hasBatchNorm()) {
    return Error::report(ErrorType::INVALID_OPERATION, "batch normalization is not enabled on layer " +
                                                         std::to_string(layerIndex));
  }

  ulong size = layer.outputSize;

  if (mean.size() != size || variance.size() != size || scale.size() != size || shift.size() != size) {
    return Error::report(ErrorType::INVALID_ARGUMENT, "batch normalization parameters of layer " +
                                                        std::to_string(layerIndex) + " need " + std::to_string(size) +
                                                        " values each");
  }

  for (double value : variance) {
    if (!(value >= 0)) {
      return Error::report(ErrorType::INVALID_ARGUMENT, "batch normalization variance must be non-negative");
    }
  }

  std::copy(mean.begin(), mean.end(), layer.bnMean.begin());
  std::copy(variance.begin(), variance.end(), layer.bnVariance.begin());
  std::copy(scale.begin(), scale.end(), layer.bnScale.begin());
  std::copy(shift.begin(), shift.end(), layer.bnShift.begin());

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ulong Network::getNumParameters() const {
  ulong numParameters = 0;

  for (const Layer& layer : this->layers) {
    numParameters += layer.inputSize * layer.outputSize + layer.outputSize;
  }

  return numParameters;
}

//===================================================================================================================//
//-- Construction steps --//
//===================================================================================================================//

ErrorType Network::buildLayers() {
  // Input-adjacent layer, hidden layers, output-adjacent layer
  ulong numLayers = this->config.hiddenLayersCount + 2;
  this->layers.resize(numLayers);

  ulong prevSize = this->config.inputSize;
  this->maxLayerWidth = this->config.inputSize;

  for (ulong l = 0; l < numLayers; l++) {
    Layer& layer = this->layers[l];
    bool isOutputLayer = (l == numLayers - 1);

    layer.inputSize = prevSize;

    if (l == 0) {
      layer.outputSize = this->config.inputSize;
    } else if (isOutputLayer) {
      layer.outputSize = this->config.outputSize;
    } else {
      layer.outputSize = this->config.hiddenLayerSizes[l - 1];
    }

    layer.actvFuncType = isOutputLayer ? this->config.outputActvFuncType : this->config.hiddenActvFuncType;

    ErrorType errorType = this->allocateLayer(layer);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }

    this->initializeWeights(layer);

    if (this->config.useBatchNormalization && !isOutputLayer) {
      errorType = this->allocateBatchNorm(layer);

      if (errorType != ErrorType::SUCCESS) {
        return errorType;
      }
    }

    this->maxLayerWidth = std::max(this->maxLayerWidth, layer.outputSize);
    prevSize = layer.outputSize;
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Network::allocateLayer(Layer& layer) {
  ulong numWeights = layer.inputSize * layer.outputSize;

  Buffer<double>* weightShaped[] = {&layer.weights, &layer.dCost_dWeights, &layer.weightVelocities};
  Buffer<double>* biasShaped[] = {&layer.biases, &layer.dCost_dBiases, &layer.biasVelocities};

  for (Buffer<double>* buffer : weightShaped) {
    ErrorType errorType = buffer->allocate(this->memoryManager, numWeights, this->alignment);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }
  }

  for (Buffer<double>* buffer : biasShaped) {
    ErrorType errorType = buffer->allocate(this->memoryManager, layer.outputSize, this->alignment);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Network::allocateBatchNorm(Layer& layer) {
  Buffer<double>* buffers[] = {&layer.bnMean, &layer.bnVariance, &layer.bnScale,
                               &layer.bnShift, &layer.dCost_dBnScale, &layer.dCost_dBnShift};

  for (Buffer<double>* buffer : buffers) {
    ErrorType errorType = buffer->allocate(this->memoryManager, layer.outputSize, this->alignment);

    if (errorType != ErrorType::SUCCESS) {
      return errorType;
    }
  }

  // Identity transform until statistics are learned
  std::fill(layer.bnVariance.begin(), layer.bnVariance.end(), 1.0);
  std::fill(layer.bnScale.begin(), layer.bnScale.end(), 1.0);

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Network::allocateWorkingBuffers() {
  ErrorType errorType = this->inputBuffer.allocate(this->memoryManager, this->maxLayerWidth, this->alignment);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  errorType = this->outputBuffer.allocate(this->memoryManager, this->maxLayerWidth, this->alignment);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  return this->gradientBuffer.allocate(this->memoryManager, this->maxLayerWidth, this->alignment);
}

//===================================================================================================================//

void Network::initializeWeights(Layer& layer) {
  // Xavier/Glorot uniform
  double limit = std::sqrt(2.0 / static_cast<double>(layer.inputSize + layer.outputSize));
  std::uniform_real_distribution<double> dist(-limit, limit);

  for (double& weight : layer.weights) {
    weight = dist(this->rng);
  }
}

//===================================================================================================================//
//-- Teardown --//
//===================================================================================================================//

ErrorType Network::releaseBatchNorm(Layer& layer) {
  ErrorType result = ErrorType::SUCCESS;

  keepFirst(result, layer.dCost_dBnShift.release());
  keepFirst(result, layer.dCost_dBnScale.release());
  keepFirst(result, layer.bnShift.release());
  keepFirst(result, layer.bnScale.release());
  keepFirst(result, layer.bnVariance.release());
  keepFirst(result, layer.bnMean.release());

  return result;
}

//===================================================================================================================//

ErrorType Network::releaseAll() {
  ErrorType result = ErrorType::SUCCESS;

  // Layers newest first, then the arena, then the working buffers
  for (auto it = this->layers.rbegin(); it != this->layers.rend(); ++it) {
    keepFirst(result, this->releaseBatchNorm(*it));
    keepFirst(result, it->biasVelocities.release());
    keepFirst(result, it->weightVelocities.release());
    keepFirst(result, it->dCost_dBiases.release());
    keepFirst(result, it->dCost_dWeights.release());
    keepFirst(result, it->biases.release());
    keepFirst(result, it->weights.release());
  }

  this->layers.clear();

  keepFirst(result, this->gradientBuffer.release());
  keepFirst(result, this->outputBuffer.release());
  keepFirst(result, this->inputBuffer.release());

  return result;
}
