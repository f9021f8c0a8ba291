#ifndef NC_NETWORK_HPP
#define NC_NETWORK_HPP

#include "NC_ActvFunc.hpp"
#include "NC_Buffer.hpp"
#include "NC_Error.hpp"
#include "NC_MemoryManager.hpp"
#include "NC_NetworkConfig.hpp"

#include <sys/types.h>

#include <memory>
#include <random>
#include <vector>

//===================================================================================================================//

namespace NC {
  // Weights are row-major by output neuron: weights[j * inputSize + k] connects input k to output j.
  struct Layer {
    ulong inputSize = 0;
    ulong outputSize = 0;
    ActvFuncType actvFuncType = ActvFuncType::RELU;
    bool isTraining = false;

    Buffer<double> weights;
    Buffer<double> biases;

    //-- Training state --//
    Buffer<double> dCost_dWeights;
    Buffer<double> dCost_dBiases;
    Buffer<double> weightVelocities;
    Buffer<double> biasVelocities;

    //-- Batch normalization (allocated only while enabled) --//
    Buffer<double> bnMean;
    Buffer<double> bnVariance;
    Buffer<double> bnScale;
    Buffer<double> bnShift;
    Buffer<double> dCost_dBnScale;
    Buffer<double> dCost_dBnShift;

    bool hasBatchNorm() const { return !this->bnScale.empty(); }
  };

  class Network {
    public:
      static constexpr double batchNormEpsilon = 1e-5;
      static constexpr double batchNormMomentum = 0.1;

      //-- Lifecycle --//
      // Returns nullptr with the reason in Error::getLast() when the config is invalid or memory runs out.
      // Nothing allocated by a failed call stays registered with the memory manager.
      static std::unique_ptr<Network> create(const NetworkConfig& config, MemoryManager& memoryManager);

      // Releases every buffer and resets the handle. NULL_POINTER for an empty handle.
      static ErrorType destroy(std::unique_ptr<Network>& network);

      // Also rejects shapes whose weight arrays could not be addressed in bytes.
      static ErrorType validate(const NetworkConfig& config);

      // Nonzero seeds are kept; 0 draws one from std::random_device.
      static ulong resolveSeed(ulong seed);

      ~Network();

      Network(const Network&) = delete;
      Network& operator=(const Network&) = delete;

      //-- Configuration --//
      ErrorType setBatchNormalization(bool enabled);
      ErrorType setDropout(bool enabled, double rate);
      ErrorType setLearningRate(double learningRate);
      ErrorType setMomentum(double momentum);
      void setTraining(bool isTraining);
      bool isTraining() const;
      ErrorType setLayerActvFunc(ulong layerIndex, ActvFuncType actvFuncType);

      // Replaces one layer's parameters. Sizes must match the layer's shape.
      ErrorType setParameters(ulong layerIndex, const std::vector<double>& weights, const std::vector<double>& biases);

      // Replaces one layer's batch normalization state. Batch normalization must be enabled.
      ErrorType setBatchNormParameters(ulong layerIndex, const std::vector<double>& mean, const std::vector<double>& variance,
                                       const std::vector<double>& scale, const std::vector<double>& shift);

      //-- Access --//
      const NetworkConfig& getConfig() const { return this->config; }
      MemoryManager& getMemoryManager() const { return this->memoryManager; }

      ulong getNumLayers() const { return this->layers.size(); }
      const Layer& getLayer(ulong layerIndex) const { return this->layers[layerIndex]; }
      Layer& getLayer(ulong layerIndex) { return this->layers[layerIndex]; }

      ulong getInputSize() const { return this->config.inputSize; }
      ulong getOutputSize() const { return this->config.outputSize; }
      ulong getMaxLayerWidth() const { return this->maxLayerWidth; }
      ulong getNumParameters() const;

      ulong getAlignment() const { return this->alignment; }

      //-- Working buffers (used by ForwardEngine::forwardPass) --//
      double* getInputBuffer() { return this->inputBuffer.data(); }
      double* getOutputBuffer() { return this->outputBuffer.data(); }
      double* getGradientBuffer() { return this->gradientBuffer.data(); }

      // Source of dropout masks and worker seeds
      std::mt19937& getRng() { return this->rng; }

    private:
      Network(const NetworkConfig& config, MemoryManager& memoryManager);

      NetworkConfig config;
      MemoryManager& memoryManager;
      std::vector<Layer> layers;
      ulong maxLayerWidth = 0;
      ulong alignment;  // From the System optimization config at creation
      std::mt19937 rng;

      Buffer<double> inputBuffer;
      Buffer<double> outputBuffer;
      Buffer<double> gradientBuffer;

      //-- Construction steps --//
      ErrorType buildLayers();
      ErrorType allocateLayer(Layer& layer);
      ErrorType allocateBatchNorm(Layer& layer);
      ErrorType allocateWorkingBuffers();
      void initializeWeights(Layer& layer);

      //-- Teardown --//
      ErrorType releaseBatchNorm(Layer& layer);
      ErrorType releaseAll();
  };
}

#endif // NC_NETWORK_HPP
