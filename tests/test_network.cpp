#include "test_helpers.hpp"

#include <NC_Error.hpp>
#include <NC_MemoryManager.hpp>
#include <NC_Network.hpp>
#include <NC_System.hpp>

#include <climits>
#include <cmath>
#include <cstdint>

static NC::NetworkConfig makeConfig(ulong inputSize, std::vector<ulong> hiddenLayerSizes, ulong outputSize) {
  NC::NetworkConfig config;
  config.inputSize = inputSize;
  config.hiddenLayersCount = hiddenLayerSizes.size();
  config.hiddenLayerSizes = hiddenLayerSizes;
  config.outputSize = outputSize;
  config.seed = 7;
  return config;
}

static void testCreateShapes() {
  std::cout << "  testCreateShapes... ";

  NC::MemoryManager memoryManager;
  auto network = NC::Network::create(makeConfig(4, {3}, 2), memoryManager);

  CHECK(network != nullptr, "Create: network returned");
  if (!network) {
    std::cout << std::endl;
    return;
  }

  CHECK(network->getNumLayers() == 3, "Create: hidden count + 2 layers");

  const NC::Layer& first = network->getLayer(0);
  const NC::Layer& hidden = network->getLayer(1);
  const NC::Layer& last = network->getLayer(2);

  CHECK(first.inputSize == 4 && first.outputSize == 4, "Create: first layer maps input to input");
  CHECK(hidden.inputSize == 4 && hidden.outputSize == 3, "Create: hidden layer shape");
  CHECK(last.inputSize == 3 && last.outputSize == 2, "Create: output layer shape");
  CHECK(first.weights.size() == 16 && hidden.weights.size() == 12 && last.weights.size() == 6,
        "Create: weight counts");
  CHECK(last.biases.size() == 2, "Create: bias count");
  CHECK(network->getNumParameters() == 16 + 4 + 12 + 3 + 6 + 2, "Create: parameter count");
  CHECK(network->getMaxLayerWidth() == 4, "Create: max layer width");

  CHECK(first.actvFuncType == NC::ActvFuncType::RELU && last.actvFuncType == NC::ActvFuncType::RELU,
        "Create: default activations");
  CHECK(!network->isTraining(), "Create: starts in inference mode");
  CHECK(!first.hasBatchNorm(), "Create: batch normalization off by default");

  CHECK(NC::Network::destroy(network) == NC::ErrorType::SUCCESS, "Destroy: success");
  std::cout << std::endl;
}

static void testXavierBounds() {
  std::cout << "  testXavierBounds... ";

  NC::MemoryManager memoryManager;
  auto network = NC::Network::create(makeConfig(10, {20, 5}, 3), memoryManager);

  CHECK(network != nullptr, "Xavier: network returned");
  if (!network) {
    std::cout << std::endl;
    return;
  }

  bool withinBounds = true;
  bool biasesZero = true;
  bool anyNonZero = false;

  for (ulong l = 0; l < network->getNumLayers(); l++) {
    const NC::Layer& layer = network->getLayer(l);
    double limit = std::sqrt(2.0 / static_cast<double>(layer.inputSize + layer.outputSize));

    for (double weight : layer.weights) {
      if (std::fabs(weight) > limit) withinBounds = false;
      if (weight != 0.0) anyNonZero = true;
    }

    for (double bias : layer.biases) {
      if (bias != 0.0) biasesZero = false;
    }
  }

  CHECK(withinBounds, "Xavier: weights within +-sqrt(2 / (fanIn + fanOut))");
  CHECK(anyNonZero, "Xavier: weights are randomized");
  CHECK(biasesZero, "Xavier: biases start at zero");

  // Same seed, same weights
  auto twin = NC::Network::create(makeConfig(10, {20, 5}, 3), memoryManager);
  CHECK(twin != nullptr, "Xavier: twin network returned");
  if (twin) {
    CHECK(twin->getLayer(1).weights[7] == network->getLayer(1).weights[7], "Xavier: seeded initialization repeats");
    CHECK(NC::Network::destroy(twin) == NC::ErrorType::SUCCESS, "Xavier: destroy twin");
  }

  CHECK(NC::Network::destroy(network) == NC::ErrorType::SUCCESS, "Xavier: destroy");
  std::cout << std::endl;
}

static void testNoLeakAfterDestroy() {
  std::cout << "  testNoLeakAfterDestroy... ";

  NC::MemoryManager memoryManager;
  NC::NetworkConfig config = makeConfig(6, {8, 8}, 2);
  config.useBatchNormalization = true;

  auto network = NC::Network::create(config, memoryManager);
  CHECK(network != nullptr, "No leak: network returned");
  CHECK(memoryManager.liveAllocations() > 0, "No leak: buffers allocated");

  if (network) {
    CHECK(network->getLayer(0).hasBatchNorm(), "No leak: batch normalization on hidden layers");
    CHECK(!network->getLayer(network->getNumLayers() - 1).hasBatchNorm(), "No leak: output layer not normalized");
  }

  CHECK(NC::Network::destroy(network) == NC::ErrorType::SUCCESS, "No leak: destroy");
  CHECK(network == nullptr, "No leak: handle cleared");
  CHECK(memoryManager.liveAllocations() == 0, "No leak: no live allocations");
  CHECK(memoryManager.stats().usedMemory == 0, "No leak: no memory in use");

  CHECK(NC::Network::destroy(network) == NC::ErrorType::NULL_POINTER, "Destroy twice: NULL_POINTER");
  std::cout << std::endl;
}

static void testCreateInvalidConfig() {
  std::cout << "  testCreateInvalidConfig... ";

  NC::MemoryManager memoryManager;

  CHECK(NC::Network::create(makeConfig(0, {3}, 2), memoryManager) == nullptr, "Invalid: zero input size");
  CHECK(NC::Error::getLastType() == NC::ErrorType::INVALID_ARGUMENT, "Invalid: zero input size error type");

  CHECK(NC::Network::create(makeConfig(4, {3, 0}, 2), memoryManager) == nullptr, "Invalid: zero-width hidden layer");

  NC::NetworkConfig mismatched = makeConfig(4, {3}, 2);
  mismatched.hiddenLayersCount = 2;
  CHECK(NC::Network::create(mismatched, memoryManager) == nullptr, "Invalid: hidden count mismatch");

  NC::NetworkConfig badDropout = makeConfig(4, {3}, 2);
  badDropout.dropoutRate = 1.0;
  CHECK(NC::Network::create(badDropout, memoryManager) == nullptr, "Invalid: dropout rate of one");

  NC::NetworkConfig unknownActv = makeConfig(4, {3}, 2);
  unknownActv.outputActvFuncType = NC::ActvFuncType::UNKNOWN;
  CHECK(NC::Network::create(unknownActv, memoryManager) == nullptr, "Invalid: unknown activation");

  CHECK(memoryManager.liveAllocations() == 0, "Invalid: nothing allocated");
  std::cout << std::endl;
}

static void testCreateRejectsOversizedShapes() {
  std::cout << "  testCreateRejectsOversizedShapes... ";

  NC::MemoryManager memoryManager;

  // Layer 0 is inputSize x inputSize, whose element count wraps around
  CHECK(NC::Network::create(makeConfig((1UL << 61) + 1, {}, 1), memoryManager) == nullptr,
        "Oversized: wrapping input layer rejected");
  CHECK(NC::Error::getLastType() == NC::ErrorType::INVALID_ARGUMENT, "Oversized: wrapping input layer error type");

  // No wrap in the element count, but the byte count would
  CHECK(NC::Network::create(makeConfig(4, {ULONG_MAX / 16}, 1), memoryManager) == nullptr,
        "Oversized: hidden layer bytes overflow rejected");
  CHECK(NC::Error::getLastType() == NC::ErrorType::INVALID_ARGUMENT, "Oversized: hidden layer error type");

  CHECK(NC::Network::create(makeConfig(2, {2}, ULONG_MAX / 2), memoryManager) == nullptr,
        "Oversized: output layer rejected");

  CHECK(memoryManager.stats().allocationCount == 0, "Oversized: nothing allocated");
  std::cout << std::endl;
}

static void testConfiguredAlignment() {
  std::cout << "  testConfiguredAlignment... ";

  NC::OptimizationConfig saved = NC::System::getOptimizationConfig();
  NC::OptimizationConfig wide = saved;
  wide.memoryAlignment = 256;
  wide.cacheLineSize = 128;
  CHECK(NC::System::setOptimizationConfig(wide) == NC::ErrorType::SUCCESS, "Alignment: set 256 bytes");

  NC::MemoryManager memoryManager;
  NC::NetworkConfig config = makeConfig(3, {5}, 2);
  config.useBatchNormalization = true;
  auto network = NC::Network::create(config, memoryManager);

  CHECK(NC::System::setOptimizationConfig(saved) == NC::ErrorType::SUCCESS, "Alignment: restore config");

  CHECK(network != nullptr, "Alignment: network returned");
  if (!network) {
    std::cout << std::endl;
    return;
  }

  auto aligned = [](const void* ptr) { return reinterpret_cast<std::uintptr_t>(ptr) % 256 == 0; };

  bool allAligned = aligned(network->getInputBuffer()) && aligned(network->getOutputBuffer()) &&
                    aligned(network->getGradientBuffer());

  for (ulong l = 0; l < network->getNumLayers(); l++) {
    const NC::Layer& layer = network->getLayer(l);
    allAligned = allAligned && aligned(layer.weights.data()) && aligned(layer.biases.data()) &&
                 aligned(layer.weightVelocities.data()) && aligned(layer.dCost_dBiases.data());

    if (layer.hasBatchNorm()) {
      allAligned = allAligned && aligned(layer.bnMean.data()) && aligned(layer.bnShift.data());
    }
  }

  CHECK(network->getAlignment() == 256, "Alignment: larger of alignment and cache line");
  CHECK(allAligned, "Alignment: every buffer on a 256-byte boundary");
  CHECK(network->getLayer(0).hasBatchNorm(), "Alignment: batch norm buffers checked");

  NC::OptimizationConfig oddCacheLine = saved;
  oddCacheLine.cacheLineSize = 48;
  CHECK(NC::System::setOptimizationConfig(oddCacheLine) == NC::ErrorType::INVALID_ARGUMENT,
        "Alignment: cache line size must be a power of two");

  CHECK(NC::Network::destroy(network) == NC::ErrorType::SUCCESS, "Alignment: destroy");
  std::cout << std::endl;
}

static void testResolveSeed() {
  std::cout << "  testResolveSeed... ";

  CHECK(NC::Network::resolveSeed(42) == 42, "Seed: nonzero seed kept");

  // Two draws from std::random_device colliding is a one in 2^32 event
  CHECK(NC::Network::resolveSeed(0) != NC::Network::resolveSeed(0), "Seed: zero draws a fresh seed");
  std::cout << std::endl;
}

static void testRollbackOnAllocationFailure() {
  std::cout << "  testRollbackOnAllocationFailure... ";

  // Enough for the first layers, not for the whole network
  NC::MemoryManager memoryManager(2000);
  auto network = NC::Network::create(makeConfig(8, {16, 16}, 4), memoryManager);

  CHECK(network == nullptr, "Rollback: creation fails");
  CHECK(NC::Error::getLastType() == NC::ErrorType::MEMORY_ALLOCATION, "Rollback: MEMORY_ALLOCATION");
  CHECK(memoryManager.liveAllocations() == 0, "Rollback: partial allocations released");
  CHECK(memoryManager.stats().usedMemory == 0, "Rollback: no memory in use");
  CHECK(memoryManager.stats().allocationCount > 0, "Rollback: some allocations were made first");
  std::cout << std::endl;
}

static void testSetters() {
  std::cout << "  testSetters... ";

  NC::MemoryManager memoryManager;
  auto network = NC::Network::create(makeConfig(2, {2}, 1), memoryManager);

  CHECK(network != nullptr, "Setters: network returned");
  if (!network) {
    std::cout << std::endl;
    return;
  }

  CHECK(network->setLearningRate(0.5) == NC::ErrorType::SUCCESS, "Setters: learning rate");
  CHECK(network->getConfig().learningRate == 0.5, "Setters: learning rate stored");
  CHECK(network->setLearningRate(-1.0) == NC::ErrorType::INVALID_ARGUMENT, "Setters: negative learning rate");
  CHECK(network->setMomentum(1.0) == NC::ErrorType::INVALID_ARGUMENT, "Setters: momentum of one");
  CHECK(network->setDropout(true, 0.25) == NC::ErrorType::SUCCESS, "Setters: dropout");
  CHECK(network->setDropout(true, 1.5) == NC::ErrorType::INVALID_ARGUMENT, "Setters: dropout out of range");

  CHECK(network->setLayerActvFunc(2, NC::ActvFuncType::SIGMOID) == NC::ErrorType::SUCCESS, "Setters: activation");
  CHECK(network->getLayer(2).actvFuncType == NC::ActvFuncType::SIGMOID, "Setters: activation stored");
  CHECK(network->setLayerActvFunc(3, NC::ActvFuncType::SIGMOID) == NC::ErrorType::INVALID_ARGUMENT,
        "Setters: activation layer out of range");

  CHECK(network->setParameters(1, {1, 2, 3, 4}, {0.5, -0.5}) == NC::ErrorType::SUCCESS, "Setters: parameters");
  CHECK(network->getLayer(1).weights[2] == 3 && network->getLayer(1).biases[1] == -0.5, "Setters: parameters stored");
  CHECK(network->setParameters(1, {1, 2, 3}, {0.5, -0.5}) == NC::ErrorType::INVALID_ARGUMENT,
        "Setters: wrong weight count");
  CHECK(network->getLayer(1).weights[2] == 3, "Setters: rejected parameters leave weights untouched");

  CHECK(network->setBatchNormParameters(0, {0, 0}, {1, 1}, {1, 1}, {0, 0}) == NC::ErrorType::INVALID_OPERATION,
        "Setters: batch norm parameters need batch norm");

  ulong before = memoryManager.liveAllocations();
  CHECK(network->setBatchNormalization(true) == NC::ErrorType::SUCCESS, "Setters: enable batch norm");
  CHECK(memoryManager.liveAllocations() == before + 12, "Setters: batch norm buffers on two hidden layers");
  CHECK(network->setBatchNormParameters(0, {0, 0}, {1, 4}, {1, 1}, {0, 0}) == NC::ErrorType::SUCCESS,
        "Setters: batch norm parameters");
  CHECK(network->getLayer(0).bnVariance[1] == 4, "Setters: batch norm parameters stored");
  CHECK(network->setBatchNormalization(false) == NC::ErrorType::SUCCESS, "Setters: disable batch norm");
  CHECK(memoryManager.liveAllocations() == before, "Setters: batch norm buffers released");

  network->setTraining(true);
  CHECK(network->isTraining(), "Setters: training mode");
  network->setTraining(false);
  CHECK(!network->isTraining(), "Setters: inference mode");

  CHECK(NC::Network::destroy(network) == NC::ErrorType::SUCCESS, "Setters: destroy");
  std::cout << std::endl;
}

void runNetworkTests() {
  testCreateShapes();
  testXavierBounds();
  testCreateRejectsOversizedShapes();
  testConfiguredAlignment();
  testResolveSeed();
  testNoLeakAfterDestroy();
  testCreateInvalidConfig();
  testRollbackOnAllocationFailure();
  testSetters();
}
