#ifndef NC_CLI_LOADER_HPP
#define NC_CLI_LOADER_HPP

#include <NC_LogLevel.hpp>
#include <NC_MemoryManager.hpp>
#include <NC_Network.hpp>
#include <NC_Types.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace NC_CLI {

struct TrainingConfig {
  ulong numEpochs = 100;
  ulong batchSize = 0;  // 0 = the network's maxBatchSize
  bool shuffleSamples = true;
};

struct RunConfig {
  std::string mode = "predict";  // "train", "test", "predict"
  int numThreads = 0;            // 0 = all available cores
  ulong progressReports = 10;    // Epoch lines printed during training; 0 = none
  TrainingConfig trainingConfig;
  bool isBinaryModel = false;    // Config path is a .bin model
  bool hasParameters = false;
  nlohmann::json json;           // Whole config document (JSON configs only)
};

class Loader {
public:
  // Load the run configuration with optional CLI overrides. A path ending in .bin is a binary
  // model: it carries parameters but no run settings, so those keep their defaults.
  static RunConfig loadConfig(const std::string& configFilePath,
                              std::optional<std::string> modeOverride = std::nullopt,
                              std::optional<int> numThreadsOverride = std::nullopt);

  // Build the network described by a loaded config
  static std::unique_ptr<NC::Network> loadNetwork(const std::string& configFilePath, const RunConfig& runConfig,
                                                  NC::MemoryManager& memoryManager, NC::LogLevel logLevel);

  // Load samples from JSON ({"samples": [{"input": [...], "output": [...]}]}), checking their sizes
  static NC::Samples<double> loadSamples(const std::string& samplesFilePath, ulong inputSize, ulong outputSize);

  // Load inputs from JSON ({"inputs": [[...], ...]}), checking their sizes
  static std::vector<NC::Input<double>> loadInputs(const std::string& inputFilePath, ulong inputSize);

  static bool isBinaryPath(const std::string& filePath);

private:
  static nlohmann::json readJson(const std::string& filePath, const std::string& description);
};

} // namespace NC_CLI

#endif // NC_CLI_LOADER_HPP
