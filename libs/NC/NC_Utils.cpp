#include "NC_Utils.hpp"

#include <QByteArray>
#include <QFile>

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

using namespace NC;

//===================================================================================================================//

namespace {
  // Upper bound on hidden layers accepted from a file, so a corrupt header cannot trigger a huge allocation.
  constexpr uint64_t maxHiddenLayers = 1 << 16;

  ErrorType readDoubles(std::ifstream& stream, std::vector<double>& values, ulong count,
                        double (*readDouble)(std::ifstream&)) {
    values.resize(count);

    for (ulong i = 0; i < count; i++) {
      values[i] = readDouble(stream);
    }

    if (!stream) {
      return Error::report(ErrorType::INVALID_ARGUMENT, "model file is truncated");
    }

    return ErrorType::SUCCESS;
  }

  ActvFuncType actvFuncFromJson(const nlohmann::json& json, const std::string& key, ActvFuncType defaultType) {
    if (!json.contains(key)) {
      return defaultType;
    }

    return ActvFunc::nameToType(json.at(key).get<std::string>());
  }
}

//===================================================================================================================//
//-- Binary --//
//===================================================================================================================//

ErrorType Utils::saveBinary(const Network& network, const std::string& filePath) {
  std::ofstream file(filePath, std::ios::binary | std::ios::trunc);

  if (!file.is_open()) {
    return Error::report(ErrorType::INVALID_OPERATION, "failed to open model file for writing: " + filePath);
  }

  const NetworkConfig& config = network.getConfig();

  file.write(binaryMagic, 4);
  writeUInt32(file, binaryFormatVersion);

  writeUInt64(file, config.inputSize);
  writeUInt64(file, config.hiddenLayersCount);

  for (ulong size : config.hiddenLayerSizes) {
    writeUInt64(file, size);
  }

  writeUInt64(file, config.outputSize);
  writeDouble(file, config.learningRate);
  writeDouble(file, config.momentum);
  writeUInt8(file, config.useBatchNormalization ? 1 : 0);
  writeUInt8(file, config.useDropout ? 1 : 0);
  writeDouble(file, config.dropoutRate);
  writeUInt32(file, static_cast<uint32_t>(config.hiddenActvFuncType));
  writeUInt32(file, static_cast<uint32_t>(config.outputActvFuncType));
  writeUInt64(file, config.maxBatchSize);
  writeUInt64(file, config.seed);

  ulong numLayers = network.getNumLayers();
  writeUInt64(file, numLayers);

  for (ulong l = 0; l < numLayers; l++) {
    writeUInt32(file, static_cast<uint32_t>(network.getLayer(l).actvFuncType));
  }

  for (ulong l = 0; l < numLayers; l++) {
    const Layer& layer = network.getLayer(l);

    for (double weight : layer.weights) writeDouble(file, weight);
    for (double bias : layer.biases) writeDouble(file, bias);

    if (layer.hasBatchNorm()) {
      for (double value : layer.bnMean) writeDouble(file, value);
      for (double value : layer.bnVariance) writeDouble(file, value);
      for (double value : layer.bnScale) writeDouble(file, value);
      for (double value : layer.bnShift) writeDouble(file, value);
    }
  }

  file.flush();

  if (!file) {
    return Error::report(ErrorType::INVALID_OPERATION, "failed to write model file: " + filePath);
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

std::unique_ptr<Network> Utils::loadBinary(const std::string& filePath, MemoryManager& memoryManager, LogLevel logLevel) {
  std::ifstream file(filePath, std::ios::binary);

  if (!file.is_open()) {
    Error::report(ErrorType::INVALID_ARGUMENT, "failed to open model file: " + filePath);
    return nullptr;
  }

  char magic[4];
  file.read(magic, 4);

  if (!file || std::memcmp(magic, binaryMagic, 4) != 0) {
    Error::report(ErrorType::INVALID_ARGUMENT, "not a NeuralCore model file: " + filePath);
    return nullptr;
  }

  uint32_t version = readUInt32(file);

  if (!file || version != binaryFormatVersion) {
    Error::report(ErrorType::INVALID_ARGUMENT, "unsupported model format version " + std::to_string(version));
    return nullptr;
  }

  NetworkConfig config;
  config.logLevel = logLevel;
  config.inputSize = readUInt64(file);
  config.hiddenLayersCount = readUInt64(file);

  if (!file || config.hiddenLayersCount > maxHiddenLayers) {
    Error::report(ErrorType::INVALID_ARGUMENT, "model file header is corrupt");
    return nullptr;
  }

  for (ulong i = 0; i < config.hiddenLayersCount; i++) {
    config.hiddenLayerSizes.push_back(readUInt64(file));
  }

  config.outputSize = readUInt64(file);
  config.learningRate = readDouble(file);
  config.momentum = readDouble(file);
  config.useBatchNormalization = readUInt8(file) != 0;
  config.useDropout = readUInt8(file) != 0;
  config.dropoutRate = readDouble(file);

  uint32_t hiddenActvFunc = readUInt32(file);
  uint32_t outputActvFunc = readUInt32(file);
  uint32_t numActvFuncs = static_cast<uint32_t>(ActvFuncType::UNKNOWN);

  if (hiddenActvFunc >= numActvFuncs || outputActvFunc >= numActvFuncs) {
    Error::report(ErrorType::INVALID_ARGUMENT, "model file names an unknown activation function");
    return nullptr;
  }

  config.hiddenActvFuncType = static_cast<ActvFuncType>(hiddenActvFunc);
  config.outputActvFuncType = static_cast<ActvFuncType>(outputActvFunc);
  config.maxBatchSize = readUInt64(file);
  config.seed = readUInt64(file);

  if (!file) {
    Error::report(ErrorType::INVALID_ARGUMENT, "model file is truncated");
    return nullptr;
  }

  std::unique_ptr<Network> network = Network::create(config, memoryManager);

  if (!network) {
    return nullptr;
  }

  ulong numLayers = readUInt64(file);

  if (!file || numLayers != network->getNumLayers()) {
    Error::report(ErrorType::INVALID_ARGUMENT, "model file layer count does not match its config");
    return nullptr;
  }

  for (ulong l = 0; l < numLayers; l++) {
    uint32_t actvFunc = readUInt32(file);

    if (actvFunc >= numActvFuncs) {
      Error::report(ErrorType::INVALID_ARGUMENT, "model file names an unknown activation function");
      return nullptr;
    }

    if (network->setLayerActvFunc(l, static_cast<ActvFuncType>(actvFunc)) != ErrorType::SUCCESS) {
      return nullptr;
    }
  }

  std::vector<double> weights, biases, mean, variance, scale, shift;

  for (ulong l = 0; l < numLayers; l++) {
    const Layer& layer = network->getLayer(l);

    if (readDoubles(file, weights, layer.weights.size(), readDouble) != ErrorType::SUCCESS ||
        readDoubles(file, biases, layer.biases.size(), readDouble) != ErrorType::SUCCESS) {
      return nullptr;
    }

    if (network->setParameters(l, weights, biases) != ErrorType::SUCCESS) {
      return nullptr;
    }

    if (layer.hasBatchNorm()) {
      ulong size = layer.outputSize;

      if (readDoubles(file, mean, size, readDouble) != ErrorType::SUCCESS ||
          readDoubles(file, variance, size, readDouble) != ErrorType::SUCCESS ||
          readDoubles(file, scale, size, readDouble) != ErrorType::SUCCESS ||
          readDoubles(file, shift, size, readDouble) != ErrorType::SUCCESS) {
        return nullptr;
      }

      if (network->setBatchNormParameters(l, mean, variance, scale, shift) != ErrorType::SUCCESS) {
        return nullptr;
      }
    }
  }

  return network;
}

//===================================================================================================================//
//-- JSON --//
//===================================================================================================================//

nlohmann::ordered_json Utils::configToJson(const NetworkConfig& config) {
  nlohmann::ordered_json json;

  json["inputSize"] = config.inputSize;
  json["hiddenLayersCount"] = config.hiddenLayersCount;
  json["hiddenLayerSizes"] = config.hiddenLayerSizes;
  json["outputSize"] = config.outputSize;
  json["hiddenActvFunc"] = ActvFunc::typeToName(config.hiddenActvFuncType);
  json["outputActvFunc"] = ActvFunc::typeToName(config.outputActvFuncType);
  json["learningRate"] = config.learningRate;
  json["momentum"] = config.momentum;
  json["useBatchNormalization"] = config.useBatchNormalization;
  json["useDropout"] = config.useDropout;
  json["dropoutRate"] = config.dropoutRate;
  json["maxBatchSize"] = config.maxBatchSize;
  json["seed"] = config.seed;

  return json;
}

//===================================================================================================================//

ErrorType Utils::configFromJson(const nlohmann::json& json, NetworkConfig& config) {
  NetworkConfig parsed;

  try {
    parsed.inputSize = json.at("inputSize").get<ulong>();
    parsed.outputSize = json.at("outputSize").get<ulong>();

    if (json.contains("hiddenLayerSizes")) {
      parsed.hiddenLayerSizes = json.at("hiddenLayerSizes").get<std::vector<ulong>>();
    }

    parsed.hiddenLayersCount = json.value("hiddenLayersCount", static_cast<ulong>(parsed.hiddenLayerSizes.size()));

    parsed.hiddenActvFuncType = actvFuncFromJson(json, "hiddenActvFunc", parsed.hiddenActvFuncType);
    parsed.outputActvFuncType = actvFuncFromJson(json, "outputActvFunc", parsed.outputActvFuncType);

    parsed.learningRate = json.value("learningRate", parsed.learningRate);
    parsed.momentum = json.value("momentum", parsed.momentum);
    parsed.useBatchNormalization = json.value("useBatchNormalization", parsed.useBatchNormalization);
    parsed.useDropout = json.value("useDropout", parsed.useDropout);
    parsed.dropoutRate = json.value("dropoutRate", parsed.dropoutRate);
    parsed.maxBatchSize = json.value("maxBatchSize", parsed.maxBatchSize);
    parsed.seed = json.value("seed", parsed.seed);
  } catch (const nlohmann::json::exception& e) {
    return Error::report(ErrorType::INVALID_ARGUMENT, std::string("malformed network config: ") + e.what());
  }

  ErrorType errorType = Network::validate(parsed);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  parsed.logLevel = config.logLevel;
  config = parsed;

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

nlohmann::ordered_json Utils::toJson(const Network& network) {
  nlohmann::ordered_json weights = nlohmann::ordered_json::array();
  nlohmann::ordered_json biases = nlohmann::ordered_json::array();
  nlohmann::ordered_json actvFuncs = nlohmann::ordered_json::array();
  nlohmann::ordered_json batchNormalization = nlohmann::ordered_json::array();

  for (ulong l = 0; l < network.getNumLayers(); l++) {
    const Layer& layer = network.getLayer(l);

    weights.push_back(std::vector<double>(layer.weights.begin(), layer.weights.end()));
    biases.push_back(std::vector<double>(layer.biases.begin(), layer.biases.end()));
    actvFuncs.push_back(ActvFunc::typeToName(layer.actvFuncType));

    if (layer.hasBatchNorm()) {
      nlohmann::ordered_json bnJson;
      bnJson["layer"] = l;
      bnJson["mean"] = std::vector<double>(layer.bnMean.begin(), layer.bnMean.end());
      bnJson["variance"] = std::vector<double>(layer.bnVariance.begin(), layer.bnVariance.end());
      bnJson["scale"] = std::vector<double>(layer.bnScale.begin(), layer.bnScale.end());
      bnJson["shift"] = std::vector<double>(layer.bnShift.begin(), layer.bnShift.end());
      batchNormalization.push_back(bnJson);
    }
  }

  nlohmann::ordered_json parametersJson;
  parametersJson["actvFuncs"] = actvFuncs;
  parametersJson["weights"] = weights;
  parametersJson["biases"] = biases;

  if (!batchNormalization.empty()) {
    parametersJson["batchNormalization"] = batchNormalization;
  }

  nlohmann::ordered_json json;
  json["networkConfig"] = Utils::configToJson(network.getConfig());
  json["parameters"] = parametersJson;

  return json;
}

//===================================================================================================================//

std::unique_ptr<Network> Utils::fromJson(const nlohmann::json& json, MemoryManager& memoryManager, LogLevel logLevel) {
  if (!json.is_object() || !json.contains("networkConfig")) {
    Error::report(ErrorType::INVALID_ARGUMENT, "model JSON is missing 'networkConfig'");
    return nullptr;
  }

  NetworkConfig config;
  config.logLevel = logLevel;

  if (Utils::configFromJson(json.at("networkConfig"), config) != ErrorType::SUCCESS) {
    return nullptr;
  }

  std::unique_ptr<Network> network = Network::create(config, memoryManager);

  if (!network) {
    return nullptr;
  }

  if (json.contains("parameters") && Utils::applyParameters(*network, json.at("parameters")) != ErrorType::SUCCESS) {
    return nullptr;
  }

  return network;
}

//===================================================================================================================//

ErrorType Utils::saveJson(const Network& network, const std::string& filePath) {
  QFile file(QString::fromStdString(filePath));

  if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
    return Error::report(ErrorType::INVALID_OPERATION, "failed to open model file for writing: " + filePath);
  }

  std::string jsonStr = Utils::toJson(network).dump(2);

  if (file.write(jsonStr.c_str(), static_cast<qint64>(jsonStr.size())) != static_cast<qint64>(jsonStr.size())) {
    return Error::report(ErrorType::INVALID_OPERATION, "failed to write model file: " + filePath);
  }

  file.close();

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

std::unique_ptr<Network> Utils::loadJson(const std::string& filePath, MemoryManager& memoryManager, LogLevel logLevel) {
  QFile file(QString::fromStdString(filePath));

  if (!file.open(QIODevice::ReadOnly)) {
    Error::report(ErrorType::INVALID_ARGUMENT, "failed to open model file: " + filePath);
    return nullptr;
  }

  QByteArray fileData = file.readAll();
  nlohmann::json json = nlohmann::json::parse(fileData.toStdString(), nullptr, false);

  if (json.is_discarded()) {
    Error::report(ErrorType::INVALID_ARGUMENT, "model file is not valid JSON: " + filePath);
    return nullptr;
  }

  return Utils::fromJson(json, memoryManager, logLevel);
}

//===================================================================================================================//

ErrorType Utils::applyParameters(Network& network, const nlohmann::json& parameters) {
  ulong numLayers = network.getNumLayers();

  try {
    Tensor2D<double> weights = parameters.at("weights").get<Tensor2D<double>>();
    Tensor2D<double> biases = parameters.at("biases").get<Tensor2D<double>>();

    if (weights.size() != numLayers || biases.size() != numLayers) {
      return Error::report(ErrorType::INVALID_ARGUMENT, "parameters describe " + std::to_string(weights.size()) +
                                                          " layers, network has " + std::to_string(numLayers));
    }

    for (ulong l = 0; l < numLayers; l++) {
      ErrorType errorType = network.setParameters(l, weights[l], biases[l]);

      if (errorType != ErrorType::SUCCESS) {
        return errorType;
      }
    }

    if (parameters.contains("actvFuncs")) {
      std::vector<std::string> actvFuncs = parameters.at("actvFuncs").get<std::vector<std::string>>();

      if (actvFuncs.size() != numLayers) {
        return Error::report(ErrorType::INVALID_ARGUMENT, "'actvFuncs' must name one function per layer");
      }

      for (ulong l = 0; l < numLayers; l++) {
        ErrorType errorType = network.setLayerActvFunc(l, ActvFunc::nameToType(actvFuncs[l]));

        if (errorType != ErrorType::SUCCESS) {
          return errorType;
        }
      }
    }

    if (parameters.contains("batchNormalization")) {
      for (const auto& bnJson : parameters.at("batchNormalization")) {
        ErrorType errorType = network.setBatchNormParameters(
          bnJson.at("layer").get<ulong>(), bnJson.at("mean").get<std::vector<double>>(),
          bnJson.at("variance").get<std::vector<double>>(), bnJson.at("scale").get<std::vector<double>>(),
          bnJson.at("shift").get<std::vector<double>>());

        if (errorType != ErrorType::SUCCESS) {
          return errorType;
        }
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return Error::report(ErrorType::INVALID_ARGUMENT, std::string("malformed parameters: ") + e.what());
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//
//-- Formatting --//
//===================================================================================================================//

std::string Utils::formatISO8601() {
  auto now = std::chrono::system_clock::now();
  std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
  std::tm localTime{};
  localtime_r(&nowTime, &localTime);

  std::ostringstream oss;
  oss << std::put_time(&localTime, "%Y-%m-%dT%H:%M:%S");

  return oss.str();
}

//===================================================================================================================//

std::string Utils::formatDuration(double seconds) {
  std::ostringstream oss;

  if (seconds < 60.0) {
    oss << std::fixed << std::setprecision(2) << seconds << "s";
    return oss.str();
  }

  ulong totalSeconds = static_cast<ulong>(seconds);
  ulong hours = totalSeconds / 3600;
  ulong minutes = (totalSeconds % 3600) / 60;
  ulong secs = totalSeconds % 60;

  if (hours > 0) {
    oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m ";
  } else {
    oss << minutes << "m ";
  }

  oss << std::setw(2) << std::setfill('0') << secs << "s";

  return oss.str();
}

//===================================================================================================================//
//-- Little-endian primitives --//
//===================================================================================================================//

void Utils::writeUInt8(std::ofstream& stream, uint8_t value) {
  stream.put(static_cast<char>(value));
}

void Utils::writeUInt32(std::ofstream& stream, uint32_t value) {
  unsigned char bytes[4];

  for (int i = 0; i < 4; i++) {
    bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
  }

  stream.write(reinterpret_cast<const char*>(bytes), 4);
}

void Utils::writeUInt64(std::ofstream& stream, uint64_t value) {
  unsigned char bytes[8];

  for (int i = 0; i < 8; i++) {
    bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
  }

  stream.write(reinterpret_cast<const char*>(bytes), 8);
}

void Utils::writeDouble(std::ofstream& stream, double value) {
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  writeUInt64(stream, bits);
}

//===================================================================================================================//

uint8_t Utils::readUInt8(std::ifstream& stream) {
  char byte = 0;
  stream.get(byte);

  return static_cast<uint8_t>(byte);
}

uint32_t Utils::readUInt32(std::ifstream& stream) {
  unsigned char bytes[4] = {0, 0, 0, 0};
  stream.read(reinterpret_cast<char*>(bytes), 4);

  return (static_cast<uint32_t>(bytes[0])) | (static_cast<uint32_t>(bytes[1]) << 8) |
         (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
}

uint64_t Utils::readUInt64(std::ifstream& stream) {
  unsigned char bytes[8] = {0, 0, 0, 0, 0, 0, 0, 0};
  stream.read(reinterpret_cast<char*>(bytes), 8);

  uint64_t value = 0;

  for (int i = 0; i < 8; i++) {
    value |= static_cast<uint64_t>(bytes[i]) << (8 * i);
  }

  return value;
}

double Utils::readDouble(std::ifstream& stream) {
  uint64_t bits = readUInt64(stream);
  double value;
  std::memcpy(&value, &bits, sizeof(value));

  return value;
}
