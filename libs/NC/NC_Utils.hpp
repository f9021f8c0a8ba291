#ifndef NC_UTILS_HPP
#define NC_UTILS_HPP

#include "NC_Error.hpp"
#include "NC_LogLevel.hpp"
#include "NC_MemoryManager.hpp"
#include "NC_Network.hpp"
#include "NC_NetworkConfig.hpp"
#include "NC_Types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

//===================================================================================================================//

namespace NC {
  // Model persistence.
  //
  // Binary layout, every field little-endian:
  //   "NCNN" | u32 version | u64 inputSize | u64 hiddenLayersCount | u64 hiddenLayerSizes[] | u64 outputSize |
  //   f64 learningRate | f64 momentum | u8 useBatchNormalization | u8 useDropout | f64 dropoutRate |
  //   i32 hiddenActvFunc | i32 outputActvFunc | u64 maxBatchSize | u64 seed | u64 numLayers | i32 actvFunc[] |
  //   per layer: f64 weights[] | f64 biases[] | (f64 mean[] | f64 variance[] | f64 scale[] | f64 shift[])
  // The batch normalization block is present for every normalized layer.
  class Utils {
    public:
      static constexpr char binaryMagic[5] = "NCNN";
      static constexpr uint32_t binaryFormatVersion = 1;

      //-- Binary --//
      static ErrorType saveBinary(const Network& network, const std::string& filePath);
      static std::unique_ptr<Network> loadBinary(const std::string& filePath, MemoryManager& memoryManager,
                                                 LogLevel logLevel = LogLevel::ERROR);

      //-- JSON --//
      static nlohmann::ordered_json configToJson(const NetworkConfig& config);
      static ErrorType configFromJson(const nlohmann::json& json, NetworkConfig& config);

      // {"networkConfig": {...}, "parameters": {"weights", "biases", "actvFuncs", "batchNormalization"}}
      static nlohmann::ordered_json toJson(const Network& network);

      // Builds from "networkConfig" and applies "parameters" when present.
      static std::unique_ptr<Network> fromJson(const nlohmann::json& json, MemoryManager& memoryManager,
                                               LogLevel logLevel = LogLevel::ERROR);

      static ErrorType saveJson(const Network& network, const std::string& filePath);
      static std::unique_ptr<Network> loadJson(const std::string& filePath, MemoryManager& memoryManager,
                                               LogLevel logLevel = LogLevel::ERROR);

      //-- Formatting --//
      static std::string formatISO8601();
      static std::string formatDuration(double seconds);

    private:
      static void writeUInt8(std::ofstream& stream, uint8_t value);
      static void writeUInt32(std::ofstream& stream, uint32_t value);
      static void writeUInt64(std::ofstream& stream, uint64_t value);
      static void writeDouble(std::ofstream& stream, double value);

      static uint8_t readUInt8(std::ifstream& stream);
      static uint32_t readUInt32(std::ifstream& stream);
      static uint64_t readUInt64(std::ifstream& stream);
      static double readDouble(std::ifstream& stream);

      static ErrorType applyParameters(Network& network, const nlohmann::json& parameters);
  };
}

#endif // NC_UTILS_HPP
