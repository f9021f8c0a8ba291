#ifndef NC_NETWORKCONFIG_HPP
#define NC_NETWORKCONFIG_HPP

#include "NC_ActvFunc.hpp"
#include "NC_LogLevel.hpp"

#include <sys/types.h>

#include <vector>

//===================================================================================================================//

namespace NC {
  struct NetworkConfig {
    ulong inputSize = 0;
    ulong hiddenLayersCount = 0;
    std::vector<ulong> hiddenLayerSizes;  // Must hold hiddenLayersCount entries
    ulong outputSize = 0;

    double learningRate = 0.01;
    double momentum = 0.9;

    bool useBatchNormalization = false;
    bool useDropout = false;
    double dropoutRate = 0.0;  // [0, 1)

    ActvFuncType hiddenActvFuncType = ActvFuncType::RELU;
    ActvFuncType outputActvFuncType = ActvFuncType::RELU;

    ulong maxBatchSize = 32;
    ulong seed = 0;  // 0 = seeded from std::random_device
    LogLevel logLevel = LogLevel::ERROR;
  };
}

#endif // NC_NETWORKCONFIG_HPP
