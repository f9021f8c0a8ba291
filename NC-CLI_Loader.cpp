#include "NC-CLI_Loader.hpp"

#include <NC_Error.hpp>
#include <NC_Utils.hpp>

#include <QFile>
#include <QString>

#include <stdexcept>

namespace NC_CLI {

//===================================================================================================================//
// Config loading
//===================================================================================================================//

RunConfig Loader::loadConfig(const std::string& configFilePath,
                             std::optional<std::string> modeOverride,
                             std::optional<int> numThreadsOverride) {
    RunConfig runConfig;

    if (isBinaryPath(configFilePath)) {
        if (!QFile::exists(QString::fromStdString(configFilePath))) {
            throw std::runtime_error("Failed to open config file: " + configFilePath);
        }

        runConfig.isBinaryModel = true;
        runConfig.hasParameters = true;
    } else {
        nlohmann::json json = readJson(configFilePath, "config");

        if (!json.contains("networkConfig")) {
            throw std::runtime_error("Config file missing 'networkConfig': " + configFilePath);
        }

        if (json.contains("mode")) runConfig.mode = json.at("mode").get<std::string>();
        if (json.contains("numThreads")) runConfig.numThreads = json.at("numThreads").get<int>();
        if (json.contains("progressReports")) runConfig.progressReports = json.at("progressReports").get<ulong>();

        if (json.contains("trainingConfig")) {
            const auto& tc = json.at("trainingConfig");
            runConfig.trainingConfig.numEpochs = tc.at("numEpochs").get<ulong>();
            if (tc.contains("batchSize")) runConfig.trainingConfig.batchSize = tc.at("batchSize").get<ulong>();
            if (tc.contains("shuffleSamples")) runConfig.trainingConfig.shuffleSamples = tc.at("shuffleSamples").get<bool>();
        }

        runConfig.hasParameters = json.contains("parameters");
        runConfig.json = std::move(json);
    }

    if (modeOverride.has_value()) runConfig.mode = modeOverride.value();
    if (numThreadsOverride.has_value()) runConfig.numThreads = numThreadsOverride.value();

    if (runConfig.mode != "train" && runConfig.mode != "test" && runConfig.mode != "predict") {
        throw std::runtime_error("Unknown mode '" + runConfig.mode + "' in config file: " + configFilePath);
    }

    if (runConfig.numThreads < 0) {
        throw std::runtime_error("'numThreads' must not be negative: " + configFilePath);
    }

    bool isPredictOrTest = (runConfig.mode == "predict" || runConfig.mode == "test");
    if (isPredictOrTest && !runConfig.hasParameters) {
        throw std::runtime_error("Config file missing 'parameters' required for predict/test modes: " + configFilePath);
    }

    return runConfig;
}

//===================================================================================================================//
// Network construction
//===================================================================================================================//

std::unique_ptr<NC::Network> Loader::loadNetwork(const std::string& configFilePath, const RunConfig& runConfig,
                                                 NC::MemoryManager& memoryManager, NC::LogLevel logLevel) {
    std::unique_ptr<NC::Network> network;

    if (runConfig.isBinaryModel) {
        network = NC::Utils::loadBinary(configFilePath, memoryManager, logLevel);
    } else {
        network = NC::Utils::fromJson(runConfig.json, memoryManager, logLevel);
    }

    if (!network) {
        throw std::runtime_error("Failed to build network from " + configFilePath + ": " + NC::Error::getLast());
    }

    return network;
}

//===================================================================================================================//
// Samples loading
//===================================================================================================================//

NC::Samples<double> Loader::loadSamples(const std::string& samplesFilePath, ulong inputSize, ulong outputSize) {
    nlohmann::json json = readJson(samplesFilePath, "samples");

    const auto& samplesArray = json.at("samples");
    if (!samplesArray.is_array() || samplesArray.empty()) {
        throw std::runtime_error("'samples' must be a non-empty array in: " + samplesFilePath);
    }

    NC::Samples<double> samples;
    samples.reserve(samplesArray.size());

    for (const auto& sampleJson : samplesArray) {
        NC::Sample<double> sample;
        sample.input = sampleJson.at("input").get<std::vector<double>>();
        sample.output = sampleJson.at("output").get<std::vector<double>>();

        if (sample.input.size() != inputSize) {
            throw std::runtime_error("Sample " + std::to_string(samples.size()) + " has " +
                                     std::to_string(sample.input.size()) + " inputs, network expects " +
                                     std::to_string(inputSize));
        }

        if (sample.output.size() != outputSize) {
            throw std::runtime_error("Sample " + std::to_string(samples.size()) + " has " +
                                     std::to_string(sample.output.size()) + " outputs, network expects " +
                                     std::to_string(outputSize));
        }

        samples.push_back(std::move(sample));
    }

    return samples;
}

//===================================================================================================================//
// Inputs loading
//===================================================================================================================//

std::vector<NC::Input<double>> Loader::loadInputs(const std::string& inputFilePath, ulong inputSize) {
    nlohmann::json json = readJson(inputFilePath, "input");

    const auto& inputsArray = json.at("inputs");
    if (!inputsArray.is_array() || inputsArray.empty()) {
        throw std::runtime_error("'inputs' must be a non-empty array in: " + inputFilePath);
    }

    std::vector<NC::Input<double>> inputs;
    inputs.reserve(inputsArray.size());

    for (const auto& entry : inputsArray) {
        NC::Input<double> input = entry.get<std::vector<double>>();

        if (input.size() != inputSize) {
            throw std::runtime_error("Input " + std::to_string(inputs.size()) + " has " + std::to_string(input.size()) +
                                     " values, network expects " + std::to_string(inputSize));
        }

        inputs.push_back(std::move(input));
    }

    return inputs;
}

//===================================================================================================================//

bool Loader::isBinaryPath(const std::string& filePath) {
    return QString::fromStdString(filePath).endsWith(".bin", Qt::CaseInsensitive);
}

//===================================================================================================================//

nlohmann::json Loader::readJson(const std::string& filePath, const std::string& description) {
    QFile file(QString::fromStdString(filePath));

    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("Failed to open " + description + " file: " + filePath);
    }

    QByteArray fileData = file.readAll();
    return nlohmann::json::parse(fileData.toStdString());
}

//===================================================================================================================//

} // namespace NC_CLI
