#include "NC-CLI_Runner.hpp"

#include "NC-CLI_ProgressBar.hpp"

#include <NC_ForwardEngine.hpp>
#include <NC_System.hpp>
#include <NC_Trainer.hpp>
#include <NC_Utils.hpp>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>

using namespace NC_CLI;

//===================================================================================================================//

Runner::Runner(const QCommandLineParser& parser, LogLevel logLevel)
    : parser(parser), logLevel(logLevel) {
  this->configPath = this->parser.value("config").toStdString();

  std::optional<std::string> modeOverride;
  if (this->parser.isSet("mode")) {
    modeOverride = this->parser.value("mode").toLower().toStdString();
  }

  std::optional<int> numThreadsOverride;
  if (this->parser.isSet("threads")) {
    numThreadsOverride = this->parser.value("threads").toInt();
  }

  this->runConfig = Loader::loadConfig(this->configPath, modeOverride, numThreadsOverride);

  std::string modeDisplay = modeOverride.has_value() ? (modeOverride.value() + " (CLI)") : "from config file";

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Loading configuration from: " << this->configPath << "\n";
    std::cout << "Mode: " << this->runConfig.mode << " (" << modeDisplay << ")"
              << ", Threads: " << NC::System::resolveNumThreads(this->runConfig.numThreads) << "\n";
  }

  this->network = Loader::loadNetwork(this->configPath, this->runConfig, NC::System::getMemoryManager(),
                                      static_cast<NC::LogLevel>(this->logLevel));

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Network: " << this->network->getNumLayers() << " layers, "
              << this->network->getNumParameters() << " parameters\n";
  }
}

//===================================================================================================================//

Runner::~Runner() {
  if (this->network) {
    NC::ErrorType errorType = NC::Network::destroy(this->network);

    if (errorType != NC::ErrorType::SUCCESS && this->logLevel >= LogLevel::ERROR) {
      std::cerr << "Error: failed to release network: " << NC::Error::getLast() << "\n";
    }
  }
}

//===================================================================================================================//

int Runner::run() {
  int result;

  if (this->runConfig.mode == "train")     result = this->runTrain();
  else if (this->runConfig.mode == "test") result = this->runTest();
  else                                     result = this->runPredict();

  if (this->logLevel >= LogLevel::DEBUG) {
    this->printPerformance();
  }

  return result;
}

//===================================================================================================================//

int Runner::runTrain() {
  QString samplesFilePath;
  auto [samples, success] = this->loadSamplesFromOptions("training", samplesFilePath);
  if (!success) return 1;

  const TrainingConfig& trainingConfig = this->runConfig.trainingConfig;
  ulong inputSize = this->network->getInputSize();
  ulong outputSize = this->network->getOutputSize();
  ulong numSamples = samples.size();
  ulong batchSize = trainingConfig.batchSize > 0 ? trainingConfig.batchSize : this->network->getConfig().maxBatchSize;
  batchSize = std::min(batchSize, numSamples);

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Starting training: " << trainingConfig.numEpochs << " epochs, batch size " << batchSize << "\n";
  }

  std::vector<ulong> order(numSamples);
  std::iota(order.begin(), order.end(), 0);

  std::mt19937_64 shuffleRng(NC::Network::resolveSeed(this->network->getConfig().seed));

  std::vector<double> batchInput(batchSize * inputSize);
  std::vector<double> batchTarget(batchSize * outputSize);

  ProgressBar progressBar(this->runConfig.progressReports);

  TrainingMetadata trainingMetadata;
  trainingMetadata.startTime = NC::Utils::formatISO8601();
  trainingMetadata.numSamples = numSamples;

  checkError(this->profiler.start(NC::Profiler::training), "start training timer");

  double epochLoss = 0;

  for (ulong epoch = 1; epoch <= trainingConfig.numEpochs; epoch++) {
    if (trainingConfig.shuffleSamples) {
      std::shuffle(order.begin(), order.end(), shuffleRng);
    }

    double lossSum = 0;

    for (ulong start = 0; start < numSamples; start += batchSize) {
      ulong count = std::min(batchSize, numSamples - start);

      for (ulong s = 0; s < count; s++) {
        const NC::Sample<double>& sample = samples[order[start + s]];
        std::copy(sample.input.begin(), sample.input.end(), batchInput.begin() + s * inputSize);
        std::copy(sample.output.begin(), sample.output.end(), batchTarget.begin() + s * outputSize);
      }

      double batchLoss = 0;
      checkError(NC::Trainer::trainBatchParallel(this->network.get(), batchInput.data(), batchTarget.data(), count,
                                                 this->runConfig.numThreads, &batchLoss),
                 "train batch");

      this->profiler.addOperations(count);
      lossSum += batchLoss * count;

      if (this->logLevel > LogLevel::QUIET) {
        ProgressInfo info{epoch, trainingConfig.numEpochs, start + count, numSamples,
                          lossSum / (start + count), batchLoss};
        progressBar.update(info);
      }
    }

    epochLoss = lossSum / numSamples;
  }

  double durationSeconds = 0;
  checkError(this->profiler.stop(NC::Profiler::training, &durationSeconds), "stop training timer");

  trainingMetadata.endTime = NC::Utils::formatISO8601();
  trainingMetadata.durationSeconds = durationSeconds;
  trainingMetadata.finalLoss = epochLoss;

  if (this->logLevel > LogLevel::QUIET) std::cout << "\nTraining completed.\n";

  std::string outputPath;

  if (this->parser.isSet("output")) {
    outputPath = this->parser.value("output").toStdString();
  } else {
    outputPath = generateDefaultOutputPath(samplesFilePath, trainingConfig.numEpochs, numSamples, epochLoss);
  }

  this->saveModel(outputPath, trainingMetadata);

  if (this->logLevel > LogLevel::QUIET) std::cout << "Model saved to: " << outputPath << "\n";

  return 0;
}

//===================================================================================================================//

int Runner::runTest() {
  QString samplesFilePath;
  auto [samples, success] = this->loadSamplesFromOptions("test", samplesFilePath);
  if (!success) return 1;

  ulong inputSize = this->network->getInputSize();
  ulong outputSize = this->network->getOutputSize();

  std::vector<double> input;
  std::vector<double> target;
  input.reserve(samples.size() * inputSize);
  target.reserve(samples.size() * outputSize);

  for (const NC::Sample<double>& sample : samples) {
    input.insert(input.end(), sample.input.begin(), sample.input.end());
    target.insert(target.end(), sample.output.begin(), sample.output.end());
  }

  if (this->logLevel >= LogLevel::INFO) std::cout << "Running evaluation...\n";

  NC::TestResult<double> result;

  checkError(this->profiler.start(NC::Profiler::inference), "start inference timer");
  checkError(NC::Trainer::evaluate(this->network.get(), input.data(), target.data(), samples.size(),
                                   this->runConfig.numThreads, &result),
             "evaluate");
  checkError(this->profiler.stop(NC::Profiler::inference), "stop inference timer");
  this->profiler.addOperations(samples.size());

  if (this->logLevel > LogLevel::QUIET) {
    std::cout << "\nTest Results:\n";
    std::cout << "  Samples evaluated: " << result.numSamples << "\n";
    std::cout << "  Total loss:        " << result.totalLoss << "\n";
    std::cout << "  Average loss:      " << result.averageLoss << "\n";
    std::cout << "  Correct:           " << result.numCorrect << " / " << result.numSamples << "\n";
    std::cout << "  Accuracy:          " << std::fixed << std::setprecision(2) << result.accuracy << "%\n";
  }

  return 0;
}

//===================================================================================================================//

int Runner::runPredict() {
  if (!this->parser.isSet("input")) {
    std::cerr << "Error: --input option is required for predict mode.\n";
    return 1;
  }

  QString inputPath = this->parser.value("input");

  QString outputPath;

  if (this->parser.isSet("output")) {
    outputPath = this->parser.value("output");
  } else {
    QFileInfo inputInfo(inputPath);
    QString baseName = inputInfo.completeBaseName();
    QDir inputDir = inputInfo.absoluteDir();
    QDir outputDir(inputDir.filePath("output"));

    if (!outputDir.exists()) {
      inputDir.mkdir("output");
    }

    outputPath = outputDir.filePath("predict_" + baseName + ".json");
  }

  if (this->logLevel >= LogLevel::INFO) std::cout << "Loading input from: " << inputPath.toStdString() << "\n";

  ulong inputSize = this->network->getInputSize();
  ulong outputSize = this->network->getOutputSize();

  std::vector<NC::Input<double>> inputs = Loader::loadInputs(inputPath.toStdString(), inputSize);

  std::vector<double> input;
  input.reserve(inputs.size() * inputSize);

  for (const NC::Input<double>& row : inputs) {
    input.insert(input.end(), row.begin(), row.end());
  }

  std::vector<double> output(inputs.size() * outputSize);

  std::string startTime = NC::Utils::formatISO8601();
  double durationSeconds = 0;

  checkError(this->profiler.start(NC::Profiler::inference), "start inference timer");
  checkError(NC::ForwardEngine::processBatchParallel(this->network.get(), input.data(), output.data(), inputs.size(),
                                                     this->runConfig.numThreads),
             "predict");
  checkError(this->profiler.stop(NC::Profiler::inference, &durationSeconds), "stop inference timer");
  this->profiler.addOperations(inputs.size());

  nlohmann::ordered_json resultJson;

  nlohmann::ordered_json predictMetadataJson;
  predictMetadataJson["startTime"] = startTime;
  predictMetadataJson["endTime"] = NC::Utils::formatISO8601();
  predictMetadataJson["durationSeconds"] = durationSeconds;
  predictMetadataJson["durationFormatted"] = NC::Utils::formatDuration(durationSeconds);
  predictMetadataJson["numInputs"] = inputs.size();
  resultJson["predictMetadata"] = predictMetadataJson;

  nlohmann::ordered_json outputsJson = nlohmann::ordered_json::array();

  for (ulong s = 0; s < inputs.size(); s++) {
    outputsJson.push_back(std::vector<double>(output.begin() + s * outputSize, output.begin() + (s + 1) * outputSize));
  }

  resultJson["outputs"] = outputsJson;

  QFile outputFile(outputPath);

  if (!outputFile.open(QIODevice::WriteOnly | QIODevice::Text)) {
    std::cerr << "Error: Failed to open output file: " << outputPath.toStdString() << "\n";
    return 1;
  }

  std::string jsonStr = resultJson.dump(2);
  outputFile.write(jsonStr.c_str(), jsonStr.size());
  outputFile.close();

  if (this->logLevel > LogLevel::QUIET) {
    std::cout << "Predict result saved to: " << outputPath.toStdString() << "\n";
  }

  return 0;
}

//===================================================================================================================//

std::pair<NC::Samples<double>, bool> Runner::loadSamplesFromOptions(const std::string& modeName,
                                                                    QString& samplesFilePath) {
  NC::Samples<double> samples;

  if (!this->parser.isSet("samples")) {
    std::cerr << "Error: " << modeName << " requires --samples (JSON).\n";
    return {samples, false};
  }

  samplesFilePath = this->parser.value("samples");

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Loading " << modeName << " samples from JSON: " << samplesFilePath.toStdString() << "\n";
  }

  samples = Loader::loadSamples(samplesFilePath.toStdString(), this->network->getInputSize(),
                                this->network->getOutputSize());

  if (this->logLevel >= LogLevel::INFO) std::cout << "Loaded " << samples.size() << " " << modeName << " samples.\n";

  return {samples, true};
}

//===================================================================================================================//

void Runner::saveModel(const std::string& filePath, const TrainingMetadata& trainingMetadata) const {
  if (Loader::isBinaryPath(filePath)) {
    checkError(NC::Utils::saveBinary(*this->network, filePath), "save model");
    return;
  }

  nlohmann::ordered_json json;

  // A saved model is ready to be used for inference
  json["mode"] = "predict";
  json["numThreads"] = this->runConfig.numThreads;
  json["progressReports"] = this->runConfig.progressReports;

  nlohmann::ordered_json trainingConfigJson;
  trainingConfigJson["numEpochs"] = this->runConfig.trainingConfig.numEpochs;
  trainingConfigJson["batchSize"] = this->runConfig.trainingConfig.batchSize;
  trainingConfigJson["shuffleSamples"] = this->runConfig.trainingConfig.shuffleSamples;
  json["trainingConfig"] = trainingConfigJson;

  nlohmann::ordered_json trainingMetadataJson;
  trainingMetadataJson["startTime"] = trainingMetadata.startTime;
  trainingMetadataJson["endTime"] = trainingMetadata.endTime;
  trainingMetadataJson["durationSeconds"] = trainingMetadata.durationSeconds;
  trainingMetadataJson["durationFormatted"] = NC::Utils::formatDuration(trainingMetadata.durationSeconds);
  trainingMetadataJson["numSamples"] = trainingMetadata.numSamples;
  trainingMetadataJson["finalLoss"] = trainingMetadata.finalLoss;
  json["trainingMetadata"] = trainingMetadataJson;

  for (const auto& [key, value] : NC::Utils::toJson(*this->network).items()) {
    json[key] = value;
  }

  QFile file(QString::fromStdString(filePath));

  if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
    throw std::runtime_error("Failed to open file for writing: " + filePath);
  }

  std::string jsonStr = json.dump(2);
  file.write(jsonStr.c_str(), jsonStr.size());
  file.close();
}

//===================================================================================================================//

std::string Runner::generateTrainingFilename(ulong epochs, ulong samples, double loss) {
  std::ostringstream oss;
  oss << "trained_model_"
      << epochs << "_"
      << samples << "_"
      << std::fixed << std::setprecision(6) << loss
      << ".json";
  return oss.str();
}

//===================================================================================================================//

std::string Runner::generateDefaultOutputPath(const QString& samplesFilePath, ulong epochs, ulong samples,
                                              double loss) {
  QFileInfo inputInfo(samplesFilePath);
  QDir inputDir = inputInfo.absoluteDir();
  QDir outputDir(inputDir.filePath("output"));

  if (!outputDir.exists()) {
    inputDir.mkdir("output");
  }

  QString outputPath = outputDir.filePath(QString::fromStdString(generateTrainingFilename(epochs, samples, loss)));
  return outputPath.toStdString();
}

//===================================================================================================================//

void Runner::checkError(NC::ErrorType errorType, const std::string& operation) {
  if (errorType != NC::ErrorType::SUCCESS) {
    throw std::runtime_error("Failed to " + operation + " (" + NC::Error::typeToName(errorType) + "): " +
                             NC::Error::getLast());
  }
}

//===================================================================================================================//

void Runner::printPerformance() const {
  NC::PerformanceMetrics metrics = this->profiler.getMetrics();
  NC::PerformanceMetrics phases = NC::Profiler::global().getMetrics();
  NC::MemoryStats stats = NC::System::getMemoryManager().stats();

  std::cout << "\nPerformance:\n";
  std::cout << "  Training time:     " << metrics.trainingTime << " s\n";
  std::cout << "  Inference time:    " << metrics.inferenceTime << " s\n";
  std::cout << "  Samples/second:    " << metrics.operationsPerSecond << "\n";
  std::cout << "  Forward passes:    " << phases.forwardPassTime << " s\n";
  std::cout << "  Backward passes:   " << phases.backwardPassTime << " s\n";

  std::cout << "Memory:\n";
  std::cout << "  Used:              " << stats.usedMemory << " bytes\n";
  std::cout << "  Peak:              " << stats.peakMemory << " bytes\n";
  std::cout << "  Allocations:       " << stats.allocationCount << "\n";
  std::cout << "  Deallocations:     " << stats.deallocationCount << "\n";
}
