#ifndef NC_CLI_RUNNER_HPP
#define NC_CLI_RUNNER_HPP

#include "NC-CLI_Loader.hpp"
#include "NC-CLI_LogLevel.hpp"

#include <NC_Error.hpp>
#include <NC_Network.hpp>
#include <NC_Profiler.hpp>

#include <QCommandLineParser>

#include <memory>
#include <utility>
#include <string>

//===================================================================================================================//

namespace NC_CLI {

struct TrainingMetadata {
  std::string startTime;
  std::string endTime;
  double durationSeconds = 0;
  ulong numSamples = 0;
  double finalLoss = 0;
};

/**
 * Runner class handles the execution of the train, test and predict modes.
 * Library error codes are turned into exceptions here, so main only has to catch.
 */
class Runner {
  public:
    //-- Constructor --//
    Runner(const QCommandLineParser& parser, LogLevel logLevel);
    ~Runner();

    //-- Entry point --//
    int run();

  private:
    //-- Mode methods --//
    int runTrain();
    int runTest();
    int runPredict();

    //-- Sample loading --//
    std::pair<NC::Samples<double>, bool> loadSamplesFromOptions(const std::string& modeName, QString& samplesFilePath);

    //-- Model saving --//
    void saveModel(const std::string& filePath, const TrainingMetadata& trainingMetadata) const;

    //-- Output path helpers --//
    static std::string generateTrainingFilename(ulong epochs, ulong samples, double loss);
    static std::string generateDefaultOutputPath(const QString& samplesFilePath, ulong epochs, ulong samples, double loss);

    //-- Diagnostics --//
    static void checkError(NC::ErrorType errorType, const std::string& operation);
    void printPerformance() const;

    //-- Configuration --//
    const QCommandLineParser& parser;
    LogLevel logLevel;
    std::string configPath;
    RunConfig runConfig;

    //-- Network --//
    std::unique_ptr<NC::Network> network;
    NC::Profiler profiler;
};

} // namespace NC_CLI

#endif // NC_CLI_RUNNER_HPP
