#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>

#include <NC_System.hpp>

#include "NC-CLI_LogLevel.hpp"
#include "NC-CLI_Runner.hpp"

#include <iostream>

void printUsage() {
  std::cout << "NC-CLI - Neural Computation Core Command Line Interface\n\n";
  std::cout << "Usage:\n";
  std::cout << "  NC-CLI --config <file> --mode train --samples <f> [options]  # Training\n";
  std::cout << "  NC-CLI --config <file> --mode test --samples <f> [options]   # Evaluation\n";
  std::cout << "  NC-CLI --config <file> --mode predict --input <f> [options]  # Inference\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config, -c <file>     Path to JSON configuration file or .bin model (required)\n";
  std::cout << "  --mode, -m <mode>       Mode: 'train', 'test', or 'predict' (overrides config file)\n";
  std::cout << "  --samples, -s <file>    Path to JSON file with samples (train/test modes)\n";
  std::cout << "  --input, -i <file>      Path to JSON file with inputs (predict mode)\n";
  std::cout << "  --output, -o <file>     Output file (trained model, .json or .bin, or predict results)\n";
  std::cout << "  --threads, -t <n>       Worker threads, 0 = all cores (overrides config file)\n";
  std::cout << "  --log-level, -l <lvl>   quiet, error, warning, info, debug (default: info)\n";
  std::cout << "  --help, -h              Show this help message\n";
}

int main(int argc, char *argv[]) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("NC-CLI");
  QCoreApplication::setApplicationVersion(QString::fromStdString(NC::System::getVersion()));

  QCommandLineParser parser;
  parser.setApplicationDescription("Neural Computation Core CLI");
  parser.addHelpOption();
  parser.addVersionOption();

  QCommandLineOption configOption(
    QStringList() << "c" << "config",
    "Path to JSON configuration file or binary (.bin) model.",
    "file"
  );
  parser.addOption(configOption);

  QCommandLineOption modeOption(
    QStringList() << "m" << "mode",
    "Mode: 'train', 'test', or 'predict'.",
    "mode"
  );
  parser.addOption(modeOption);

  QCommandLineOption samplesOption(
    QStringList() << "s" << "samples",
    "Path to JSON file with samples (for train/test modes).",
    "file"
  );
  parser.addOption(samplesOption);

  QCommandLineOption inputOption(
    QStringList() << "i" << "input",
    "Path to JSON file with inputs for predict mode.",
    "file"
  );
  parser.addOption(inputOption);

  QCommandLineOption outputOption(
    QStringList() << "o" << "output",
    "Output file (default: <samples_dir>/output/trained_model_<epochs>_<samples>_<loss>.json).",
    "file"
  );
  parser.addOption(outputOption);

  QCommandLineOption threadsOption(
    QStringList() << "t" << "threads",
    "Number of worker threads, 0 for all available cores.",
    "n"
  );
  parser.addOption(threadsOption);

  QCommandLineOption logLevelOption(
    QStringList() << "l" << "log-level",
    "Log level: quiet, error, warning, info, debug (default: info).",
    "level",
    "info"
  );
  parser.addOption(logLevelOption);

  parser.process(app);

  if (!parser.isSet(configOption)) {
    std::cerr << "Error: --config is required.\n\n";
    printUsage();
    return 1;
  }

  if (parser.isSet(modeOption)) {
    QString modeStr = parser.value(modeOption).toLower();
    if (modeStr != "train" && modeStr != "test" && modeStr != "predict") {
      std::cerr << "Error: Mode must be 'train', 'test', or 'predict'.\n";
      return 1;
    }
  }

  auto logLevelIt = NC_CLI::logLevelMap.find(parser.value(logLevelOption).toLower().toStdString());
  if (logLevelIt == NC_CLI::logLevelMap.end()) {
    std::cerr << "Error: Log level must be one of quiet, error, warning, info, debug.\n";
    return 1;
  }

  NC_CLI::LogLevel logLevel = logLevelIt->second;

  if (parser.isSet(threadsOption)) {
    bool ok = false;
    int numThreads = parser.value(threadsOption).toInt(&ok);
    if (!ok || numThreads < 0) {
      std::cerr << "Error: --threads must be a non-negative integer.\n";
      return 1;
    }
  }

  NC::OptimizationConfig optimizationConfig;
  optimizationConfig.logLevel = static_cast<NC::LogLevel>(logLevel);

  if (NC::System::init(optimizationConfig) != NC::ErrorType::SUCCESS) {
    std::cerr << "Error: " << NC::Error::getLast() << "\n";
    return 1;
  }

  int result;

  try {
    NC_CLI::Runner runner(parser, logLevel);
    result = runner.run();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    result = 1;
  }

  if (NC::System::cleanup() != NC::ErrorType::SUCCESS) {
    std::cerr << "Error: " << NC::Error::getLast() << "\n";
    return 1;
  }

  return result;
}
