#include "test_helpers.hpp"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

// Trained model path shared between chained tests
QString trainedXORModelPath;
static QString trainedXORBinaryPath;

static QJsonObject readJsonObject(const QString& path) {
  QFile file(path);

  if (!file.open(QIODevice::ReadOnly)) {
    return QJsonObject();
  }

  return QJsonDocument::fromJson(file.readAll()).object();
}

static void testTrainXOR() {
  std::cout << "  testTrainXOR... " << std::flush;

  trainedXORModelPath = tempDir() + "/xor_model.json";

  auto result = runNCCLI({
    "--config", fixturePath("xor_train_config.json"),
    "--mode", "train",
    "--samples", fixturePath("xor_samples.json"),
    "--output", trainedXORModelPath
  });

  CHECK(result.exitCode == 0, "Train XOR: exit code 0");
  CHECK(result.stdOut.contains("Training completed."), "Train XOR: 'Training completed.'");
  CHECK(result.stdOut.contains("Model saved to:"), "Train XOR: 'Model saved to:'");
  CHECK(result.stdOut.contains("500/500"), "Train XOR: final epoch reported");
  CHECK(QFile::exists(trainedXORModelPath), "Train XOR: model file exists");

  QJsonObject model = readJsonObject(trainedXORModelPath);
  CHECK(model.value("mode").toString() == "predict", "Train XOR: saved model defaults to predict");
  CHECK(model.contains("trainingMetadata"), "Train XOR: training metadata saved");
  CHECK(model.value("trainingMetadata").toObject().value("numSamples").toInt() == 4, "Train XOR: sample count saved");
  CHECK(model.value("parameters").toObject().value("weights").toArray().size() == 3, "Train XOR: three layers saved");

  if (result.exitCode != 0 || !QFile::exists(trainedXORModelPath)) {
    trainedXORModelPath.clear();
  }

  std::cout << std::endl;
}

static void testTrainXORBinary() {
  std::cout << "  testTrainXORBinary... " << std::flush;

  trainedXORBinaryPath = tempDir() + "/xor_model.bin";

  auto result = runNCCLI({
    "--config", fixturePath("xor_train_config.json"),
    "--mode", "train",
    "--samples", fixturePath("xor_samples.json"),
    "--output", trainedXORBinaryPath,
    "--threads", "1",
    "--log-level", "quiet"
  });

  CHECK(result.exitCode == 0, "Train XOR binary: exit code 0");
  CHECK(result.stdOut.isEmpty(), "Train XOR binary: quiet produces no output");
  CHECK(QFile::exists(trainedXORBinaryPath), "Train XOR binary: model file exists");

  QFile file(trainedXORBinaryPath);
  CHECK(file.open(QIODevice::ReadOnly) && file.read(4) == "NCNN", "Train XOR binary: magic bytes");

  if (result.exitCode != 0 || !QFile::exists(trainedXORBinaryPath)) {
    trainedXORBinaryPath.clear();
  }

  std::cout << std::endl;
}

static void testTestXOR() {
  std::cout << "  testTestXOR... ";

  if (trainedXORModelPath.isEmpty()) {
    CHECK(false, "Test XOR: skipped, no trained model available (testTrainXOR must run first)");
    std::cout << std::endl;
    return;
  }

  auto result = runNCCLI({
    "--config", trainedXORModelPath,
    "--mode", "test",
    "--samples", fixturePath("xor_samples.json")
  });

  CHECK(result.exitCode == 0, "Test XOR: exit code 0");
  CHECK(result.stdOut.contains("Test Results:"), "Test XOR: 'Test Results:'");
  CHECK(result.stdOut.contains("Samples evaluated: 4"), "Test XOR: four samples evaluated");
  CHECK(result.stdOut.contains("Accuracy:"), "Test XOR: accuracy reported");
  std::cout << std::endl;
}

static void testPredictXOR() {
  std::cout << "  testPredictXOR... ";

  if (trainedXORModelPath.isEmpty()) {
    CHECK(false, "Predict XOR: skipped, no trained model available (testTrainXOR must run first)");
    std::cout << std::endl;
    return;
  }

  QString outputPath = tempDir() + "/xor_predict.json";

  // Mode comes from the saved model
  auto result = runNCCLI({
    "--config", trainedXORModelPath,
    "--input", fixturePath("xor_input.json"),
    "--output", outputPath
  });

  CHECK(result.exitCode == 0, "Predict XOR: exit code 0");
  CHECK(result.stdOut.contains("Predict result saved to:"), "Predict XOR: 'Predict result saved to:'");

  QJsonObject predictions = readJsonObject(outputPath);
  QJsonArray outputs = predictions.value("outputs").toArray();

  CHECK(predictions.contains("predictMetadata"), "Predict XOR: metadata written");
  CHECK(outputs.size() == 4, "Predict XOR: one output per input");

  bool inRange = true;
  for (const QJsonValue& output : outputs) {
    QJsonArray values = output.toArray();
    if (values.size() != 1 || values[0].toDouble() < 0.0 || values[0].toDouble() > 1.0) inRange = false;
  }
  CHECK(inRange, "Predict XOR: sigmoid outputs in [0, 1]");
  std::cout << std::endl;
}

static void testPredictBinaryMatchesJson() {
  std::cout << "  testPredictBinaryMatchesJson... ";

  if (trainedXORBinaryPath.isEmpty()) {
    CHECK(false, "Predict binary: skipped, no binary model available (testTrainXORBinary must run first)");
    std::cout << std::endl;
    return;
  }

  QString outputPath = tempDir() + "/xor_predict_bin.json";

  auto result = runNCCLI({
    "--config", trainedXORBinaryPath,
    "--mode", "predict",
    "--input", fixturePath("xor_input.json"),
    "--output", outputPath,
    "--threads", "3"
  });

  CHECK(result.exitCode == 0, "Predict binary: exit code 0");
  CHECK(readJsonObject(outputPath).value("outputs").toArray().size() == 4, "Predict binary: four outputs");
  std::cout << std::endl;
}

static void testPredictDefaultOutputPath() {
  std::cout << "  testPredictDefaultOutputPath... ";

  if (trainedXORModelPath.isEmpty()) {
    CHECK(false, "Predict default path: skipped, no trained model available");
    std::cout << std::endl;
    return;
  }

  QString inputPath = tempDir() + "/default_input.json";
  QFile::remove(inputPath);
  QFile::copy(fixturePath("xor_input.json"), inputPath);

  auto result = runNCCLI({
    "--config", trainedXORModelPath,
    "--mode", "predict",
    "--input", inputPath
  });

  QString expectedPath = tempDir() + "/output/predict_default_input.json";

  CHECK(result.exitCode == 0, "Predict default path: exit code 0");
  CHECK(QFile::exists(expectedPath), "Predict default path: output/predict_<input>.json written");
  std::cout << std::endl;
}

void runCLITests() {
  testTrainXOR();
  testTrainXORBinary();
  testTestXOR();
  testPredictXOR();
  testPredictBinaryMatchesJson();
  testPredictDefaultOutputPath();
}
