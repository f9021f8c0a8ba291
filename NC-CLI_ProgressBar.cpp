#include "NC-CLI_ProgressBar.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace NC_CLI {

//===================================================================================================================//
//-- Constructor --//
//===================================================================================================================//

ProgressBar::ProgressBar(ulong progressReports, int barWidth) : progressReports(progressReports), barWidth(barWidth) {}

//===================================================================================================================//
//-- Public Interface --//
//===================================================================================================================//

void ProgressBar::update(const ProgressInfo& progress) {
  bool isEpochComplete = (progress.currentSample >= progress.totalSamples);

  if (isEpochComplete && !this->isEpochReportDue(progress)) {
    return;
  }

  std::ostringstream out;
  out << "\rEpoch " << std::setw(4) << progress.currentEpoch << "/" << progress.totalEpochs << " [";

  double samplePercent = (progress.totalSamples > 0)
      ? static_cast<double>(progress.currentSample) / static_cast<double>(progress.totalSamples)
      : 0.0;
  this->renderSingleBar(out, samplePercent);

  if (isEpochComplete) {
    this->lastReportedEpoch = progress.currentEpoch;
    out << " - Loss: " << std::fixed << std::setprecision(6) << progress.epochLoss;
    out << std::string(10, ' ') << std::endl;
  } else {
    out << " - Loss: " << std::fixed << std::setprecision(6) << progress.batchLoss << "   ";
  }

  std::cout << out.str() << std::flush;
}

void ProgressBar::reset() {
  this->lastReportedEpoch = 0;
}

//===================================================================================================================//
//-- Rendering --//
//===================================================================================================================//

void ProgressBar::renderSingleBar(std::ostream& out, double percent) {
  percent = std::min(1.0, std::max(0.0, percent));
  int filledWidth = static_cast<int>(percent * this->barWidth);

  for (int i = 0; i < this->barWidth; i++) {
    out << (i < filledWidth ? "█" : "░");
  }

  out << "] " << std::fixed << std::setprecision(1) << std::setw(5) << (percent * 100) << "%";
}

bool ProgressBar::isEpochReportDue(const ProgressInfo& progress) const {
  // First and last epochs always get a line
  if (progress.currentEpoch == 1 || progress.currentEpoch == progress.totalEpochs) {
    return true;
  }

  if (this->progressReports == 0) {
    return false;
  }

  ulong interval = std::max(1UL, progress.totalEpochs / this->progressReports);
  return progress.currentEpoch % interval == 0 && progress.currentEpoch != this->lastReportedEpoch;
}

}  // namespace NC_CLI
