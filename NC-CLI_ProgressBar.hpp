#ifndef NC_CLI_PROGRESSBAR_HPP
#define NC_CLI_PROGRESSBAR_HPP

#include <ostream>
#include <string>

#include <sys/types.h>

namespace NC_CLI {

struct ProgressInfo {
  ulong currentEpoch;
  ulong totalEpochs;
  ulong currentSample;
  ulong totalSamples;
  double epochLoss;
  double batchLoss;
};

class ProgressBar {
  public:
    // progressReports: completed-epoch lines to print over the whole run (0 = only the bar)
    ProgressBar(ulong progressReports = 10, int barWidth = 50);

    // Redraws the bar for the current epoch; a completed epoch prints a full line when due.
    void update(const ProgressInfo& progress);

    void reset();

  private:
    //-- Configuration --//
    ulong progressReports;
    int barWidth;

    //-- State --//
    ulong lastReportedEpoch = 0;

    //-- Internal methods --//
    bool isEpochReportDue(const ProgressInfo& progress) const;
    void renderSingleBar(std::ostream& out, double percent);
};

}  // namespace NC_CLI

#endif  // NC_CLI_PROGRESSBAR_HPP
