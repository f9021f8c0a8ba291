#ifndef NC_TYPES_HPP
#define NC_TYPES_HPP

#include <sys/types.h>

#include <vector>

//===================================================================================================================//

namespace NC {
  template <typename T>
  using Input = std::vector<T>;

  template <typename T>
  using Output = std::vector<T>;

  template <typename T>
  using Tensor1D = std::vector<T>;

  template <typename T>
  using Tensor2D = std::vector<std::vector<T>>;

  template <typename T>
  struct Sample {
    Input<T> input;
    Output<T> output;
  };

  template <typename T>
  using Samples = std::vector<Sample<T>>;

  // Result of evaluating a network against a labelled batch
  template <typename T>
  struct TestResult {
    ulong numSamples = 0;
    T totalLoss = 0;
    T averageLoss = 0;
    ulong numCorrect = 0;
    T accuracy = 0;  // Percentage (0-100)
  };
}

#endif // NC_TYPES_HPP
