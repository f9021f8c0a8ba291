#ifndef NC_TRAINER_HPP
#define NC_TRAINER_HPP

#include "NC_Error.hpp"
#include "NC_ForwardEngine.hpp"
#include "NC_Network.hpp"
#include "NC_Types.hpp"

#include <sys/types.h>

#include <random>
#include <string>
#include <vector>

//===================================================================================================================//

namespace NC {
  // Thread-local state for one contiguous chunk of a batch
  struct TrainingWorker {
    ForwardCache cache;
    Tensor2D<double> dCost_dActvs;
    Tensor2D<double> dCost_dZs;
    Tensor2D<double> dCost_dLinears;

    // Accumulators, merged into the network in worker order
    Tensor2D<double> accum_dCost_dWeights;
    Tensor2D<double> accum_dCost_dBiases;
    Tensor2D<double> accum_dCost_dBnScale;
    Tensor2D<double> accum_dCost_dBnShift;
    Tensor2D<double> accum_linearSums;
    Tensor2D<double> accum_linearSquareSums;
    double accum_loss = 0;

    // Seconds spent in this worker's forward and backward steps
    double forwardSeconds = 0;
    double backwardSeconds = 0;

    std::mt19937 rng;
    ErrorType errorType = ErrorType::SUCCESS;
    std::string errorMessage;
  };

  // Loss is the mean over samples of the mean squared error over the output layer.
  // Parameters are updated by SGD with momentum: v = momentum * v - learningRate * g; w += v.
  class Trainer {
    public:
      // Forward, backward, running statistics update and weight update for one batch.
      static ErrorType trainBatch(Network* network, const double* input, const double* target, ulong batchSize,
                                  double* loss);

      // trainBatch with the batch split across at most numThreads workers (0 = System default).
      static ErrorType trainBatchParallel(Network* network, const double* input, const double* target, ulong batchSize,
                                          int numThreads, double* loss);

      // Leaves the batch-mean parameter gradients in each layer's gradient buffers and writes
      // dLoss/dOutput of every sample (outputSize values each) to gradients. Weights are not touched.
      static ErrorType backwardPass(Network* network, const double* input, const double* target, double* gradients,
                                    ulong batchSize);

      static ErrorType applyGradients(Network* network);

      // Forward only: loss, and accuracy by argmax (by |output - target| < 0.5 for a single output).
      static ErrorType evaluate(Network* network, const double* input, const double* target, ulong batchSize,
                                int numThreads, TestResult<double>* result);

      static ErrorType calculateLoss(const double* output, const double* target, ulong size, double* loss);

    private:
      static ErrorType runBatch(Network* network, const double* input, const double* target, double* gradients,
                                ulong batchSize, int numThreads, double* loss, bool updateRunningStats);

      static void allocateWorker(const Network& network, TrainingWorker& worker);
      static void resetWorker(TrainingWorker& worker);

      static ErrorType processChunk(const Network& network, const double* input, const double* target,
                                    double* gradients, ulong begin, ulong end, ulong batchSize, TrainingWorker& worker);

      static ErrorType backpropagate(const Network& network, const double* input, const double* target,
                                     double* outputGradient, double sampleWeight, TrainingWorker& worker);

      static void mergeWorkers(Network& network, const std::vector<TrainingWorker>& workers);
      static void updateRunningStats(Network& network, const std::vector<TrainingWorker>& workers, ulong batchSize);
  };
}

#endif // NC_TRAINER_HPP
