#ifndef NC_FORWARDENGINE_HPP
#define NC_FORWARDENGINE_HPP

#include "NC_Error.hpp"
#include "NC_Network.hpp"
#include "NC_Types.hpp"

#include <sys/types.h>

#include <random>

//===================================================================================================================//

namespace NC {
  // Per-layer values kept by a training pass for backpropagation
  struct ForwardCache {
    Tensor2D<double> linears;       // W x + b
    Tensor2D<double> zs;            // Activation inputs (after batch normalization)
    Tensor2D<double> actvs;         // Activation outputs (after dropout)
    Tensor2D<double> dropoutMasks;  // 0 (dropped) or 1/(1-p) (kept); filled only when dropout ran
  };

  class ForwardEngine {
    public:
      // Runs batchSize samples laid out back to back in input (inputSize each) and writes
      // outputSize values per sample to output. Uses the network's working buffers, so calls on
      // the same network must not overlap. Dropout never applies here.
      static ErrorType forwardPass(Network* network, const double* input, double* output, ulong batchSize);

      // Same contract as forwardPass, with contiguous chunks of the batch spread over at most
      // numThreads workers (0 = System default). Each worker has its own scratch buffers, so the
      // network is only read.
      static ErrorType processBatchParallel(Network* network, const double* input, double* output, ulong batchSize,
                                            int numThreads);

      //-- Training support --//
      static void allocateCache(const Network& network, ForwardCache& cache);

      // One sample, keeping every intermediate value. Dropout applies to layers in training
      // mode when rng is given and the network has dropout enabled.
      static ErrorType propagate(const Network& network, const double* input, ForwardCache& cache,
                                 std::mt19937* rng = nullptr);

      // linear = W x + b, zs = batchNorm(linear), actvs = f(zs). zs may alias linear and actvs may
      // alias zs; none of them may alias x.
      static ErrorType computeLayer(const Layer& layer, const double* x, double* linear, double* zs, double* actvs);

    private:
      static ErrorType runSample(const Network& network, const double* input, double* output, double* bufferA,
                                 double* bufferB);
  };
}

#endif // NC_FORWARDENGINE_HPP
