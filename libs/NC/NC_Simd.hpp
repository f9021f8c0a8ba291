#ifndef NC_SIMD_HPP
#define NC_SIMD_HPP

#include "NC_Error.hpp"

#include <sys/types.h>

#include <string>

//===================================================================================================================//

namespace NC {
  // AVX2/FMA kernels over doubles (4 lanes). Lane accumulation reorders the sums, so results match the
  // scalar kernels to within rounding, not bit for bit.
  class Simd {
    public:
      // Whether this build carries the kernels at all (x86-64 with a GCC-compatible compiler).
      static bool isCompiledIn();

      // Whether the running CPU can execute them.
      static bool isSupported();

      static std::string getInstructionSet();

      // Same contract as TensorOps::matrixMultiply. Returns SIMD_NOT_SUPPORTED without touching result
      // when the kernels cannot run here. Inputs and result must not overlap.
      static ErrorType matrixMultiply(const double* a, const double* b, double* result, ulong m, ulong n, ulong k);

      static ErrorType dotProduct(const double* a, const double* b, ulong size, double& result);
  };
}

#endif // NC_SIMD_HPP
