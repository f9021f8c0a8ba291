#ifndef NC_TENSOROPS_HPP
#define NC_TENSOROPS_HPP

#include "NC_Error.hpp"

#include <sys/types.h>

//===================================================================================================================//

namespace NC {
  // Operations over flat, row-major arrays. Every ErrorType-returning operation checks its pointers
  // before writing anything.
  template <typename T>
  class TensorOps {
    public:
      //-- Elementwise --//
      static ErrorType add(const T* a, const T* b, T* result, ulong size);
      static ErrorType subtract(const T* a, const T* b, T* result, ulong size);
      static ErrorType elementMultiply(const T* a, const T* b, T* result, ulong size);
      static ErrorType scale(const T* vector, T scalar, T* result, ulong size);

      //-- Reductions --//
      // Returns 0 for null operands without recording an error.
      static T dotProduct(const T* a, const T* b, ulong size);

      //-- Products --//
      // result (m x n) = a (m x k) * b (k x n). Dispatches to the accelerated kernel when
      // System::isAccelerationEnabled() and one exists for T, otherwise to the scalar kernel.
      static ErrorType matrixMultiply(const T* a, const T* b, T* result, ulong m, ulong n, ulong k);
      static ErrorType matrixMultiplyScalar(const T* a, const T* b, T* result, ulong m, ulong n, ulong k);

      // ACCELERATION_UNAVAILABLE (result untouched) when the CPU or T has no kernel.
      static ErrorType matrixMultiplyAccelerated(const T* a, const T* b, T* result, ulong m, ulong n, ulong k);

      // result (m) = a (m x k) * x (k) + bias (m). bias may be null.
      static ErrorType matrixVectorAdd(const T* a, const T* x, const T* bias, T* result, ulong m, ulong k);
  };
}

#endif // NC_TENSOROPS_HPP
