#include "NC_Simd.hpp"

#if defined(__x86_64__) && (defined(__GNUC__) || defined(__clang__))
#define NC_SIMD_X86 1
#include <immintrin.h>
#endif

using namespace NC;

//===================================================================================================================//

#ifdef NC_SIMD_X86

namespace {
  __attribute__((target("avx2,fma"))) double dotAvx2(const double* a, const double* b, ulong size) {
    __m256d sum = _mm256_setzero_pd();
    ulong i = 0;

    for (; i + 4 <= size; i += 4) {
      __m256d va = _mm256_loadu_pd(a + i);
      __m256d vb = _mm256_loadu_pd(b + i);
      sum = _mm256_fmadd_pd(va, vb, sum);
    }

    double lanes[4];
    _mm256_storeu_pd(lanes, sum);
    double result = lanes[0] + lanes[1] + lanes[2] + lanes[3];

    for (; i < size; i++) {
      result += a[i] * b[i];
    }

    return result;
  }

  //=================================================================================================================//

  __attribute__((target("avx2,fma"))) void matrixMultiplyAvx2(const double* a, const double* b, double* result,
                                                              ulong m, ulong n, ulong k) {
    // Matrix-vector products (n == 1) vectorize along k instead of along the output columns.
    if (n == 1) {
      for (ulong i = 0; i < m; i++) {
        result[i] = dotAvx2(a + i * k, b, k);
      }

      return;
    }

    for (ulong i = 0; i < m; i++) {
      const double* aRow = a + i * k;
      double* resultRow = result + i * n;
      ulong j = 0;

      for (; j + 4 <= n; j += 4) {
        __m256d sum = _mm256_setzero_pd();

        for (ulong p = 0; p < k; p++) {
          __m256d va = _mm256_set1_pd(aRow[p]);
          __m256d vb = _mm256_loadu_pd(b + p * n + j);
          sum = _mm256_fmadd_pd(va, vb, sum);
        }

        _mm256_storeu_pd(resultRow + j, sum);
      }

      // Remaining columns that do not fill a full lane
      for (; j < n; j++) {
        double sum = 0.0;

        for (ulong p = 0; p < k; p++) {
          sum += aRow[p] * b[p * n + j];
        }

        resultRow[j] = sum;
      }
    }
  }
}

#endif

//===================================================================================================================//

bool Simd::isCompiledIn() {
#ifdef NC_SIMD_X86
  return true;
#else
  return false;
#endif
}

//===================================================================================================================//

bool Simd::isSupported() {
#ifdef NC_SIMD_X86
  static const bool supported = __builtin_cpu_supports("avx2") && __builtin_cpu_supports("fma");
  return supported;
#else
  return false;
#endif
}

//===================================================================================================================//

std::string Simd::getInstructionSet() {
  return Simd::isSupported() ? "AVX2+FMA" : "none";
}

//===================================================================================================================//

ErrorType Simd::matrixMultiply(const double* a, const double* b, double* result, ulong m, ulong n, ulong k) {
  if (a == nullptr || b == nullptr || result == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "matrix multiply requires non-null operands");
  }

  if (!Simd::isSupported()) {
    return Error::report(ErrorType::SIMD_NOT_SUPPORTED, "AVX2/FMA is not available on this CPU or build");
  }

#ifdef NC_SIMD_X86
  matrixMultiplyAvx2(a, b, result, m, n, k);
#endif

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

ErrorType Simd::dotProduct(const double* a, const double* b, ulong size, double& result) {
  if (a == nullptr || b == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "dot product requires non-null operands");
  }

  if (!Simd::isSupported()) {
    return Error::report(ErrorType::SIMD_NOT_SUPPORTED, "AVX2/FMA is not available on this CPU or build");
  }

#ifdef NC_SIMD_X86
  result = dotAvx2(a, b, size);
#endif

  return ErrorType::SUCCESS;
}
