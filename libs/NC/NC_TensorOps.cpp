#include "NC_TensorOps.hpp"
#include "NC_Simd.hpp"
#include "NC_System.hpp"

#include <type_traits>

using namespace NC;

//===================================================================================================================//

namespace {
  template <typename T>
  bool anyNull(const T* a, const T* b, const T* result) {
    return a == nullptr || b == nullptr || result == nullptr;
  }
}

//===================================================================================================================//

template <typename T>
ErrorType TensorOps<T>::add(const T* a, const T* b, T* result, ulong size) {
  if (anyNull(a, b, result)) {
    return Error::report(ErrorType::NULL_POINTER, "add requires non-null operands");
  }

  for (ulong i = 0; i < size; i++) {
    result[i] = a[i] + b[i];
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

template <typename T>
ErrorType TensorOps<T>::subtract(const T* a, const T* b, T* result, ulong size) {
  if (anyNull(a, b, result)) {
    return Error::report(ErrorType::NULL_POINTER, "subtract requires non-null operands");
  }

  for (ulong i = 0; i < size; i++) {
    result[i] = a[i] - b[i];
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

template <typename T>
ErrorType TensorOps<T>::elementMultiply(const T* a, const T* b, T* result, ulong size) {
  if (anyNull(a, b, result)) {
    return Error::report(ErrorType::NULL_POINTER, "elementMultiply requires non-null operands");
  }

  for (ulong i = 0; i < size; i++) {
    result[i] = a[i] * b[i];
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

template <typename T>
ErrorType TensorOps<T>::scale(const T* vector, T scalar, T* result, ulong size) {
  if (vector == nullptr || result == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "scale requires non-null operands");
  }

  for (ulong i = 0; i < size; i++) {
    result[i] = vector[i] * scalar;
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

template <typename T>
T TensorOps<T>::dotProduct(const T* a, const T* b, ulong size) {
  if (a == nullptr || b == nullptr) {
    return 0;
  }

  T sum = 0;

  for (ulong i = 0; i < size; i++) {
    sum += a[i] * b[i];
  }

  return sum;
}

//===================================================================================================================//

template <typename T>
ErrorType TensorOps<T>::matrixMultiply(const T* a, const T* b, T* result, ulong m, ulong n, ulong k) {
  if (anyNull(a, b, result)) {
    return Error::report(ErrorType::NULL_POINTER, "matrixMultiply requires non-null operands");
  }

  if constexpr (std::is_same_v<T, double>) {
    if (System::isAccelerationEnabled()) {
      ErrorType errorType = TensorOps<T>::matrixMultiplyAccelerated(a, b, result, m, n, k);

      if (errorType != ErrorType::ACCELERATION_UNAVAILABLE) {
        return errorType;
      }
    }
  }

  return TensorOps<T>::matrixMultiplyScalar(a, b, result, m, n, k);
}

//===================================================================================================================//

template <typename T>
ErrorType TensorOps<T>::matrixMultiplyScalar(const T* a, const T* b, T* result, ulong m, ulong n, ulong k) {
  if (anyNull(a, b, result)) {
    return Error::report(ErrorType::NULL_POINTER, "matrixMultiply requires non-null operands");
  }

  for (ulong i = 0; i < m; i++) {
    for (ulong j = 0; j < n; j++) {
      T sum = 0;

      for (ulong p = 0; p < k; p++) {
        sum += a[i * k + p] * b[p * n + j];
      }

      result[i * n + j] = sum;
    }
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

template <typename T>
ErrorType TensorOps<T>::matrixMultiplyAccelerated(const T* a, const T* b, T* result, ulong m, ulong n, ulong k) {
  if (anyNull(a, b, result)) {
    return Error::report(ErrorType::NULL_POINTER, "matrixMultiply requires non-null operands");
  }

  if constexpr (std::is_same_v<T, double>) {
    if (!Simd::isSupported()) {
      return Error::report(ErrorType::ACCELERATION_UNAVAILABLE, "no accelerated kernel for this CPU");
    }

    return Simd::matrixMultiply(a, b, result, m, n, k);
  } else {
    return Error::report(ErrorType::ACCELERATION_UNAVAILABLE, "accelerated kernels exist for double only");
  }
}

//===================================================================================================================//

template <typename T>
ErrorType TensorOps<T>::matrixVectorAdd(const T* a, const T* x, const T* bias, T* result, ulong m, ulong k) {
  ErrorType errorType = TensorOps<T>::matrixMultiply(a, x, result, m, 1, k);

  if (errorType != ErrorType::SUCCESS || bias == nullptr) {
    return errorType;
  }

  return TensorOps<T>::add(result, bias, result, m);
}

//===================================================================================================================//

// Explicit template instantiations
template class NC::TensorOps<float>;
template class NC::TensorOps<double>;
