#include "NC_ActvFunc.hpp"

#include <algorithm>
#include <cmath>

using namespace NC;

//===================================================================================================================//

namespace {
  // sqrt(2 / pi)
  constexpr double geluScale = 0.7978845608028654;
  constexpr double geluCubic = 0.044715;

  template <typename T>
  T sigmoid(T x) {
    return static_cast<T>(1) / (static_cast<T>(1) + std::exp(-x));
  }

  template <typename T>
  T gelu(T x) {
    T inner = static_cast<T>(geluScale) * (x + static_cast<T>(geluCubic) * x * x * x);
    return static_cast<T>(0.5) * x * (static_cast<T>(1) + std::tanh(inner));
  }

  template <typename T>
  T dGelu(T x) {
    T inner = static_cast<T>(geluScale) * (x + static_cast<T>(geluCubic) * x * x * x);
    T t = std::tanh(inner);
    T dInner = static_cast<T>(geluScale) * (static_cast<T>(1) + static_cast<T>(3 * geluCubic) * x * x);

    return static_cast<T>(0.5) * (static_cast<T>(1) + t) + static_cast<T>(0.5) * x * (static_cast<T>(1) - t * t) * dInner;
  }

  template <typename T>
  void softmax(const T* input, T* output, ulong size) {
    if (size == 0) {
      return;
    }

    T maxValue = *std::max_element(input, input + size);
    T sum = 0;

    for (ulong i = 0; i < size; i++) {
      output[i] = std::exp(input[i] - maxValue);
      sum += output[i];
    }

    for (ulong i = 0; i < size; i++) {
      output[i] /= sum;
    }
  }
}

//===================================================================================================================//

ActvFuncType ActvFunc::nameToType(const std::string& name) {
  auto it = actvMap.find(name);

  if (it == actvMap.end()) {
    return ActvFuncType::UNKNOWN;
  }

  return it->second;
}

//===================================================================================================================//

std::string ActvFunc::typeToName(ActvFuncType actvFuncType) {
  for (const auto& [name, type] : actvMap) {
    if (type == actvFuncType) {
      return name;
    }
  }

  return "unknown";
}

//===================================================================================================================//

template <typename T>
ErrorType ActvFunc::apply(const T* input, T* output, ulong size, ActvFuncType actvFuncType) {
  if (input == nullptr || output == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "activation requires non-null input and output");
  }

  switch (actvFuncType) {
    case ActvFuncType::SIGMOID:
      for (ulong i = 0; i < size; i++) output[i] = sigmoid(input[i]);
      break;
    case ActvFuncType::TANH:
      for (ulong i = 0; i < size; i++) output[i] = std::tanh(input[i]);
      break;
    case ActvFuncType::RELU:
      for (ulong i = 0; i < size; i++) output[i] = std::max(input[i], static_cast<T>(0));
      break;
    case ActvFuncType::LEAKY_RELU:
      for (ulong i = 0; i < size; i++) output[i] = input[i] > 0 ? input[i] : static_cast<T>(leakyReluSlope) * input[i];
      break;
    case ActvFuncType::SWISH:
      for (ulong i = 0; i < size; i++) output[i] = input[i] * sigmoid(input[i]);
      break;
    case ActvFuncType::GELU:
      for (ulong i = 0; i < size; i++) output[i] = gelu(input[i]);
      break;
    case ActvFuncType::SOFTMAX:
      softmax(input, output, size);
      break;
    default:
      return Error::report(ErrorType::INVALID_ARGUMENT, "unknown activation function");
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

template <typename T>
ErrorType ActvFunc::derivative(const T* input, T* output, ulong size, ActvFuncType actvFuncType) {
  if (input == nullptr || output == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "activation derivative requires non-null input and output");
  }

  switch (actvFuncType) {
    case ActvFuncType::SIGMOID:
      for (ulong i = 0; i < size; i++) {
        T s = sigmoid(input[i]);
        output[i] = s * (static_cast<T>(1) - s);
      }
      break;
    case ActvFuncType::TANH:
      for (ulong i = 0; i < size; i++) {
        T t = std::tanh(input[i]);
        output[i] = static_cast<T>(1) - t * t;
      }
      break;
    case ActvFuncType::RELU:
      for (ulong i = 0; i < size; i++) output[i] = input[i] > 0 ? static_cast<T>(1) : static_cast<T>(0);
      break;
    case ActvFuncType::LEAKY_RELU:
      for (ulong i = 0; i < size; i++) output[i] = input[i] > 0 ? static_cast<T>(1) : static_cast<T>(leakyReluSlope);
      break;
    case ActvFuncType::SWISH:
      for (ulong i = 0; i < size; i++) {
        T s = sigmoid(input[i]);
        output[i] = s + input[i] * s * (static_cast<T>(1) - s);
      }
      break;
    case ActvFuncType::GELU:
      for (ulong i = 0; i < size; i++) output[i] = dGelu(input[i]);
      break;
    case ActvFuncType::SOFTMAX:
      softmax(input, output, size);
      for (ulong i = 0; i < size; i++) output[i] = output[i] * (static_cast<T>(1) - output[i]);
      break;
    default:
      return Error::report(ErrorType::INVALID_ARGUMENT, "unknown activation function");
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

template <typename T>
ErrorType ActvFunc::backward(const T* zs, const T* dCost_dActvs, T* dCost_dZs, ulong size, ActvFuncType actvFuncType) {
  if (zs == nullptr || dCost_dActvs == nullptr || dCost_dZs == nullptr) {
    return Error::report(ErrorType::NULL_POINTER, "activation backward requires non-null arrays");
  }

  if (actvFuncType == ActvFuncType::SOFTMAX) {
    // dCost_dZs[i] = s[i] * (dCost_dActvs[i] - sum_j dCost_dActvs[j] * s[j])
    softmax(zs, dCost_dZs, size);

    T weighted = 0;

    for (ulong j = 0; j < size; j++) {
      weighted += dCost_dActvs[j] * dCost_dZs[j];
    }

    for (ulong i = 0; i < size; i++) {
      dCost_dZs[i] = dCost_dZs[i] * (dCost_dActvs[i] - weighted);
    }

    return ErrorType::SUCCESS;
  }

  ErrorType errorType = ActvFunc::derivative(zs, dCost_dZs, size, actvFuncType);

  if (errorType != ErrorType::SUCCESS) {
    return errorType;
  }

  for (ulong i = 0; i < size; i++) {
    dCost_dZs[i] *= dCost_dActvs[i];
  }

  return ErrorType::SUCCESS;
}

//===================================================================================================================//

// Explicit template instantiations
template ErrorType ActvFunc::apply<float>(const float*, float*, ulong, ActvFuncType);
template ErrorType ActvFunc::apply<double>(const double*, double*, ulong, ActvFuncType);
template ErrorType ActvFunc::derivative<float>(const float*, float*, ulong, ActvFuncType);
template ErrorType ActvFunc::derivative<double>(const double*, double*, ulong, ActvFuncType);
template ErrorType ActvFunc::backward<float>(const float*, const float*, float*, ulong, ActvFuncType);
template ErrorType ActvFunc::backward<double>(const double*, const double*, double*, ulong, ActvFuncType);
