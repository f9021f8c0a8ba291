#ifndef NC_ACTVFUNC_HPP
#define NC_ACTVFUNC_HPP

#include "NC_Error.hpp"

#include <sys/types.h>

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace NC {
  enum class ActvFuncType {
    SIGMOID,
    TANH,
    RELU,
    LEAKY_RELU,
    SWISH,
    GELU,
    SOFTMAX,
    UNKNOWN
  };

  const std::unordered_map<std::string, ActvFuncType> actvMap = {
    {"sigmoid", ActvFuncType::SIGMOID},
    {"tanh", ActvFuncType::TANH},
    {"relu", ActvFuncType::RELU},
    {"leaky_relu", ActvFuncType::LEAKY_RELU},
    {"swish", ActvFuncType::SWISH},
    {"gelu", ActvFuncType::GELU},
    {"softmax", ActvFuncType::SOFTMAX}
  };

  class ActvFunc {
    public:
      static constexpr double leakyReluSlope = 0.01;

      // UNKNOWN for names not in actvMap
      static ActvFuncType nameToType(const std::string& name);
      static std::string typeToName(ActvFuncType actvFuncType);

      // output[i] = f(input[i]). Softmax normalizes over the whole vector, subtracting its maximum
      // first. input and output may be the same array.
      template <typename T>
      static ErrorType apply(const T* input, T* output, ulong size, ActvFuncType actvFuncType);

      // output[i] = f'(input[i]), with input the pre-activation values. GELU uses the exact
      // derivative of the tanh approximation. Softmax yields the Jacobian diagonal s(1 - s).
      template <typename T>
      static ErrorType derivative(const T* input, T* output, ulong size, ActvFuncType actvFuncType);

      // Chain rule step: dCost_dZs = J(zs)^T * dCost_dActvs. Elementwise for every type except
      // softmax, where the full Jacobian is applied. dCost_dZs must not alias zs or dCost_dActvs.
      template <typename T>
      static ErrorType backward(const T* zs, const T* dCost_dActvs, T* dCost_dZs, ulong size, ActvFuncType actvFuncType);
  };
}

#endif // NC_ACTVFUNC_HPP
