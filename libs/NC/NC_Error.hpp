#ifndef NC_ERROR_HPP
#define NC_ERROR_HPP

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace NC {
  enum class ErrorType {
    SUCCESS = 0,
    NULL_POINTER = -1,
    INVALID_ARGUMENT = -2,
    MEMORY_ALLOCATION = -3,
    INVALID_OPERATION = -4,
    NOT_IMPLEMENTED = -5,
    SIMD_NOT_SUPPORTED = -6,
    ACCELERATION_UNAVAILABLE = -7
  };

  const std::unordered_map<std::string, ErrorType> errorMap = {
    {"success", ErrorType::SUCCESS},
    {"null pointer", ErrorType::NULL_POINTER},
    {"invalid argument", ErrorType::INVALID_ARGUMENT},
    {"memory allocation", ErrorType::MEMORY_ALLOCATION},
    {"invalid operation", ErrorType::INVALID_OPERATION},
    {"not implemented", ErrorType::NOT_IMPLEMENTED},
    {"simd not supported", ErrorType::SIMD_NOT_SUPPORTED},
    {"acceleration unavailable", ErrorType::ACCELERATION_UNAVAILABLE}
  };

  // Last-error bookkeeping is kept per thread, so concurrent callers never see each other's messages.
  class Error {
    public:
      static std::string typeToName(ErrorType errorType);

      // Records the error as the calling thread's last error and returns it, so call sites can
      // write `return Error::report(ErrorType::NULL_POINTER, "...")`.
      static ErrorType report(ErrorType errorType, const std::string& message);

      static const std::string& getLast();
      static ErrorType getLastType();
      static void clear();
  };
}

#endif // NC_ERROR_HPP
