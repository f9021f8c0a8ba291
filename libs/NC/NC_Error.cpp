#include "NC_Error.hpp"

using namespace NC;

//===================================================================================================================//

namespace {
  thread_local std::string lastErrorMessage;
  thread_local ErrorType lastErrorType = ErrorType::SUCCESS;
}

//===================================================================================================================//

std::string Error::typeToName(ErrorType errorType) {
  for (const auto& [name, type] : errorMap) {
    if (type == errorType) {
      return name;
    }
  }

  return "unknown";
}

//===================================================================================================================//

ErrorType Error::report(ErrorType errorType, const std::string& message) {
  lastErrorType = errorType;
  lastErrorMessage = Error::typeToName(errorType) + ": " + message;

  return errorType;
}

//===================================================================================================================//

const std::string& Error::getLast() {
  return lastErrorMessage;
}

//===================================================================================================================//

ErrorType Error::getLastType() {
  return lastErrorType;
}

//===================================================================================================================//

void Error::clear() {
  lastErrorType = ErrorType::SUCCESS;
  lastErrorMessage.clear();
}
