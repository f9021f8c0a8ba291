#ifndef NC_CLI_LOGLEVEL_HPP
#define NC_CLI_LOGLEVEL_HPP

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace NC_CLI
{
  enum class LogLevel : int { QUIET = 0, ERROR = 1, WARNING = 2, INFO = 3, DEBUG = 4 };

  const std::unordered_map<std::string, LogLevel> logLevelMap = {
    {"quiet", LogLevel::QUIET},
    {"error", LogLevel::ERROR},
    {"warning", LogLevel::WARNING},
    {"info", LogLevel::INFO},
    {"debug", LogLevel::DEBUG}
  };
}

//===================================================================================================================//

#endif // NC_CLI_LOGLEVEL_HPP
