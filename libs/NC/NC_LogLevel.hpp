#ifndef NC_LOGLEVEL_HPP
#define NC_LOGLEVEL_HPP

//===================================================================================================================//

namespace NC {
  enum class LogLevel : int { QUIET = 0, ERROR = 1, WARNING = 2, INFO = 3, DEBUG = 4 };
}

//===================================================================================================================//

#endif // NC_LOGLEVEL_HPP
