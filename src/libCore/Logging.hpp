#pragma once

#include "Logger/Logger.hpp"

#include <string>

namespace tessera {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

//! Log the message as error and throw an InternalError carrying it.
[[noreturn]] void raiseInternalError(const std::string& message);

} // namespace tessera
