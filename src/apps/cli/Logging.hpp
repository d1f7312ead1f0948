#pragma once

#include "Logger/Logger.hpp"

namespace tessera::cli {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace tessera::cli
