#pragma once

#include <stdexcept>

namespace tessera {

//! Broken engine invariant: stale group handle, oscillation reaching the resolver, exhausted arena.
//! Never a consequence of user input. Declined moves are reported through return values instead.
class InternalError : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

} // namespace tessera
