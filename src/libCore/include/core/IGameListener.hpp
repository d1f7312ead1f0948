#pragma once

#include "core/gameEvent.hpp"

namespace tessera {

class IGameListener {
public:
	virtual ~IGameListener()                         = default;
	virtual void onGameDelta(const GameDelta& delta) = 0;
};

} // namespace tessera
