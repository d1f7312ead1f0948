#pragma once

#include "core/IGameListener.hpp"
#include "core/gameEvent.hpp"

#include <vector>

namespace tessera {

//! Forwards game deltas to subscribed listeners, in subscription order, on the calling thread.
class EventHub {
public:
	void subscribe(IGameListener* listener);
	void unsubscribe(IGameListener* listener);

	void signalDelta(const GameDelta& delta);

private:
	std::vector<IGameListener*> m_listeners;
};

} // namespace tessera
