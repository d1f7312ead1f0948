#include "core/eventHub.hpp"

#include <algorithm>

namespace tessera {

void EventHub::subscribe(IGameListener* listener) {
	if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
		m_listeners.push_back(listener);
	}
}

void EventHub::unsubscribe(IGameListener* listener) {
	m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener), m_listeners.end());
}

void EventHub::signalDelta(const GameDelta& delta) {
	for (auto* listener: m_listeners) {
		listener->onGameDelta(delta);
	}
}

} // namespace tessera
