#pragma once

#include "core/IGameSignalListener.hpp"
#include "core/IGameStateListener.hpp"

#include <vector>

namespace unvoid {

//! Allows external components to be updated on internal game events.
//! \note Signals are synchronous and run on the caller thread.
class EventHub {
	struct SignalListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	void signal(GameSignal signal);           //!< Signal a game event.
	void signalDelta(const MoveDelta& delta); //!< Signal a move to the state listeners.

private:
	std::vector<SignalListenerEntry> m_signalListeners;
	std::vector<IGameStateListener*> m_stateListeners;
};

} // namespace unvoid
