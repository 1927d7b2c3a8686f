#pragma once

#include "core/gameEvent.hpp"

namespace unvoid {

class IGameSignalListener {
public:
	virtual ~IGameSignalListener()              = default;
	virtual void onGameEvent(GameSignal signal) = 0;
};

} // namespace unvoid
