#pragma once

#include "core/gameEvent.hpp"

namespace unvoid {

class IGameStateListener {
public:
	virtual ~IGameStateListener()                    = default;
	virtual void onMoveDelta(const MoveDelta& delta) = 0;
};

} // namespace unvoid
