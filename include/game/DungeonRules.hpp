#pragma once

#include "session/GameSession.hpp"

// Dungeon state, room generator, monster turns and the move/attack/pickup/wait actions.
GameRules MakeDungeonRules();
