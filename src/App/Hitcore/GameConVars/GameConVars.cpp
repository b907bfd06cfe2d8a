// Copyright (c) 2026, hitcore contributors, All rights reserved.
#include "ConVar.h"

#define DEFINE_GAME_CONVARS
#include "GameConVarDefs.h"
