#pragma once
// Copyright (c) 2026, hitcore contributors, All rights reserved.

#include "ConVar.h"

#ifndef DEFINE_GAME_CONVARS
#include "GameConVarDefs.h"
#endif
