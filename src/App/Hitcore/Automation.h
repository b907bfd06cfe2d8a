#pragma once
// Copyright (c) 2026, hitcore contributors, All rights reserved.

#include "types.h"

class PlaySession;

// scripted cursor and clicks for Autoplay, Relax and Autopilot
// runs inside PlaySession::update(), after timeouts and before drain
class Automation {
   public:
    void reset();
    void update(PlaySession &session);

   private:
    void updateCursor(PlaySession &session);
    void updateClicks(PlaySession &session);

    // index of the last object a scripted click was fired for, avoids re-firing while a slider head is held
    i64 iLastClickedIndex{-1};
    // scripted clicks alternate between the two keys
    bool bNextKeyIsK2{false};
};
