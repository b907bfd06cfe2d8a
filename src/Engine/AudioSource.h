#pragma once
// Copyright (c) 2026, hitcore contributors, All rights reserved.

#include "types.h"

#include <functional>
#include <string_view>

// playback backend driven by the gameplay clock
// once play() was called, getPositionMS() is the authoritative song time
class AbstractAudioSource {
   public:
    // true if the source is decoded and ready to play
    using LoadCallback = std::function<void(bool success)>;

    AbstractAudioSource() = default;
    virtual ~AbstractAudioSource() = default;

    AbstractAudioSource(const AbstractAudioSource &) = delete;
    AbstractAudioSource &operator=(const AbstractAudioSource &) = delete;
    AbstractAudioSource(AbstractAudioSource &&) = delete;
    AbstractAudioSource &operator=(AbstractAudioSource &&) = delete;

    // a single outstanding request, the callback may run synchronously or on a later tick (never on another thread)
    virtual void load(std::string_view path, LoadCallback onLoaded) = 0;

    // starts (or seeks and continues) playback at the given song position
    virtual void play(f64 positionMS) = 0;
    virtual void stop() = 0;

    // playback speed, 1.5 for DT
    virtual void setRate(f32 rate) = 0;

    // 0 if not playing or if the backend has no position yet
    [[nodiscard]] virtual f64 getPositionMS() const = 0;
    [[nodiscard]] virtual f64 getDurationMS() const = 0;
};
