#pragma once
// Copyright (c) 2026, hitcore contributors, All rights reserved.
#include "ModFlags.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

// AR/CS/OD/HP, raw 0-10 before mod adjustment
struct DifficultyAttributes {
    f32 AR{5.f};
    f32 CS{5.f};
    f32 OD{5.f};
    f32 HP{5.f};

    bool operator==(const DifficultyAttributes &) const = default;
};

enum class AutoplayMode : u8 {
    None,       // human input
    Auto,       // cursor and clicks are scripted
    Relax,      // clicks are scripted
    Autopilot,  // cursor is scripted
};

struct ModInfo {
    ModFlags flag;
    std::string_view acronym;
    std::string_view name;
    f64 scoreMultiplier;
    ModFlags exclusive;  // cleared whenever this mod is enabled
};

class ModState {
   public:
    static constexpr size_t NUM_MODS = 10;
    static const std::array<ModInfo, NUM_MODS> &getAllMods();
    [[nodiscard]] static const ModInfo *getModInfo(ModFlags mod);

    // "HDDT", "hrhd", "None"/"NM"/"" for nomod; nullopt on any unknown acronym
    // mods are applied left to right, so later mods win exclusivity conflicts
    [[nodiscard]] static std::optional<ModState> fromString(std::string_view str);

    // unknown bits are dropped, conflicting bits are resolved in mod table order
    [[nodiscard]] static ModState deserialize(u64 bits);

    ModState() = default;

    // flips the bit, enabling also clears every mod declared exclusive with it
    void toggle(ModFlags mod);
    void set(ModFlags mod, bool enabled);
    inline void clear() { this->flags = ModFlags::None; }

    [[nodiscard]] inline bool has(ModFlags flag) const {
        using namespace flags::operators;
        return (this->flags & flag) == flag;
    }
    [[nodiscard]] inline ModFlags getFlags() const { return this->flags; }
    [[nodiscard]] inline bool isNoMod() const { return this->flags == ModFlags::None; }

    [[nodiscard]] DifficultyAttributes applyToDifficulty(const DifficultyAttributes &base) const;

    // playback clock speed, hit windows stay in absolute milliseconds
    [[nodiscard]] f32 getSpeedMultiplier() const;
    [[nodiscard]] f64 getScoreMultiplier() const;
    [[nodiscard]] f32 getDrainMultiplier() const;

    // false under any automation mod
    [[nodiscard]] bool isRanked() const;
    [[nodiscard]] AutoplayMode getAutoplayMode() const;

    [[nodiscard]] std::string toString() const;
    [[nodiscard]] inline u64 serialize() const { return static_cast<u64>(this->flags); }

    bool operator==(const ModState &) const = default;

   private:
    ModFlags flags{ModFlags::None};
};
