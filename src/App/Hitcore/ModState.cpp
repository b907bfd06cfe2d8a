// Copyright (c) 2026, hitcore contributors, All rights reserved.
#include "ModState.h"

#include "SString.h"

#include <algorithm>

using namespace flags::operators;

const std::array<ModInfo, ModState::NUM_MODS> &ModState::getAllMods() {
    static constexpr ModFlags AUTOMATION = ModFlags::Relax | ModFlags::Autopilot | ModFlags::Autoplay;

    static const std::array<ModInfo, NUM_MODS> s_mods{{
        {ModFlags::NoFail, "NF", "No Fail", 0.5, ModFlags::None},
        {ModFlags::Easy, "EZ", "Easy", 0.5, ModFlags::HardRock},
        {ModFlags::HalfTime, "HT", "Half Time", 0.3, ModFlags::DoubleTime},
        {ModFlags::HardRock, "HR", "Hard Rock", 1.06, ModFlags::Easy},
        {ModFlags::DoubleTime, "DT", "Double Time", 1.12, ModFlags::HalfTime},
        {ModFlags::Hidden, "HD", "Hidden", 1.06, ModFlags::None},
        {ModFlags::Flashlight, "FL", "Flashlight", 1.12, ModFlags::None},
        {ModFlags::Relax, "RX", "Relax", 0.0, AUTOMATION & ~ModFlags::Relax},
        {ModFlags::Autopilot, "AP", "Autopilot", 0.0, AUTOMATION & ~ModFlags::Autopilot},
        {ModFlags::Autoplay, "AT", "Autoplay", 1.0, AUTOMATION & ~ModFlags::Autoplay},
    }};
    return s_mods;
}

const ModInfo *ModState::getModInfo(ModFlags mod) {
    const auto &mods = getAllMods();
    const auto it = std::ranges::find(mods, mod, &ModInfo::flag);
    return it != mods.end() ? &*it : nullptr;
}

std::optional<ModState> ModState::fromString(std::string_view str) {
    SString::trim_inplace(str);

    ModState state;
    const std::string upper = SString::to_upper(str);
    if(upper.empty() || upper == "NONE" || upper == "NM") return state;
    if(upper.size() % 2 != 0) return std::nullopt;

    const auto &mods = getAllMods();
    for(size_t i = 0; i < upper.size(); i += 2) {
        const std::string_view acronym = std::string_view{upper}.substr(i, 2);
        const auto it = std::ranges::find(mods, acronym, &ModInfo::acronym);
        if(it == mods.end()) return std::nullopt;
        state.set(it->flag, true);
    }
    return state;
}

ModState ModState::deserialize(u64 bits) {
    ModState state;
    for(const auto &mod : getAllMods()) {
        if((bits & static_cast<u64>(mod.flag)) != 0) state.set(mod.flag, true);
    }
    return state;
}

void ModState::toggle(ModFlags mod) { this->set(mod, !this->has(mod)); }

void ModState::set(ModFlags mod, bool enabled) {
    if(!enabled) {
        this->flags &= ~mod;
        return;
    }

    // clear partners together with enabling, so an exclusive pair can never be observed
    ModFlags cleared = this->flags;
    if(const ModInfo *info = getModInfo(mod)) cleared &= ~info->exclusive;
    this->flags = cleared | mod;
}

DifficultyAttributes ModState::applyToDifficulty(const DifficultyAttributes &base) const {
    // HR and EZ are exclusive, so these never compound
    const f32 csMult = this->has(ModFlags::HardRock) ? 1.3f : this->has(ModFlags::Easy) ? 0.5f : 1.0f;
    const f32 mult = this->has(ModFlags::HardRock) ? 1.4f : this->has(ModFlags::Easy) ? 0.5f : 1.0f;

    return DifficultyAttributes{
        .AR = std::clamp<f32>(base.AR * mult, 0.0f, 10.0f),
        .CS = std::clamp<f32>(base.CS * csMult, 0.0f, 10.0f),
        .OD = std::clamp<f32>(base.OD * mult, 0.0f, 10.0f),
        .HP = std::clamp<f32>(base.HP * mult, 0.0f, 10.0f),
    };
}

f32 ModState::getSpeedMultiplier() const {
    if(this->has(ModFlags::DoubleTime)) return 1.5f;
    if(this->has(ModFlags::HalfTime)) return 0.75f;
    return 1.0f;
}

f64 ModState::getScoreMultiplier() const {
    f64 multiplier = 1.0;
    for(const auto &mod : getAllMods()) {
        if(this->has(mod.flag)) multiplier *= mod.scoreMultiplier;
    }
    return multiplier;
}

f32 ModState::getDrainMultiplier() const {
    if(this->has(ModFlags::NoFail)) return 0.0f;
    if(this->has(ModFlags::Easy)) return 0.5f;
    if(this->has(ModFlags::HardRock)) return 1.4f;
    return 1.0f;
}

bool ModState::isRanked() const {
    return !flags::any<ModFlags::Relax | ModFlags::Autopilot | ModFlags::Autoplay>(this->flags);
}

AutoplayMode ModState::getAutoplayMode() const {
    if(this->has(ModFlags::Autoplay)) return AutoplayMode::Auto;
    if(this->has(ModFlags::Relax)) return AutoplayMode::Relax;
    if(this->has(ModFlags::Autopilot)) return AutoplayMode::Autopilot;
    return AutoplayMode::None;
}

std::string ModState::toString() const {
    if(this->isNoMod()) return "None";

    // conventional display order
    static constexpr std::array order{ModFlags::Relax,    ModFlags::Autopilot,  ModFlags::Autoplay,
                                      ModFlags::NoFail,   ModFlags::Easy,       ModFlags::HalfTime,
                                      ModFlags::Hidden,   ModFlags::HardRock,   ModFlags::DoubleTime,
                                      ModFlags::Flashlight};
    std::string str;
    for(ModFlags mod : order) {
        if(this->has(mod)) str.append(getModInfo(mod)->acronym);
    }
    return str;
}
