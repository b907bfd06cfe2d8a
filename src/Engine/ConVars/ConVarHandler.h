#pragma once
// Copyright (c) 2011, PG & 2025, WH & 2026, hitcore contributors, All rights reserved.

#include "types.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class ConVar;

class ConVarHandler {
   public:
    static std::string flagsToString(u8 flags);

   public:
    ConVarHandler();
    ~ConVarHandler() = default;

    ConVarHandler(const ConVarHandler &) = delete;
    ConVarHandler &operator=(const ConVarHandler &) = delete;

    void addConVar(ConVar *c);

    [[nodiscard]] inline const std::vector<ConVar *> &getConVarArray() const { return this->vConVarArray; }
    [[nodiscard]] inline size_t getNumConVars() const { return this->vConVarArray.size(); }

    [[nodiscard]] ConVar *getConVarByName(std::string_view name, bool warnIfNotFound = true) const;
    [[nodiscard]] std::vector<ConVar *> getConVarByLetter(std::string_view letters) const;

    // PROTECTED convars that differ from their default, scores played with any of these aren't recorded
    [[nodiscard]] std::vector<ConVar *> getNonSubmittableCvars() const;
    [[nodiscard]] bool areAllCvarsSubmittable() const;

    // restore every convar to its default value (no callbacks)
    void resetAll();

    // GAMEPLAY convars reject changes while this is set
    inline void setGameplayLock(bool locked) { this->bGameplayLocked = locked; }
    [[nodiscard]] inline bool isGameplayLocked() const { return this->bGameplayLocked; }

   private:
    [[nodiscard]] ConVar *getConVar_int(std::string_view name) const;

    std::vector<ConVar *> vConVarArray;
    std::unordered_map<std::string_view, ConVar *> vConVarMap;
    bool bGameplayLocked{false};
};

ConVarHandler &cvars();
