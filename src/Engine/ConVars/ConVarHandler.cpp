// Copyright (c) 2011, PG & 2025, WH & 2025, kiwec & 2026, hitcore contributors, All rights reserved.
#include "ConVarHandler.h"
#include "ConVar.h"

#include "Console.h"
#include "Logging.h"
#include "SString.h"

#include <algorithm>
#include <array>
#include <unordered_set>

// singleton init
ConVarHandler &cvars() {
    static ConVarHandler instance;
    return instance;
}

ConVarHandler::ConVarHandler() {
    this->vConVarArray.reserve(128);
    this->vConVarMap.reserve(128);
}

void ConVarHandler::addConVar(ConVar *c) {
    const std::string_view name = c->getName();
    if(this->vConVarMap.contains(name)) {
        // static init, the logger may not be up yet (falls back to printf)
        logRaw("ENGINE: ConVar \"{:s}\" is already registered, ignoring duplicate", name);
        return;
    }
    this->vConVarArray.push_back(c);
    this->vConVarMap.emplace(name, c);
}

ConVar *ConVarHandler::getConVar_int(std::string_view name) const {
    auto it = this->vConVarMap.find(name);
    if(it != this->vConVarMap.end()) return it->second;
    return nullptr;
}

ConVar *ConVarHandler::getConVarByName(std::string_view name, bool warnIfNotFound) const {
    ConVar *found = this->getConVar_int(name);
    if(found) return found;

    if(warnIfNotFound) {
        logRaw("ENGINE: ConVar \"{:s}\" does not exist...", name);
    }
    return nullptr;
}

std::vector<ConVar *> ConVarHandler::getConVarByLetter(std::string_view letters) const {
    std::unordered_set<std::string_view> matchingConVarNames;
    std::vector<ConVar *> matchingConVars;
    if(letters.length() < 1) return matchingConVars;

    // first try matching the prefix
    for(auto *convar : this->vConVarArray) {
        if(convar->isFlagSet(cv::HIDDEN)) continue;

        const std::string_view name = convar->getName();
        if(name.starts_with(letters)) {
            matchingConVarNames.insert(name);
            matchingConVars.push_back(convar);
        }
    }

    // then try matching substrings
    if(letters.length() > 1) {
        for(auto *convar : this->vConVarArray) {
            if(convar->isFlagSet(cv::HIDDEN)) continue;

            const std::string_view name = convar->getName();
            if(name.find(letters) != std::string::npos && !matchingConVarNames.contains(name)) {
                matchingConVarNames.insert(name);
                matchingConVars.push_back(convar);
            }
        }
    }

    // (results should be displayed in vector order)
    return matchingConVars;
}

std::vector<ConVar *> ConVarHandler::getNonSubmittableCvars() const {
    std::vector<ConVar *> list;
    for(auto *convar : this->vConVarArray) {
        if(!convar->isFlagSet(cv::PROTECTED) || !convar->canHaveValue()) continue;
        if(!convar->isDefault()) list.push_back(convar);
    }
    return list;
}

bool ConVarHandler::areAllCvarsSubmittable() const { return this->getNonSubmittableCvars().empty(); }

void ConVarHandler::resetAll() {
    for(auto *convar : this->vConVarArray) {
        convar->reset();
    }
}

std::string ConVarHandler::flagsToString(u8 flags) {
    if(flags == 0) {
        return "no flags";
    }

    static constexpr const auto flagStringPairArray =
        std::array{std::pair{cv::CLIENT, "client"}, std::pair{cv::PROTECTED, "protected"},
                   std::pair{cv::GAMEPLAY, "gameplay"}, std::pair{cv::HIDDEN, "hidden"}, std::pair{cv::NOLOAD, "noload"}};

    std::string string;
    for(bool first = true; const auto &[flag, str] : flagStringPairArray) {
        if((flags & flag) == flag) {
            if(!first) {
                string.push_back(' ');
            }
            first = false;
            string.append(str);
        }
    }

    return string;
}

//*****************************//
//	ConVarHandler ConCommands  //
//*****************************//

namespace ConVarHandler_Builtins {

namespace {
std::string describe(const ConVar *var) {
    std::string desc{var->getName()};
    if(var->canHaveValue()) {
        desc.append(fmt::format(" = {:s} ( def. \"{:s}\" , {:s}, {:s} )", var->getString(), var->getDefaultString(),
                                ConVar::typeToString(var->getType()), ConVarHandler::flagsToString(var->getFlags())));
    }
    if(!var->getHelpstring().empty()) {
        desc.append(" - ");
        desc.append(var->getHelpstring());
    }
    return desc;
}

std::vector<ConVar *> sortedByName(std::vector<ConVar *> convars) {
    std::ranges::sort(convars, {}, [](const ConVar *v) -> const std::string & { return v->getName(); });
    return convars;
}
}  // namespace

void find(std::string_view args) {
    SString::trim_inplace(args);
    if(args.length() < 1) {
        logRaw("Usage:  find <string>");
        return;
    }

    std::vector<ConVar *> matchingConVars;
    for(auto *convar : cvars().getConVarArray()) {
        if(convar->isFlagSet(cv::HIDDEN)) continue;
        if(convar->getName().find(args) != std::string::npos) matchingConVars.push_back(convar);
    }

    if(matchingConVars.empty()) {
        logRaw("No commands found containing {:s}.", args);
        return;
    }

    logRaw("----------------------------------------------");
    logRaw("[ find : {:s} ]", args);
    for(const auto *var : sortedByName(std::move(matchingConVars))) {
        logRaw("{:s}", var->getName());
    }
    logRaw("----------------------------------------------");
}

void help(std::string_view args) {
    SString::trim_inplace(args);

    if(args.length() < 1) {
        logRaw("Usage:  help <cvarname>");
        logRaw("To get a list of all available commands, type \"listcommands\".");
        return;
    }

    const std::vector<ConVar *> matches = cvars().getConVarByLetter(args);
    if(matches.empty()) {
        logRaw("ConVar {:s} does not exist.", args);
        return;
    }

    // use closest match
    const auto exact = std::ranges::find_if(matches, [args](const ConVar *v) { return v->getName() == args; });
    const ConVar *match = exact != matches.end() ? *exact : matches.front();

    if(match->getHelpstring().empty()) {
        logRaw("ConVar {:s} does not have a helpstring.", match->getName());
        return;
    }
    logRaw("{:s}", describe(match));
}

void listcommands(std::string_view /*args*/) {
    logRaw("----------------------------------------------");
    for(const auto *var : sortedByName(cvars().getConVarArray())) {
        if(var->isFlagSet(cv::HIDDEN)) continue;
        logRaw("{:s}", describe(var));
    }
    logRaw("----------------------------------------------");
}

void echo(std::string_view args) {
    if(args.length() > 0) {
        logRaw("{:s}", args);
    }
}

void exec(std::string_view args) {
    SString::trim_inplace(args);
    Console::execConfigFile(args);
}

}  // namespace ConVarHandler_Builtins

#undef CONVARDEFS_H
#define DEFINE_CONVARS

#include "ConVarDefs.h"
