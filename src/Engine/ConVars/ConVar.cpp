// Copyright (c) 2011, PG & 2025, WH & 2025, kiwec & 2026, hitcore contributors, All rights reserved.
#include "ConVar.h"
#include "ConVarHandler.h"

#include "Logging.h"
#include "Parsing.h"

#include <cmath>

void ConVar::addConVar(ConVar *c) { cvars().addConVar(c); }

std::string ConVar::typeToString(CONVAR_TYPE type) {
    switch(type) {
        case CONVAR_TYPE::CONVAR_TYPE_BOOL:
            return "bool";
        case CONVAR_TYPE::CONVAR_TYPE_INT:
            return "int";
        case CONVAR_TYPE::CONVAR_TYPE_FLOAT:
            return "float";
        case CONVAR_TYPE::CONVAR_TYPE_STRING:
            return "string";
    }
    return "";
}

namespace {
std::string numberToString(ConVar::CONVAR_TYPE type, f64 value) {
    if(type == ConVar::CONVAR_TYPE::CONVAR_TYPE_FLOAT) return fmt::format("{:g}", value);
    return fmt::format("{}", static_cast<i64>(value));
}
}  // namespace

ConVar::ConVar(std::string_view name, u8 flags, CommandCallback callback) {
    this->sName = name;
    this->iFlags = flags;
    this->type = CONVAR_TYPE::CONVAR_TYPE_STRING;
    this->bHasValue = false;
    this->callback = std::move(callback);
    addConVar(this);
}

ConVar::ConVar(std::string_view name, std::string_view defaultValue, u8 flags, std::string_view helpString) {
    this->sName = name;
    this->sHelpString = helpString;
    this->iFlags = flags;
    this->type = CONVAR_TYPE::CONVAR_TYPE_STRING;
    this->bHasValue = true;
    this->sValue = this->sDefaultValue = defaultValue;
    this->dValue = this->dDefaultValue = Parsing::strto<f64>(defaultValue).value_or(0.0);
    addConVar(this);
}

void ConVar::init(std::string_view name, f64 defaultValue, u8 flags, std::string_view helpString) {
    this->sName = name;
    this->sHelpString = helpString;
    this->iFlags = flags;
    this->bHasValue = true;
    this->dValue = this->dDefaultValue = defaultValue;
    this->sValue = this->sDefaultValue = numberToString(this->type, defaultValue);
}

void ConVar::exec(std::string_view args) {
    if(this->callback) this->callback(args);
}

void ConVar::setValue(std::string_view value, bool doCallback) {
    if(!this->bHasValue) {
        this->exec(value);
        return;
    }

    SString::trim_inplace(value);

    if(this->type == CONVAR_TYPE::CONVAR_TYPE_STRING) {
        this->setValueInt(Parsing::strto<f64>(value).value_or(0.0), std::string{value}, doCallback);
        return;
    }

    std::optional<f64> parsed;
    if(this->type == CONVAR_TYPE::CONVAR_TYPE_BOOL && (value == "true" || value == "false")) {
        parsed = value == "true" ? 1.0 : 0.0;
    } else {
        parsed = Parsing::strto<f64>(value);
    }

    if(!parsed) {
        debugLog("ConVar {:s}: can't set value \"{:s}\" (expected {:s})", this->sName, value,
                 typeToString(this->type));
        return;
    }

    this->setValue(*parsed, doCallback);
}

void ConVar::setValue(f64 value, bool doCallback) {
    if(!this->bHasValue) {
        this->exec(numberToString(CONVAR_TYPE::CONVAR_TYPE_FLOAT, value));
        return;
    }

    if(this->type == CONVAR_TYPE::CONVAR_TYPE_BOOL) value = value > 0.0 ? 1.0 : 0.0;
    if(this->type == CONVAR_TYPE::CONVAR_TYPE_INT) value = std::trunc(value);

    this->setValueInt(value, numberToString(this->type, value), doCallback);
}

void ConVar::setValueInt(f64 dvalue, std::string svalue, bool doCallback) {
    if(this->isFlagSet(cv::GAMEPLAY) && cvars().isGameplayLocked()) {
        debugLog("ConVar {:s} can't be changed during gameplay", this->sName);
        return;
    }

    const auto oldValue = static_cast<float>(this->dValue);
    this->dValue = dvalue;
    this->sValue = std::move(svalue);

    logIfCV(debug_cv, "{:s} = {:s}", this->sName, this->sValue);

    if(doCallback && this->changeCallback) this->changeCallback(oldValue, static_cast<float>(this->dValue));
}

void ConVar::reset() {
    this->dValue = this->dDefaultValue;
    this->sValue = this->sDefaultValue;
}
