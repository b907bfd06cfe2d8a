// Copyright (c) 2011, PG & 2025, WH & 2025, kiwec & 2026, hitcore contributors, All rights reserved.
#ifndef CONVAR_H
#define CONVAR_H

#include "types.h"

#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

using std::string_view_literals::operator""sv;

namespace cv {
enum CvarFlags : u8 {
    // Modifiable by clients
    CLIENT = (1 << 0),

    // Scores won't be recorded if modified
    PROTECTED = (1 << 1),

    // Can't be modified during gameplay
    GAMEPLAY = (1 << 2),

    // Hidden from console suggestions (e.g. for deprecated cvars)
    HIDDEN = (1 << 3),

    // Don't load this cvar from configs
    NOLOAD = (1 << 4),
};
}

class ConVarHandler;

class ConVar {
    friend class ConVarHandler;

   public:
    enum class CONVAR_TYPE : u8 { CONVAR_TYPE_BOOL, CONVAR_TYPE_INT, CONVAR_TYPE_FLOAT, CONVAR_TYPE_STRING };

    using CommandCallback = std::function<void(std::string_view args)>;
    using ChangeCallback = std::function<void(float oldValue, float newValue)>;

   private:
    template <typename T>
    static constexpr CONVAR_TYPE getTypeFor() {
        if constexpr(std::is_same_v<std::decay_t<T>, bool>)
            return CONVAR_TYPE::CONVAR_TYPE_BOOL;
        else if constexpr(std::is_integral_v<std::decay_t<T>>)
            return CONVAR_TYPE::CONVAR_TYPE_INT;
        else if constexpr(std::is_floating_point_v<std::decay_t<T>>)
            return CONVAR_TYPE::CONVAR_TYPE_FLOAT;
        else
            return CONVAR_TYPE::CONVAR_TYPE_STRING;
    }

    static void addConVar(ConVar *);

   public:
    static std::string typeToString(CONVAR_TYPE type);

    // command constructor (no value)
    explicit ConVar(std::string_view name, u8 flags, CommandCallback callback);

    // numeric value constructors
    template <typename T>
        requires std::is_arithmetic_v<T>
    explicit ConVar(std::string_view name, T defaultValue, u8 flags, std::string_view helpString = ""sv,
                    ChangeCallback callback = {}) {
        this->type = getTypeFor<T>();
        this->init(name, static_cast<f64>(defaultValue), flags, helpString);
        this->changeCallback = std::move(callback);
        addConVar(this);
    }

    // string value constructor
    explicit ConVar(std::string_view name, std::string_view defaultValue, u8 flags,
                    std::string_view helpString = ""sv);

    // runs the command callback, if any
    void exec(std::string_view args = ""sv);

    // parses numeric input for numeric convars, stores as-is for string convars
    void setValue(std::string_view value, bool doCallback = true);
    void setValue(f64 value, bool doCallback = true);

    template <typename T>
        requires std::is_arithmetic_v<T>
    inline void setValue(T value, bool doCallback = true) {
        this->setValue(static_cast<f64>(value), doCallback);
    }

    void setChangeCallback(ChangeCallback callback) { this->changeCallback = std::move(callback); }

    // restore the default value, without running callbacks
    void reset();

    // get
    [[nodiscard]] inline float getDefaultFloat() const { return static_cast<float>(this->dDefaultValue); }
    [[nodiscard]] inline f64 getDefaultDouble() const { return this->dDefaultValue; }
    [[nodiscard]] inline const std::string &getDefaultString() const { return this->sDefaultValue; }

    [[nodiscard]] inline f64 getDouble() const { return this->dValue; }
    [[nodiscard]] inline const std::string &getString() const { return this->sValue; }

    template <typename T = int>
    [[nodiscard]] inline auto getVal() const {
        return static_cast<T>(this->dValue);
    }

    [[nodiscard]] inline int getInt() const { return this->getVal<int>(); }
    [[nodiscard]] inline bool getBool() const { return !!this->getVal<int>(); }
    [[nodiscard]] inline float getFloat() const { return this->getVal<float>(); }

    [[nodiscard]] inline const std::string &getHelpstring() const { return this->sHelpString; }
    [[nodiscard]] inline const std::string &getName() const { return this->sName; }
    [[nodiscard]] inline CONVAR_TYPE getType() const { return this->type; }
    [[nodiscard]] inline u8 getFlags() const { return this->iFlags; }

    [[nodiscard]] inline bool canHaveValue() const { return this->bHasValue; }
    [[nodiscard]] inline bool isDefault() const { return this->sValue == this->sDefaultValue; }
    [[nodiscard]] inline bool isFlagSet(u8 flag) const { return (bool)((this->iFlags & flag) == flag); }

   private:
    void init(std::string_view name, f64 defaultValue, u8 flags, std::string_view helpString);
    void setValueInt(f64 dvalue, std::string svalue, bool doCallback);

    std::string sName;
    std::string sHelpString;
    std::string sValue;
    std::string sDefaultValue;

    CommandCallback callback;
    ChangeCallback changeCallback;

    f64 dValue{0.0};
    f64 dDefaultValue{0.0};

    CONVAR_TYPE type{CONVAR_TYPE::CONVAR_TYPE_FLOAT};
    u8 iFlags{0};
    bool bHasValue{false};
};

#ifndef DEFINE_CONVARS
#include "ConVarDefs.h"
#endif

#endif
