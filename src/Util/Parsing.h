#pragma once
// Copyright (c) 2025, kiwec & 2026, hitcore contributors, All rights reserved.
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "types.h"
#include "SString.h"

namespace Parsing {

// parse a single whole token (surrounding whitespace allowed)
// integer targets also accept decimal input ("4.0"), truncated toward zero
template <typename T>
std::optional<T> strto(std::string_view str) {
    SString::trim_inplace(str);
    if(str.empty()) return std::nullopt;
    if(str.front() == '+') str.remove_prefix(1);

    const char *begin = str.data();
    const char *end = str.data() + str.size();

    if constexpr(std::is_same_v<T, bool>) {
        auto l = strto<i64>(str);
        if(!l) return std::nullopt;
        return *l > 0;
    } else if constexpr(std::is_floating_point_v<T>) {
        T val{};
        auto [ptr, ec] = std::from_chars(begin, end, val);
        if(ec != std::errc{} || ptr != end) return std::nullopt;
        if(!std::isfinite(val)) return std::nullopt;
        return val;
    } else if constexpr(std::is_integral_v<T>) {
        T val{};
        auto [ptr, ec] = std::from_chars(begin, end, val);
        if(ec == std::errc{} && ptr == end) return val;

        // fall back to a decimal parse
        f64 d{};
        auto [dptr, dec] = std::from_chars(begin, end, d);
        if(dec != std::errc{} || dptr != end || !std::isfinite(d)) return std::nullopt;
        d = std::trunc(d);
        if(d < static_cast<f64>(std::numeric_limits<T>::min()) || d > static_cast<f64>(std::numeric_limits<T>::max()))
            return std::nullopt;
        return static_cast<T>(d);
    } else if constexpr(std::is_same_v<T, std::string>) {
        return std::string{str};
    } else {
        static_assert(Env::always_false_v<T>, "parsing for this type is not implemented");
        return std::nullopt;
    }
}

namespace _detail {

inline void skip_ws(std::string_view &str) {
    while(!str.empty() && (str.front() == ' ' || str.front() == '\t')) str.remove_prefix(1);
}

// consume one value up to the next occurrence of the following separator (or the end)
template <typename T>
bool parse_value(std::string_view &str, char next_sep, T *out) {
    if constexpr(std::is_same_v<T, std::string>) {
        // quoted string values
        if(!str.empty() && str.front() == '"') {
            const size_t close = str.find('"', 1);
            if(close == std::string_view::npos) return false;
            *out = std::string{str.substr(1, close - 1)};
            str.remove_prefix(close + 1);
            return true;
        }
    }

    const size_t stop = next_sep == '\0' ? str.size() : std::min(str.find(next_sep), str.size());
    auto val = strto<T>(str.substr(0, stop));
    if(!val) return false;
    *out = std::move(*val);
    str.remove_prefix(stop);
    return true;
}

inline bool parse_chain(std::string_view & /*str*/) { return true; }

template <typename T, typename... Extra>
bool parse_chain(std::string_view &str, T arg, Extra... extra) {
    skip_ws(str);

    if constexpr(std::is_same_v<T, char>) {
        // assert char separator
        if(str.empty() || str.front() != arg) return false;
        str.remove_prefix(1);
        return parse_chain(str, extra...);
    } else if constexpr(std::is_same_v<T, const char *>) {
        // assert string label
        const std::string_view label{arg};
        if(!str.starts_with(label)) return false;
        str.remove_prefix(label.size());
        return parse_chain(str, extra...);
    } else if constexpr(std::is_pointer_v<T>) {
        using T_val = std::remove_pointer_t<T>;

        // the value extends up to the following separator, if the next argument is one
        char sep = '\0';
        if constexpr(sizeof...(Extra) > 0) {
            const auto &first_extra = std::get<0>(std::tuple<const Extra &...>(extra...));
            if constexpr(std::is_same_v<std::decay_t<decltype(first_extra)>, char>) sep = first_extra;
        }

        // storing result in tmp var, so we only modify *arg once parsing fully succeeded
        T_val tmp{};
        if(!parse_value(str, sep, &tmp)) return false;
        if(!parse_chain(str, extra...)) return false;
        *arg = std::move(tmp);
        return true;
    } else {
        static_assert(Env::always_false_v<T>, "expected pointer, separator or label parameter");
        return false;
    }
}

}  // namespace _detail

// e.g. Parsing::parse(line, "Combo", &idx, ':', &r, ',', &g, ',', &b)
// returns true only if every value parsed; outputs are untouched otherwise
template <typename... Args>
bool parse(std::string_view str, Args... args) {
    return _detail::parse_chain(str, args...);
}

}  // namespace Parsing
