// Copyright (c) 2023-2024, kiwec & 2025, WH & 2026, hitcore contributors, All rights reserved.
#pragma once
#include "noinclude.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

// fast and small string manipulation helpers

namespace SString {

// split a string on a single-character delimiter
std::vector<std::string_view> split(std::string_view s, char d);

// same as above, except put the results into an existing vector (unconditionally cleared first)
void split(std::vector<std::string_view>& ret, std::string_view s, char d);

// split on newlines, handling both \n and \r\n line endings
std::vector<std::string_view> split_newlines(std::string_view s);

// in-place whitespace/newline trimming (both sides)
static forceinline void trim_inplace(std::string& str) {
    if(str.empty()) return;
    str.erase(0, str.find_first_not_of(" \t\r\n"));
    str.erase(str.find_last_not_of(" \t\r\n") + 1);
}

// adjusts the view to exclude leading/trailing whitespace
static forceinline void trim_inplace(std::string_view& str) {
    if(str.empty()) return;
    size_t start = str.find_first_not_of(" \t\r\n");
    if(start == std::string_view::npos) {
        str = std::string_view();
        return;
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    str = str.substr(start, end - start + 1);
}

static forceinline std::string_view trimmed(std::string_view str) {
    trim_inplace(str);
    return str;
}

// empty or whitespace only
static forceinline bool is_wspace_only(const std::string_view str) {
    return str.empty() || std::ranges::all_of(str, [](unsigned char c) { return std::isspace(c) != 0; });
}

// check if first non-whitespace sequence matches comment token
static forceinline bool is_comment(const std::string_view str, const std::string_view token = "//") {
    size_t start = str.find_first_not_of(" \t\r\n");
    if(start == std::string_view::npos) return false;
    return str.substr(start).starts_with(token);
}

// only really valid for ASCII
static forceinline void lower_inplace(std::string& str) {
    if(str.empty()) return;
    std::ranges::transform(str, str.begin(), [](unsigned char c) { return std::tolower(c); });
}

static forceinline std::string to_lower(const std::string_view str) {
    std::string lstr{str.data(), str.length()};
    lower_inplace(lstr);
    return lstr;
}

static forceinline std::string to_upper(const std::string_view str) {
    std::string ustr{str.data(), str.length()};
    std::ranges::transform(ustr, ustr.begin(), [](unsigned char c) { return std::toupper(c); });
    return ustr;
}

}  // namespace SString
