// Copyright (c) 2023-2024, kiwec & 2025, WH & 2026, hitcore contributors, All rights reserved.
#include "SString.h"

namespace SString {

void split(std::vector<std::string_view>& r, std::string_view s, char delim) {
    r.clear();

    size_t i = 0, j = 0;
    while((j = s.find(delim, i)) != s.npos) r.emplace_back(s.substr(i, j - i)), i = j + 1;
    r.emplace_back(s.substr(i));
}

std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> r;

    // pre-count delimiter occurrences and reserve that amount (to avoid reallocations)
    r.reserve(std::ranges::count(s, delim) + 1);

    split(r, s, delim);
    return r;
}

std::vector<std::string_view> split_newlines(std::string_view s) {
    std::vector<std::string_view> r;
    r.reserve(std::ranges::count(s, '\n') + 1);

    size_t i = 0, j = 0;
    while((j = s.find('\n', i)) != s.npos) {
        size_t end = j;
        if(end > i && s[end - 1] == '\r') end--;
        r.emplace_back(s.substr(i, end - i));
        i = j + 1;
    }

    // remainder after last \n (or entire string if no \n found)
    size_t end = s.size();
    if(end > i && s[end - 1] == '\r') end--;
    r.emplace_back(s.substr(i, end - i));

    return r;
}

}  // namespace SString
