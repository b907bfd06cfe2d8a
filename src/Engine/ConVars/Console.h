#pragma once
// Copyright (c) 2014, PG & 2026, hitcore contributors, All rights reserved.

#include <string_view>

namespace Console {

// "name value" sets a convar, "name" alone runs it (or prints its value)
// multiple commands can be separated by semicolons (except when read from a file)
// returns false if the command could not be processed
bool processCommand(std::string_view command, bool fromFile = false);

// run every line of a .cfg file as a command, "//" starts a comment
// returns false if the file could not be read
bool execConfigFile(std::string_view filename);

}  // namespace Console
