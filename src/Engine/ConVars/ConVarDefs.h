#ifndef CONVARDEFS_H
#define CONVARDEFS_H

// DO NOT put gameplay-related convars in this file (put them in GameConVarDefs.h)

// NOLINTBEGIN(misc-definitions-in-headers)

#define _CV(name) name

// defined and included at the end of ConVarHandler.cpp
#if defined(DEFINE_CONVARS)
#undef CONVAR
#define CONVAR(name, ...) ConVar _CV(name)(#name __VA_OPT__(, ) __VA_ARGS__)

namespace ConVarHandler_Builtins {
extern void find(std::string_view args);
extern void help(std::string_view args);
extern void listcommands(std::string_view args);
extern void echo(std::string_view args);
extern void exec(std::string_view args);
}  // namespace ConVarHandler_Builtins

#else
#define CONVAR(name, ...) extern ConVar _CV(name)
#endif

class ConVar;
namespace cv {
namespace cmd {

CONVAR(echo, CLIENT, ConVarHandler_Builtins::echo);
CONVAR(exec, CLIENT | NOLOAD, ConVarHandler_Builtins::exec);
CONVAR(find, CLIENT, ConVarHandler_Builtins::find);
CONVAR(help, CLIENT, ConVarHandler_Builtins::help);
CONVAR(listcommands, CLIENT, ConVarHandler_Builtins::listcommands);

}  // namespace cmd

CONVAR(console_logging, true, CLIENT, "log console commands and their resulting values");
CONVAR(debug_cv, false, CLIENT);
CONVAR(log_to_file, false, CLIENT | NOLOAD, "also write log output to logs/hitcore.log");

// NOLINTEND(misc-definitions-in-headers)

}  // namespace cv

#endif
