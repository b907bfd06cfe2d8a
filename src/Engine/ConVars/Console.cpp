// Copyright (c) 2014, PG & 2026, hitcore contributors, All rights reserved.
#include "Console.h"

#include "SString.h"
#include "ConVar.h"
#include "ConVarHandler.h"
#include "Logging.h"

#include <fstream>
#include <string>
#include <vector>

bool Console::processCommand(std::string_view command, bool fromFile) {
    // remove whitespace from beginning/end of string
    SString::trim_inplace(command);
    if(command.length() < 1) return false;

    // handle multiple commands separated by semicolons
    // as a workaround for values containing semicolons, avoid splitting commands read from files
    if(!fromFile && command.find(';') != std::string::npos && !command.starts_with("echo")) {
        bool allProcessed = true;
        for(const auto &subcommand : SString::split(command, ';')) {
            if(SString::is_wspace_only(subcommand)) continue;
            allProcessed &= processCommand(subcommand);
        }
        return allProcessed;
    }

    // separate convar name and value
    std::string_view commandName = command;
    std::string_view commandValue;
    if(const size_t space = command.find_first_of(" \t"); space != std::string_view::npos) {
        commandName = command.substr(0, space);
        commandValue = command.substr(space + 1);
        SString::trim_inplace(commandValue);
    }

    ConVar *var = cvars().getConVarByName(commandName, false);
    if(!var) {
        debugLog("Unknown command: {:s}", commandName);
        return false;
    }

    if(fromFile && var->isFlagSet(cv::NOLOAD)) {
        return false;
    }

    // set new value (this handles all callbacks internally)
    if(commandValue.length() > 0) {
        var->setValue(commandValue);
    } else {
        var->exec();
    }

    if(cv::console_logging.getBool() && !var->isFlagSet(cv::HIDDEN) && var->canHaveValue()) {
        if(commandValue.length() < 1) {
            std::string logMessage{fmt::format("{:s} = {:s} ( def. \"{:s}\" , {:s}, {:s} )", var->getName(),
                                               var->getString(), var->getDefaultString(),
                                               ConVar::typeToString(var->getType()),
                                               ConVarHandler::flagsToString(var->getFlags()))};
            if(!var->getHelpstring().empty()) {
                logMessage.append(" - ");
                logMessage.append(var->getHelpstring());
            }
            debugLog("{:s}", logMessage);
        } else {
            debugLog("{:s} : {:s}", var->getName(), var->getString());
        }
    }

    return true;
}

bool Console::execConfigFile(std::string_view filename_view) {
    if(filename_view.empty()) return false;
    std::string filename{filename_view};

    // handle extension
    if(!filename.ends_with(".cfg")) filename.append(".cfg");

    std::ifstream configFile(filename);
    if(!configFile.good()) {
        debugLog("NOTICE: file \"{:s}\" not found!", filename);
        return false;
    }

    // collect commands first
    std::vector<std::string> cmds;
    for(std::string line; std::getline(configFile, line);) {
        // handle comments - find "//" and remove everything after
        if(const auto commentIndex = line.find("//"); commentIndex != std::string::npos) line.erase(commentIndex);
        SString::trim_inplace(line);
        if(!line.empty()) cmds.push_back(std::move(line));
    }

    for(const auto &cmd : cmds) processCommand(cmd, true);

    debugLog("executed {:s} ({} commands)", filename, cmds.size());
    return true;
}
