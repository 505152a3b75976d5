#pragma once
#include "trigger_dispatcher.hpp"
#include <istream>
#include <map>
#include <string>
#include <vector>

using ConfigMap = std::map<std::string, std::string>;

// Simple config loader (key: value, dotted keys supported).
// Reads the first existing file of candidatePaths; usedPath receives it.
ConfigMap loadConfig(const std::vector<std::string> &candidatePaths, std::string *usedPath = nullptr);
ConfigMap parseConfig(std::istream &in);

std::string cfgStr(const ConfigMap &cfg, const std::string &key, const std::string &defVal);
int cfgInt(const ConfigMap &cfg, const std::string &key, int defVal);
bool cfgBool(const ConfigMap &cfg, const std::string &key, bool defVal);

// serial.* / sender.* / debug.* keys on top of DispatcherConfig defaults
DispatcherConfig dispatcherConfigFrom(const ConfigMap &cfg);
