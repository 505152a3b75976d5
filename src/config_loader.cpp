#include "config_loader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

static std::string trim(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

ConfigMap parseConfig(std::istream &in)
{
    ConfigMap cfg;
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.empty())
            continue;
        if (line[0] == '#')
            continue;
        auto pos = line.find(':');
        if (pos == std::string::npos)
            continue;
        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        // remove surrounding quotes if any
        if (!value.empty() && (value.front() == '"' || value.front() == '\''))
            value.erase(0, 1);
        if (!value.empty() && (value.back() == '"' || value.back() == '\''))
            value.pop_back();
        if (!key.empty())
            cfg[key] = value;
    }
    return cfg;
}

ConfigMap loadConfig(const std::vector<std::string> &candidatePaths, std::string *usedPath)
{
    for (const auto &path : candidatePaths)
    {
        std::ifstream in(path);
        if (!in.is_open())
            continue;
        if (usedPath)
            *usedPath = path;
        return parseConfig(in); // stop at the first file found
    }
    if (usedPath)
        usedPath->clear();
    return ConfigMap();
}

std::string cfgStr(const ConfigMap &cfg, const std::string &key, const std::string &defVal)
{
    auto it = cfg.find(key);
    return it == cfg.end() ? defVal : it->second;
}

int cfgInt(const ConfigMap &cfg, const std::string &key, int defVal)
{
    auto it = cfg.find(key);
    if (it == cfg.end())
        return defVal;
    try
    {
        size_t used = 0;
        int v = std::stoi(it->second, &used);
        return used == it->second.size() ? v : defVal;
    }
    catch (const std::logic_error &)
    {
        return defVal;
    }
}

bool cfgBool(const ConfigMap &cfg, const std::string &key, bool defVal)
{
    auto it = cfg.find(key);
    if (it == cfg.end())
        return defVal;
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c)
                   { return std::tolower(c); });
    if (v == "true" || v == "yes" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "0")
        return false;
    return defVal;
}

DispatcherConfig dispatcherConfigFrom(const ConfigMap &cfg)
{
    DispatcherConfig out;
    out.port = cfgStr(cfg, "serial.port", out.port);
    out.baudRate = cfgInt(cfg, "serial.baud", out.baudRate);
    out.emulateOnFail = cfgBool(cfg, "serial.emulate_on_fail", out.emulateOnFail);
    out.writeRetries = std::max(0, cfgInt(cfg, "sender.write_retries", out.writeRetries));
    out.retryDelayMs = std::max(0, cfgInt(cfg, "sender.retry_delay_ms", out.retryDelayMs));
    out.writeTimeoutMs = std::max(1, cfgInt(cfg, "sender.write_timeout_ms", out.writeTimeoutMs));
    out.verbose = cfgBool(cfg, "debug.verbose", out.verbose);
    return out;
}
