#include "mcpcommons/settings.hpp"

#include "mcpcommons/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#ifndef MCPCOMMONS_VERSION
#define MCPCOMMONS_VERSION "0.0.0"
#endif

namespace mcpcommons
{

const char* version()
{
    return MCPCOMMONS_VERSION;
}

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = upper(getenv_str("MCPCOMMONS_LOG_LEVEL", s.log_level));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = upper(j.at("log_level").get<std::string>());
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw Error("cannot open settings file: " + path);
    try
    {
        return from_json(Json::parse(in));
    }
    catch (const Json::exception& e)
    {
        throw Error("invalid settings file " + path + ": " + e.what());
    }
}

} // namespace mcpcommons
