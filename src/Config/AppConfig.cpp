#include <Config/AppConfig.hpp>
#include <Console/ConsoleError.hpp>
#include <plog/Log.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace InkWell {

const ThemePalette &paletteFor(const std::string &theme)
{
    static const ThemePalette light{"#f3f3f3", "#e6e6e6", "#ffffff", "#2d2d2d", "#fcfcfc", "#f9f9f9", "#2b579a", "#f0f0f0"};
    static const ThemePalette dark{"#2d2d2d", "#1e1e1e", "#3c3c3c", "#e0e0e0", "#333333", "#252526", "#007acc", "#252526"};
    return theme == "dark" ? dark : light;
}

AppConfig AppConfig::load(const std::filesystem::path &path)
{
    AppConfig cfg(path);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        PLOGD << "AppConfig: " << path << " not found, using defaults";
        return cfg;
    }

    nlohmann::json j;
    try
    {
        std::ifstream in(path);
        j = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::exception &e)
    {
        PLOGW << "AppConfig: cannot parse " << path << ": " << e.what();
        return cfg;
    }
    if (!j.is_object())
    {
        PLOGW << "AppConfig: " << path << " is not a JSON object";
        return cfg;
    }

    try
    {
        cfg.theme = j.value("theme", cfg.theme);
        cfg.recents = j.value("recents", cfg.recents);
        cfg.geometry = j.value("geometry", cfg.geometry);
        cfg.zoom = j.value("zoom", cfg.zoom);
        cfg.logLevel = j.value("logLevel", cfg.logLevel);
    }
    catch (const nlohmann::json::exception &e)
    {
        PLOGW << "AppConfig: bad value in " << path << ": " << e.what();
    }
    if (cfg.recents.size() > kMaxRecents)
        cfg.recents.resize(kMaxRecents);

    if (j.contains("console"))
    {
        try
        {
            cfg.console = ConsoleConfig::fromJson(j.at("console"));
        }
        catch (const ConfigError &e)
        {
            PLOGE << "AppConfig: " << e.what() << "; using console defaults";
            cfg.console = ConsoleConfig{};
        }
    }
    return cfg;
}

bool AppConfig::save() const
{
    nlohmann::json j{
        {"theme", theme},
        {"recents", recents},
        {"geometry", geometry},
        {"zoom", zoom},
        {"logLevel", logLevel},
        {"console", console.toJson()},
    };

    std::ofstream out(m_path, std::ios::trunc);
    if (!out)
    {
        PLOGW << "AppConfig: cannot write " << m_path;
        return false;
    }
    out << j.dump(2) << "\n";
    if (!out.good())
    {
        PLOGW << "AppConfig: write to " << m_path << " failed";
        return false;
    }
    return true;
}

bool AppConfig::addRecent(const std::string &file)
{
    recents.erase(std::remove(recents.begin(), recents.end(), file), recents.end());
    recents.insert(recents.begin(), file);
    if (recents.size() > kMaxRecents)
        recents.resize(kMaxRecents);
    return save();
}

} // namespace InkWell
