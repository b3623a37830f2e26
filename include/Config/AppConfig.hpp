#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include <Console/ConsoleConfig.hpp>

namespace InkWell {

struct ThemePalette {
    std::string ribbon;
    std::string background;
    std::string paper;
    std::string text;
    std::string ruler;
    std::string sidebar;
    std::string primary;
    std::string console;
};

// "dark" or anything else (light)
const ThemePalette &paletteFor(const std::string &theme);

// Application settings persisted as JSON. A missing or unreadable file
// yields the defaults; problems are logged, never thrown.
class AppConfig {
public:
    static constexpr std::size_t kMaxRecents = 8;
    static constexpr const char *kDefaultFileName = "inkwell_config.json";

    AppConfig() = default;
    explicit AppConfig(std::filesystem::path path) : m_path(std::move(path)) {}

    static AppConfig load(const std::filesystem::path &path);
    bool save() const;

    // Moves `file` to the front of the recent list, then saves.
    bool addRecent(const std::string &file);

    const std::filesystem::path &path() const { return m_path; }

    std::string theme = "light";
    std::vector<std::string> recents;
    std::string geometry = "1600x1000";
    int zoom = 100;
    std::string logLevel = "info";
    ConsoleConfig console;

private:
    std::filesystem::path m_path = kDefaultFileName;
};

} // namespace InkWell
