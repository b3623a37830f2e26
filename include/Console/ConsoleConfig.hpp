#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace InkWell {

struct ConsoleConfig {
    static constexpr std::chrono::milliseconds kMaxGracePeriod = std::chrono::hours(24);

    std::size_t maxScriptBytes = 1024 * 1024;
    std::chrono::milliseconds gracePeriod{1000};
    bool queueEnabled = true;
    std::size_t retainedJobs = 64;
    // argv of the interpreter; empty selects the bundled Lua worker
    std::vector<std::string> interpreter;
    bool sandbox = true;

    // Throws ConfigError on out-of-range values. Missing keys keep defaults.
    static ConsoleConfig fromJson(const nlohmann::json &j);
    nlohmann::json toJson() const;

    // interpreter, or the Lua worker beside `executableDir` when empty.
    std::vector<std::string> resolveInterpreter(const std::string &executableDir) const;
};

} // namespace InkWell
