#include <Console/ConsoleConfig.hpp>
#include <Console/ConsoleError.hpp>
#include <filesystem>

namespace InkWell {

namespace {
const char *kLuaWorkerName = "inkwell-lua-worker";
}

ConsoleConfig ConsoleConfig::fromJson(const nlohmann::json &j)
{
    ConsoleConfig cfg;
    if (!j.is_object())
        throw ConfigError("console section must be an object");

    try
    {
        if (j.contains("maxScriptBytes"))
        {
            auto v = j.at("maxScriptBytes").get<long long>();
            if (v <= 0)
                throw ConfigError("maxScriptBytes must be positive");
            cfg.maxScriptBytes = static_cast<std::size_t>(v);
        }
        if (j.contains("gracePeriodMs"))
        {
            auto v = j.at("gracePeriodMs").get<long long>();
            if (v < 0)
                throw ConfigError("gracePeriodMs must not be negative");
            if (v > kMaxGracePeriod.count())
                throw ConfigError("gracePeriodMs must not exceed " + std::to_string(kMaxGracePeriod.count()));
            cfg.gracePeriod = std::chrono::milliseconds(v);
        }
        if (j.contains("queueEnabled"))
            cfg.queueEnabled = j.at("queueEnabled").get<bool>();
        if (j.contains("retainedJobs"))
        {
            auto v = j.at("retainedJobs").get<long long>();
            if (v < 0)
                throw ConfigError("retainedJobs must not be negative");
            cfg.retainedJobs = static_cast<std::size_t>(v);
        }
        if (j.contains("interpreter"))
        {
            cfg.interpreter = j.at("interpreter").get<std::vector<std::string>>();
            for (const auto &arg : cfg.interpreter)
            {
                if (arg.empty())
                    throw ConfigError("interpreter arguments must not be empty");
            }
        }
        if (j.contains("sandbox"))
            cfg.sandbox = j.at("sandbox").get<bool>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigError(std::string("invalid console configuration: ") + e.what());
    }
    return cfg;
}

nlohmann::json ConsoleConfig::toJson() const
{
    return nlohmann::json{
        {"maxScriptBytes", maxScriptBytes},
        {"gracePeriodMs", gracePeriod.count()},
        {"queueEnabled", queueEnabled},
        {"retainedJobs", retainedJobs},
        {"interpreter", interpreter},
        {"sandbox", sandbox},
    };
}

std::vector<std::string> ConsoleConfig::resolveInterpreter(const std::string &executableDir) const
{
    if (!interpreter.empty())
        return interpreter;

    std::vector<std::string> argv;
    if (executableDir.empty())
        argv.push_back(kLuaWorkerName);
    else
        argv.push_back((std::filesystem::path(executableDir) / kLuaWorkerName).string());
    if (!sandbox)
        argv.push_back("--no-sandbox");
    return argv;
}

} // namespace InkWell
