#include <Util/Logging.hpp>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace InkWell {

std::optional<plog::Severity> parseSeverity(const std::string &name)
{
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "none") return plog::none;
    if (s == "fatal") return plog::fatal;
    if (s == "error") return plog::error;
    if (s == "warning" || s == "warn") return plog::warning;
    if (s == "info") return plog::info;
    if (s == "debug") return plog::debug;
    if (s == "verbose") return plog::verbose;
    return std::nullopt;
}

plog::Severity resolveSeverity(const std::string &configured)
{
    if (const char *env = std::getenv("INKWELL_LOG_LEVEL"))
    {
        if (auto sev = parseSeverity(env))
            return *sev;
    }
    return parseSeverity(configured).value_or(plog::info);
}

void initLogging(plog::Severity severity)
{
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    if (auto *logger = plog::get())
    {
        logger->setMaxSeverity(severity);
        return;
    }
    plog::init(severity, &consoleAppender);
    PLOGD << "plog initialized (" << plog::severityToString(severity) << " -> stderr)";
}

} // namespace InkWell
