#pragma once
#include <stdexcept>
#include <string>

namespace InkWell {

enum class ErrorKind { InvalidInput, Busy };

// Raised synchronously by ScriptConsole::submit. Failures of the script
// itself never surface as exceptions; they are recorded on the job.
class ConsoleError : public std::runtime_error {
    ErrorKind errorKind;
public:
    ConsoleError(ErrorKind kind, const std::string &msg)
        : std::runtime_error(msg), errorKind(kind) {}

    ErrorKind kind() const { return errorKind; }

    std::string toString() const {
        return std::string(errorKind == ErrorKind::InvalidInput ? "InvalidInput" : "Busy") + ": " + what();
    }
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace InkWell
