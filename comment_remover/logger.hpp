#ifndef COMMENT_REMOVER_LOGGER_HPP
#define COMMENT_REMOVER_LOGGER_HPP

#include <ostream>
#include <string>

namespace comment_remover {

enum class LogLevel { Info = 0, Warning = 1, Error = 2 };

const char* log_level_name(LogLevel level);

// Line-oriented log sink handed to every component.
// Each line: "YYYY-MM-DD HH:MM:SS,mmm - LEVEL - message"
class Logger {
public:
    explicit Logger(std::ostream& out) : out_(out), min_level_(LogLevel::Info) {}

    void info(const std::string& message) { write(LogLevel::Info, message); }
    void warning(const std::string& message) { write(LogLevel::Warning, message); }
    void error(const std::string& message) { write(LogLevel::Error, message); }

    void write(LogLevel level, const std::string& message);

    // Messages below this level are dropped.
    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }

private:
    std::string timestamp() const;

    std::ostream& out_;
    LogLevel min_level_;
};

} // namespace comment_remover

#endif // COMMENT_REMOVER_LOGGER_HPP
