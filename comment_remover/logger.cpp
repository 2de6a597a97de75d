#include "logger.hpp"

#include <chrono>       // For wall clock and millisecond part
#include <ctime>        // For std::localtime_r input
#include <iomanip>      // For std::put_time, std::setw, std::setfill
#include <sstream>

namespace comment_remover {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::write(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(min_level_)) return;
    out_ << timestamp() << " - " << log_level_name(level) << " - " << message << std::endl;
}

std::string Logger::timestamp() const {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&now_c, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << ','
        << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

} // namespace comment_remover
