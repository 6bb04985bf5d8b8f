#ifndef LNP_LOGGER_HPP
#define LNP_LOGGER_HPP

#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace lnp {

/**
 * @brief Logging levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe logger shared by the codec and its embedding application
 *
 * Lines go to the console (stderr from ERROR up), to an optional append-only
 * file, and to an optional sink callback. The sink receives the level and the
 * unformatted message; embedding daemons use it to forward into their own
 * logging, tests use it to observe rejections. The sink runs under the
 * logger lock and must not log.
 *
 * The LNP_LOG_* macros test the level before evaluating their argument, so a
 * hex preview of a rejected buffer is only built when it will be printed.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level_;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level != LogLevel::NONE && level >= level_;
    }

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void closeFileOutput() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
    }

    /// Replace the sink; an empty function removes it
    void setSink(Sink sink) {
        std::lock_guard<std::mutex> lock(mtx_);
        sink_ = std::move(sink);
    }

    void trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }
    void fatal(const std::string& msg) { log(LogLevel::FATAL, msg); }

    void log(LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level == LogLevel::NONE || level < level_) return;

        if (sink_) sink_(level, msg);

        if (!console_enabled_ && !file_.is_open()) return;
        std::string line = formatLine(level, msg);

        if (console_enabled_) {
            std::ostream& os = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
            os << line << std::endl;
        }
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none" || s == "off") return LogLevel::NONE;
        return LogLevel::INFO;
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

private:
    Logger() = default;

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    static std::string formatLine(LogLevel level, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] [lnp] " << msg;
        return oss.str();
    }

    LogLevel level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::ofstream file_;
    Sink sink_;
    mutable std::mutex mtx_;
};

#define LNP_LOG_AT(lvl, msg)                                        \
    do {                                                            \
        if (lnp::Logger::instance().enabled(lvl)) {                 \
            lnp::Logger::instance().log(lvl, msg);                  \
        }                                                           \
    } while (0)

#define LNP_LOG_TRACE(msg) LNP_LOG_AT(lnp::LogLevel::TRACE, msg)
#define LNP_LOG_DEBUG(msg) LNP_LOG_AT(lnp::LogLevel::DEBUG, msg)
#define LNP_LOG_INFO(msg)  LNP_LOG_AT(lnp::LogLevel::INFO,  msg)
#define LNP_LOG_WARN(msg)  LNP_LOG_AT(lnp::LogLevel::WARN,  msg)
#define LNP_LOG_ERROR(msg) LNP_LOG_AT(lnp::LogLevel::ERROR, msg)
#define LNP_LOG_FATAL(msg) LNP_LOG_AT(lnp::LogLevel::FATAL, msg)

} // namespace lnp

#endif // LNP_LOGGER_HPP
