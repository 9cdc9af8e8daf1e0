#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace sheetdrive {

/**
 * @brief 进程级日志器
 *
 * 控制台 + 滚动文件双输出，消息使用 fmt 格式化。
 * 未调用 initialize() 时首次写日志只输出到控制台。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/sheetdrive.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    void log(Level level, const std::string& message);

    template<typename... Args>
    void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            // 格式串与参数不匹配时原样输出格式串
            log(level, fmt_str);
        }
    }

    // 带源码位置信息的接口（供宏使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max)(slash1, slash2) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define SHEETDRIVE_FUNC __FUNCTION__
#else
#  define SHEETDRIVE_FUNC __func__
#endif

#define SHEETDRIVE_LOG_TRACE(fmt, ...)    ::sheetdrive::Logger::getInstance().logCtx(::sheetdrive::Logger::Level::TRACE,    __FILE__, __LINE__, SHEETDRIVE_FUNC, fmt, ##__VA_ARGS__)
#define SHEETDRIVE_LOG_DEBUG(fmt, ...)    ::sheetdrive::Logger::getInstance().logCtx(::sheetdrive::Logger::Level::DEBUG,    __FILE__, __LINE__, SHEETDRIVE_FUNC, fmt, ##__VA_ARGS__)
#define SHEETDRIVE_LOG_INFO(fmt, ...)     ::sheetdrive::Logger::getInstance().logCtx(::sheetdrive::Logger::Level::INFO,     __FILE__, __LINE__, SHEETDRIVE_FUNC, fmt, ##__VA_ARGS__)
#define SHEETDRIVE_LOG_WARN(fmt, ...)     ::sheetdrive::Logger::getInstance().logCtx(::sheetdrive::Logger::Level::WARN,     __FILE__, __LINE__, SHEETDRIVE_FUNC, fmt, ##__VA_ARGS__)
#define SHEETDRIVE_LOG_ERROR(fmt, ...)    ::sheetdrive::Logger::getInstance().logCtx(::sheetdrive::Logger::Level::ERROR,    __FILE__, __LINE__, SHEETDRIVE_FUNC, fmt, ##__VA_ARGS__)
#define SHEETDRIVE_LOG_CRITICAL(fmt, ...) ::sheetdrive::Logger::getInstance().logCtx(::sheetdrive::Logger::Level::CRITICAL, __FILE__, __LINE__, SHEETDRIVE_FUNC, fmt, ##__VA_ARGS__)

} // namespace sheetdrive
