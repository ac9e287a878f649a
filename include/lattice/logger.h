#pragma once

#include <atomic>
#include <cstdarg>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace Lattice {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

const char* ToString(LogLevel level) noexcept;

/**
 * @brief 日志回调函数类型
 * @param level 日志级别
 * @param message 带时间戳与级别前缀的完整日志行
 */
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

/**
 * @brief 日志输出设置，可一次性应用
 */
struct LoggerSettings {
    LogLevel level = LogLevel::Info;
    bool console = true;
    bool colors = true;             // ANSI 颜色，仅作用于控制台
    bool file = false;
    std::string directory = "logs";
    std::string fileName;           // 为空时按时间戳生成 lattice_YYYYmmdd_HHMMSS.log
    size_t maxFileSize = 0;         // 字节，0 表示不轮转
};

/**
 * @brief 同步日志系统
 *
 * 布局引擎是单线程的，日志在调用线程上直接写出；互斥锁只保证宿主
 * 从多个线程调用时各行不交错。
 *
 * 库内部的消息统一使用 "[类名] 消息" 的格式。
 */
class Logger {
public:
    static Logger& GetInstance();

    /**
     * @brief 应用一组设置（会重新打开日志文件）
     */
    void Apply(const LoggerSettings& settings);
    [[nodiscard]] LoggerSettings GetSettings() const;

    void SetLogLevel(LogLevel level);
    [[nodiscard]] LogLevel GetLogLevel() const;
    [[nodiscard]] bool IsEnabled(LogLevel level) const;

    void SetLogToConsole(bool enable);
    void SetColorOutput(bool enable);

    /**
     * @brief 启用/禁用文件输出
     * @param filename 日志目录下的文件名，为空时自动生成
     */
    void SetLogToFile(bool enable, const std::string& filename = "");
    void SetLogDirectory(const std::string& directory);

    /**
     * @brief 设置日志文件最大大小（字节），超过后换到新文件
     */
    void SetMaxFileSize(size_t maxSize);

    /**
     * @brief 设置日志回调，nullptr 表示取消
     *
     * 回调抛出的 std::exception 被拦截并写到 stderr，不会传播到调用方。
     */
    void SetLogCallback(LogCallback callback);

    [[nodiscard]] std::string GetCurrentLogFile() const;

    void Log(LogLevel level, const std::string& message);
    void Debug(const std::string& message);
    void Info(const std::string& message);
    void Warning(const std::string& message);
    void Error(const std::string& message);

    /**
     * @brief printf 风格的格式化日志
     */
    void LogFormat(LogLevel level, const char* format, ...);
    void DebugFormat(const char* format, ...);
    void InfoFormat(const char* format, ...);
    void WarningFormat(const char* format, ...);
    void ErrorFormat(const char* format, ...);

    void LogWithLocation(LogLevel level, const char* file, int line, const std::string& message);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void LogV(LogLevel level, const char* format, va_list args);

    // 以下函数要求调用方已持有 m_mutex
    void Write(LogLevel level, const std::string& message, const char* file = nullptr, int line = 0);
    void OpenLogFile(const std::string& fileName);
    void OpenFileAt(const std::filesystem::path& path);
    void CloseLogFile();
    void RotateIfNeeded();

    std::atomic<LogLevel> m_level{LogLevel::Info};

    LoggerSettings m_settings;
    std::ofstream m_file;
    std::string m_currentLogFile;
    std::string m_baseFileName;
    int m_rotationCount = 0;
    size_t m_currentFileSize = 0;
    LogCallback m_callback;

    mutable std::mutex m_mutex;
};

// ========== 便捷宏 ==========
#define LOG_DEBUG(msg) Lattice::Logger::GetInstance().Debug(msg)
#define LOG_INFO(msg) Lattice::Logger::GetInstance().Info(msg)
#define LOG_WARNING(msg) Lattice::Logger::GetInstance().Warning(msg)
#define LOG_ERROR(msg) Lattice::Logger::GetInstance().Error(msg)

#define LOG_DEBUG_F(fmt, ...) Lattice::Logger::GetInstance().DebugFormat(fmt, ##__VA_ARGS__)
#define LOG_INFO_F(fmt, ...) Lattice::Logger::GetInstance().InfoFormat(fmt, ##__VA_ARGS__)
#define LOG_WARNING_F(fmt, ...) Lattice::Logger::GetInstance().WarningFormat(fmt, ##__VA_ARGS__)
#define LOG_ERROR_F(fmt, ...) Lattice::Logger::GetInstance().ErrorFormat(fmt, ##__VA_ARGS__)

#define LOG_DEBUG_LOC(msg) Lattice::Logger::GetInstance().LogWithLocation(Lattice::LogLevel::Debug, __FILE__, __LINE__, msg)
#define LOG_INFO_LOC(msg) Lattice::Logger::GetInstance().LogWithLocation(Lattice::LogLevel::Info, __FILE__, __LINE__, msg)
#define LOG_WARNING_LOC(msg) Lattice::Logger::GetInstance().LogWithLocation(Lattice::LogLevel::Warning, __FILE__, __LINE__, msg)
#define LOG_ERROR_LOC(msg) Lattice::Logger::GetInstance().LogWithLocation(Lattice::LogLevel::Error, __FILE__, __LINE__, msg)

} // namespace Lattice
