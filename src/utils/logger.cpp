#include "lattice/logger.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

namespace Lattice {

namespace {

std::string FormatNow(const char* pattern, bool withMillis) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);

    std::tm timeInfo{};
#ifdef _WIN32
    localtime_s(&timeInfo, &time);
#else
    localtime_r(&time, &timeInfo);
#endif

    std::ostringstream out;
    out << std::put_time(&timeInfo, pattern);
    if (withMillis) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        out << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return out.str();
}

std::string VFormat(const char* format, va_list args) {
    va_list measure;
    va_copy(measure, args);
    const int size = std::vsnprintf(nullptr, 0, format, measure);
    va_end(measure);

    if (size < 0) {
        return std::string("[format error] ") + format;
    }

    std::vector<char> buffer(static_cast<size_t>(size) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), format, args);
    return std::string(buffer.data(), static_cast<size_t>(size));
}

const char* ColorCode(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "\033[36m";
        case LogLevel::Info:    return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error:   return "\033[31m";
    }
    return "";
}

// 只保留文件名
std::string_view BaseName(std::string_view path) noexcept {
    const size_t pos = path.find_last_of("/\\");
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

} // namespace

const char* ToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
#ifdef _WIN32
    // 控制台 UTF-8 与 ANSI 颜色
    SetConsoleOutputCP(CP_UTF8);
    HANDLE out = GetStdHandle(STD_OUTPUT_HANDLE);
    DWORD mode = 0;
    if (out != INVALID_HANDLE_VALUE && GetConsoleMode(out, &mode)) {
        SetConsoleMode(out, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
    }
#endif
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(m_mutex);
    CloseLogFile();
}

// ============================================================================
// 配置
// ============================================================================

void Logger::Apply(const LoggerSettings& settings) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings = settings;
    m_level.store(settings.level, std::memory_order_release);

    CloseLogFile();
    if (m_settings.file) {
        OpenLogFile(m_settings.fileName);
    }
}

LoggerSettings Logger::GetSettings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    LoggerSettings settings = m_settings;
    settings.level = m_level.load(std::memory_order_acquire);
    return settings;
}

void Logger::SetLogLevel(LogLevel level) {
    m_level.store(level, std::memory_order_release);
}

LogLevel Logger::GetLogLevel() const {
    return m_level.load(std::memory_order_acquire);
}

bool Logger::IsEnabled(LogLevel level) const {
    return level >= m_level.load(std::memory_order_acquire);
}

void Logger::SetLogToConsole(bool enable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.console = enable;
}

void Logger::SetColorOutput(bool enable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.colors = enable;
}

void Logger::SetLogToFile(bool enable, const std::string& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.file = enable;
    m_settings.fileName = filename;

    CloseLogFile();
    if (enable) {
        OpenLogFile(filename);
    }
}

void Logger::SetLogDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.directory = directory;
}

void Logger::SetMaxFileSize(size_t maxSize) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.maxFileSize = maxSize;
}

void Logger::SetLogCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}

std::string Logger::GetCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentLogFile;
}

// ============================================================================
// 输出
// ============================================================================

void Logger::Log(LogLevel level, const std::string& message) {
    if (!IsEnabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    Write(level, message);
}

void Logger::Debug(const std::string& message) {
    Log(LogLevel::Debug, message);
}

void Logger::Info(const std::string& message) {
    Log(LogLevel::Info, message);
}

void Logger::Warning(const std::string& message) {
    Log(LogLevel::Warning, message);
}

void Logger::Error(const std::string& message) {
    Log(LogLevel::Error, message);
}

void Logger::LogV(LogLevel level, const char* format, va_list args) {
    if (!IsEnabled(level)) {
        return;
    }
    const std::string message = VFormat(format, args);
    std::lock_guard<std::mutex> lock(m_mutex);
    Write(level, message);
}

void Logger::LogFormat(LogLevel level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(level, format, args);
    va_end(args);
}

void Logger::DebugFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(LogLevel::Debug, format, args);
    va_end(args);
}

void Logger::InfoFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(LogLevel::Info, format, args);
    va_end(args);
}

void Logger::WarningFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(LogLevel::Warning, format, args);
    va_end(args);
}

void Logger::ErrorFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(LogLevel::Error, format, args);
    va_end(args);
}

void Logger::LogWithLocation(LogLevel level, const char* file, int line, const std::string& message) {
    if (!IsEnabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    Write(level, message, file, line);
}

void Logger::Write(LogLevel level, const std::string& message, const char* file, int line) {
    std::ostringstream composed;
    composed << '[' << FormatNow("%Y-%m-%d %H:%M:%S", true) << "] [" << ToString(level) << "] ";
    if (file != nullptr) {
        composed << '[' << BaseName(file) << ':' << line << "] ";
    }
    composed << message;
    const std::string text = composed.str();

    if (m_settings.console) {
        std::ostream& stream = level == LogLevel::Error ? std::cerr : std::cout;
        if (m_settings.colors) {
            stream << ColorCode(level) << text << "\033[0m" << std::endl;
        } else {
            stream << text << std::endl;
        }
    }

    if (m_file.is_open()) {
        RotateIfNeeded();
        if (m_file.is_open()) {
            m_file << text << '\n';
            m_file.flush();
            m_currentFileSize += text.size() + 1;
        }
    }

    if (m_callback) {
        try {
            m_callback(level, text);
        } catch (const std::exception& e) {
            // 已持有锁，不能再回到 Log
            std::cerr << "[Logger] Log callback threw: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[Logger] Log callback threw an unknown exception" << std::endl;
        }
    }
}

// ============================================================================
// 日志文件
// ============================================================================

void Logger::OpenLogFile(const std::string& fileName) {
    std::error_code ec;
    std::filesystem::create_directories(m_settings.directory, ec);
    if (ec) {
        std::cerr << "[Logger] Failed to create log directory '" << m_settings.directory
                  << "': " << ec.message() << std::endl;
    }

    m_baseFileName = fileName.empty() ? "lattice_" + FormatNow("%Y%m%d_%H%M%S", false) + ".log" : fileName;
    m_rotationCount = 0;
    OpenFileAt(std::filesystem::path(m_settings.directory) / m_baseFileName);
}

void Logger::OpenFileAt(const std::filesystem::path& path) {
    m_file.open(path, std::ios::out | std::ios::trunc);
    if (!m_file.is_open()) {
        std::cerr << "[Logger] Failed to open log file: " << path.string() << std::endl;
        m_settings.file = false;
        return;
    }

    m_currentLogFile = path.string();
    m_currentFileSize = 0;
}

void Logger::CloseLogFile() {
    if (m_file.is_open()) {
        m_file.close();
    }
    m_currentLogFile.clear();
    m_currentFileSize = 0;
}

void Logger::RotateIfNeeded() {
    if (m_settings.maxFileSize == 0 || m_currentFileSize < m_settings.maxFileSize) {
        return;
    }

    // 轮转后的文件按序号区分：lattice_x.log -> lattice_x_1.log -> lattice_x_2.log
    const std::filesystem::path base(m_baseFileName);
    const std::string rotated = base.stem().string() + "_" + std::to_string(++m_rotationCount) + base.extension().string();

    m_file.close();
    OpenFileAt(std::filesystem::path(m_settings.directory) / rotated);
}

} // namespace Lattice
