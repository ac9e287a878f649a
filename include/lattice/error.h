#pragma once

#include <array>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <source_location>
#include <string>
#include <vector>

namespace Lattice {

/**
 * @brief 错误严重程度
 */
enum class ErrorSeverity {
    Info,
    Warning,    // 可恢复，调用方保持原状态继续
    Error,
    Critical
};

/**
 * @brief 错误类别，由错误码所在区间决定
 */
enum class ErrorCategory {
    IO = 5000,
    Configuration = 6000,
    Layout = 7000,
    Generic = 9000
};

/**
 * @brief 错误码
 */
enum class ErrorCode {
    Success = 0,

    // IO (5000-5999)
    FileNotFound = 5000,
    FileOpenFailed,
    FileReadFailed,
    FileWriteFailed,

    // 配置 (6000-6999)
    ConfigurationInvalid = 6000,
    ConfigurationParseFailed,

    // 布局 (7000-7999)
    InvalidLayoutParameter = 7000,  // 列数 <= 0 等构造参数错误
    SizingCycleDetected,            // 仅用于上报；尺寸循环本身走回退值，不抛出
    InvalidHierarchy,               // 把元素插入自身或其后代

    // 通用 (9000-9999)
    NotImplemented = 9000,
    InvalidArgument,
    NullPointer,
    OutOfRange,
    InvalidState,
    Unknown = 9999
};

const char* ToString(ErrorCode code) noexcept;
const char* ToString(ErrorSeverity severity) noexcept;
const char* ToString(ErrorCategory category) noexcept;

/**
 * @brief Lattice 抛出与上报的错误
 *
 * what() 返回 "[严重程度] [类别] (错误码): 消息 [文件:行 in 函数]"。
 */
class LatticeError : public std::exception {
public:
    LatticeError(ErrorCode code,
                 std::string message,
                 ErrorSeverity severity = ErrorSeverity::Error,
                 std::source_location location = std::source_location::current());

    const char* what() const noexcept override { return m_fullMessage.c_str(); }

    [[nodiscard]] ErrorCode GetCode() const noexcept { return m_code; }
    [[nodiscard]] ErrorCategory GetCategory() const noexcept { return GetCategoryFromCode(m_code); }
    [[nodiscard]] ErrorSeverity GetSeverity() const noexcept { return m_severity; }

    /// 不含前缀与位置的原始消息
    [[nodiscard]] const std::string& GetMessage() const noexcept { return m_message; }
    [[nodiscard]] const std::string& GetFullMessage() const noexcept { return m_fullMessage; }

    [[nodiscard]] const char* GetFile() const noexcept { return m_location.file_name(); }
    [[nodiscard]] int GetLine() const noexcept { return static_cast<int>(m_location.line()); }
    [[nodiscard]] const char* GetFunction() const noexcept { return m_location.function_name(); }

    static ErrorCategory GetCategoryFromCode(ErrorCode code) noexcept;

private:
    ErrorCode m_code;
    ErrorSeverity m_severity;
    std::string m_message;
    std::source_location m_location;
    std::string m_fullMessage;
};

using ErrorCallback = std::function<void(const LatticeError&)>;

/**
 * @brief 非致命错误的集中上报点（单例）
 *
 * 不抛出的失败（配置文件缺失、非法配置被拒绝）经由这里分发给回调。
 * 默认安装一个回调，按严重程度转发给 Logger。
 */
class ErrorHandler {
public:
    struct ErrorStats {
        size_t infoCount = 0;
        size_t warningCount = 0;
        size_t errorCount = 0;
        size_t criticalCount = 0;
        size_t totalCount = 0;
    };

    static ErrorHandler& GetInstance();

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    /**
     * @brief 计数并按添加顺序调用回调
     *
     * 禁用时或已达到上限时直接忽略。回调抛出的 std::exception 写到 stderr，
     * 不影响后续回调。
     */
    void Handle(const LatticeError& error);

    /// @return 回调 ID，用于 RemoveCallback
    size_t AddCallback(ErrorCallback callback);
    void RemoveCallback(size_t id);
    void ClearCallbacks();

    /// 重新安装转发到 Logger 的默认回调
    size_t RestoreDefaultCallback();

    void SetEnabled(bool enable);
    [[nodiscard]] bool IsEnabled() const;

    [[nodiscard]] ErrorStats GetStats() const;
    void ResetStats();

    /**
     * @brief 统计数达到上限后不再处理新错误，0 表示不限
     */
    void SetMaxErrors(size_t maxErrors);

private:
    ErrorHandler();
    ~ErrorHandler() = default;

    struct CallbackEntry {
        size_t id;
        ErrorCallback callback;
    };

    mutable std::mutex m_mutex;
    std::vector<CallbackEntry> m_callbacks;
    size_t m_nextCallbackId = 1;
    std::array<size_t, 4> m_severityCounts{};   // 按 ErrorSeverity 下标
    size_t m_totalCount = 0;
    size_t m_maxErrors = 1000;
    bool m_enabled = true;
};

/**
 * @brief 作用域内有效的错误回调
 */
class ScopedErrorCallback {
public:
    explicit ScopedErrorCallback(ErrorCallback callback)
        : m_id(ErrorHandler::GetInstance().AddCallback(std::move(callback))) {}

    ~ScopedErrorCallback() { ErrorHandler::GetInstance().RemoveCallback(m_id); }

    ScopedErrorCallback(const ScopedErrorCallback&) = delete;
    ScopedErrorCallback& operator=(const ScopedErrorCallback&) = delete;

private:
    size_t m_id;
};

// ============================================================================
// 便捷宏
// ============================================================================

/**
 * @brief 构造错误对象，源位置取自调用处
 *
 * throw LATTICE_ERROR(ErrorCode::NullPointer, "Checkbox 'x' requires a checked state cell");
 */
#define LATTICE_ERROR(code, msg) \
    Lattice::LatticeError(code, msg, Lattice::ErrorSeverity::Error)

#define LATTICE_WARNING(code, msg) \
    Lattice::LatticeError(code, msg, Lattice::ErrorSeverity::Warning)

#define LATTICE_CRITICAL(code, msg) \
    Lattice::LatticeError(code, msg, Lattice::ErrorSeverity::Critical)

/**
 * @brief 条件不满足时抛出 InvalidArgument
 */
#define LATTICE_ASSERT(condition, msg) \
    do { \
        if (!(condition)) { \
            throw LATTICE_ERROR(Lattice::ErrorCode::InvalidArgument, \
                                std::string("Assertion failed: ") + #condition + " - " + (msg)); \
        } \
    } while (0)

/**
 * @brief 上报错误但不抛出
 */
#define HANDLE_ERROR(error) \
    Lattice::ErrorHandler::GetInstance().Handle(error)

} // namespace Lattice
