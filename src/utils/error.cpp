/*
 * Copyright (c) 2025 Li Chaoyu
 * 
 * This file is part of Lattice.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 *
 * For commercial licensing, please contact: 2052046346@qq.com
 */
#include "lattice/error.h"

#include <algorithm>
#include <iostream>

#include "lattice/logger.h"

namespace Lattice {

namespace {

struct CategoryRange {
    int first;
    int last;
    ErrorCategory category;
};

constexpr CategoryRange kCategoryRanges[] = {
    {5000, 5999, ErrorCategory::IO},
    {6000, 6999, ErrorCategory::Configuration},
    {7000, 7999, ErrorCategory::Layout},
};

LogLevel ToLogLevel(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Info:    return LogLevel::Info;
        case ErrorSeverity::Warning: return LogLevel::Warning;
        case ErrorSeverity::Error:
        case ErrorSeverity::Critical:
            break;
    }
    return LogLevel::Error;
}

void ForwardToLogger(const LatticeError& error) {
    Logger::GetInstance().Log(ToLogLevel(error.GetSeverity()), "[ErrorHandler] " + error.GetFullMessage());
}

} // namespace

// ============================================================================
// LatticeError
// ============================================================================

LatticeError::LatticeError(ErrorCode code, std::string message, ErrorSeverity severity, std::source_location location)
    : m_code(code)
    , m_severity(severity)
    , m_message(std::move(message))
    , m_location(location) {
    m_fullMessage = std::string("[") + ToString(m_severity) + "] [" + ToString(GetCategory()) + "] (" +
                    std::to_string(static_cast<int>(m_code)) + "): " + m_message + " [" + GetFile() + ":" +
                    std::to_string(GetLine()) + " in " + GetFunction() + "]";
}

ErrorCategory LatticeError::GetCategoryFromCode(ErrorCode code) noexcept {
    const int value = static_cast<int>(code);
    for (const CategoryRange& range : kCategoryRanges) {
        if (value >= range.first && value <= range.last) {
            return range.category;
        }
    }
    return ErrorCategory::Generic;
}

// ============================================================================
// ErrorHandler
// ============================================================================

ErrorHandler& ErrorHandler::GetInstance() {
    static ErrorHandler instance;
    return instance;
}

ErrorHandler::ErrorHandler() {
    RestoreDefaultCallback();
}

size_t ErrorHandler::RestoreDefaultCallback() {
    return AddCallback(&ForwardToLogger);
}

void ErrorHandler::Handle(const LatticeError& error) {
    std::vector<CallbackEntry> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_enabled || (m_maxErrors > 0 && m_totalCount >= m_maxErrors)) {
            return;
        }
        ++m_severityCounts[static_cast<size_t>(error.GetSeverity())];
        ++m_totalCount;

        // 在锁外调用，回调内部可以增删回调或再次上报
        callbacks = m_callbacks;
    }

    for (const CallbackEntry& entry : callbacks) {
        if (!entry.callback) {
            continue;
        }
        try {
            entry.callback(error);
        } catch (const std::exception& e) {
            std::cerr << "[ErrorHandler] Callback " << entry.id << " threw: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[ErrorHandler] Callback " << entry.id << " threw an unknown exception" << std::endl;
        }
    }
}

size_t ErrorHandler::AddCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t id = m_nextCallbackId++;
    m_callbacks.push_back({id, std::move(callback)});
    return id;
}

void ErrorHandler::RemoveCallback(size_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::erase_if(m_callbacks, [id](const CallbackEntry& entry) { return entry.id == id; });
}

void ErrorHandler::ClearCallbacks() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.clear();
}

void ErrorHandler::SetEnabled(bool enable) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_enabled = enable;
}

bool ErrorHandler::IsEnabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled;
}

ErrorHandler::ErrorStats ErrorHandler::GetStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    ErrorStats stats;
    stats.infoCount = m_severityCounts[static_cast<size_t>(ErrorSeverity::Info)];
    stats.warningCount = m_severityCounts[static_cast<size_t>(ErrorSeverity::Warning)];
    stats.errorCount = m_severityCounts[static_cast<size_t>(ErrorSeverity::Error)];
    stats.criticalCount = m_severityCounts[static_cast<size_t>(ErrorSeverity::Critical)];
    stats.totalCount = m_totalCount;
    return stats;
}

void ErrorHandler::ResetStats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_severityCounts.fill(0);
    m_totalCount = 0;
}

void ErrorHandler::SetMaxErrors(size_t maxErrors) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxErrors = maxErrors;
}

// ============================================================================
// 字符串转换
// ============================================================================

const char* ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                  return "Success";
        case ErrorCode::FileNotFound:             return "FileNotFound";
        case ErrorCode::FileOpenFailed:           return "FileOpenFailed";
        case ErrorCode::FileReadFailed:           return "FileReadFailed";
        case ErrorCode::FileWriteFailed:          return "FileWriteFailed";
        case ErrorCode::ConfigurationInvalid:     return "ConfigurationInvalid";
        case ErrorCode::ConfigurationParseFailed: return "ConfigurationParseFailed";
        case ErrorCode::InvalidLayoutParameter:   return "InvalidLayoutParameter";
        case ErrorCode::SizingCycleDetected:      return "SizingCycleDetected";
        case ErrorCode::InvalidHierarchy:         return "InvalidHierarchy";
        case ErrorCode::NotImplemented:           return "NotImplemented";
        case ErrorCode::InvalidArgument:          return "InvalidArgument";
        case ErrorCode::NullPointer:              return "NullPointer";
        case ErrorCode::OutOfRange:               return "OutOfRange";
        case ErrorCode::InvalidState:             return "InvalidState";
        case ErrorCode::Unknown:                  return "Unknown";
    }
    return "UnknownErrorCode";
}

const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Info:     return "INFO";
        case ErrorSeverity::Warning:  return "WARNING";
        case ErrorSeverity::Error:    return "ERROR";
        case ErrorSeverity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* ToString(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::IO:            return "IO";
        case ErrorCategory::Configuration: return "Configuration";
        case ErrorCategory::Layout:        return "Layout";
        case ErrorCategory::Generic:       return "Generic";
    }
    return "Unknown";
}

} // namespace Lattice
