/**
 * @file logger.cpp
 * @brief Реализация логгера
 */

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stablebridge::log {

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    std::string lowered(text.size(), '\0');
    std::transform(text.begin(), text.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    return std::nullopt;
}

// =============================================================================
// Singleton
// =============================================================================

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

// =============================================================================
// Конфигурация
// =============================================================================

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

void Logger::set_callback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.level;
}

// =============================================================================
// Запись
// =============================================================================

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (level < config_.level) {
            return;
        }

        messages_count_++;
        if (level == LogLevel::Error) {
            error_count_++;
        }

        if (config_.console_output) {
            log_to_console(level, component, message);
        }
        callback = callback_;
    }

    // Callback вызывается вне блокировки: он может сам писать в лог
    if (callback) {
        callback(level, component, message);
    }
}

// =============================================================================
// Статистика
// =============================================================================

uint64_t Logger::get_messages_count() const noexcept {
    return messages_count_;
}

uint64_t Logger::get_error_count() const noexcept {
    return error_count_;
}

void Logger::reset_stats() {
    messages_count_ = 0;
    error_count_ = 0;
}

// =============================================================================
// Приватные методы
// =============================================================================

void Logger::log_to_console(LogLevel level, std::string_view component, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << log_level_to_string(level) << "] ";
    if (!component.empty()) {
        ss << "[" << component << "] ";
    }
    ss << message;

    // Предупреждения и ошибки идут в stderr, остальное в stdout
    std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;

    if (!config_.color) {
        out << ss.str() << std::endl;
        return;
    }

    switch (level) {
        case LogLevel::Debug:
            out << "\033[90m" << ss.str() << "\033[0m" << std::endl;
            break;
        case LogLevel::Info:
            out << "\033[32m" << ss.str() << "\033[0m" << std::endl;
            break;
        case LogLevel::Warning:
            out << "\033[33m" << ss.str() << "\033[0m" << std::endl;
            break;
        case LogLevel::Error:
            out << "\033[31m" << ss.str() << "\033[0m" << std::endl;
            break;
    }
}

} // namespace stablebridge::log
