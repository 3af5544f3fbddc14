/**
 * @file logger.hpp
 * @brief Логирование stablebridge
 *
 * Предоставляет:
 * - Фильтрацию по уровню (debug, info, warning, error)
 * - Вывод в консоль с временной меткой и ANSI цветами
 * - Callback для внешних систем (например, UI бота)
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace stablebridge::log {

// =============================================================================
// Уровни логирования
// =============================================================================

/**
 * @brief Уровень сообщения
 */
enum class LogLevel {
    Debug,     ///< Детали опроса и ответов сервисов
    Info,      ///< Ход операции
    Warning,   ///< Деградация без отказа (сеть недоступна, повтор)
    Error      ///< Операция не выполнена
};

/**
 * @brief Преобразовать уровень в строку
 */
[[nodiscard]] constexpr std::string_view log_level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из конфигурации ("debug", "info", "warn", "warning", "error")
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// =============================================================================
// Callback для внешних систем
// =============================================================================

/**
 * @brief Callback для каждого сообщения, прошедшего фильтр уровня
 *
 * @param level Уровень
 * @param component Компонент ("Bridge", "Relay", ...)
 * @param message Сообщение
 */
using LogCallback = std::function<void(LogLevel level, std::string_view component,
                                       std::string_view message)>;

// =============================================================================
// Logger
// =============================================================================

/**
 * @brief Конфигурация Logger
 */
struct LoggerConfig {
    /// @brief Минимальный уровень для вывода
    LogLevel level{LogLevel::Info};

    /// @brief Включить ANSI цвета
    bool color{true};

    /// @brief Включить вывод в консоль
    bool console_output{true};
};

/**
 * @brief Процессный логгер
 *
 * Потокобезопасен: баланс-оракул пишет из нескольких потоков.
 */
class Logger {
public:
    /**
     * @brief Получить единственный экземпляр
     */
    static Logger& instance();

    // Запрещаем копирование
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // =========================================================================
    // Конфигурация
    // =========================================================================

    void configure(const LoggerConfig& config);

    void set_callback(LogCallback callback);

    [[nodiscard]] LogLevel level() const;

    // =========================================================================
    // Запись
    // =========================================================================

    /**
     * @brief Записать сообщение
     *
     * @param level Уровень
     * @param component Компонент, выводится как [Component]
     * @param message Сообщение
     */
    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message) {
        log(LogLevel::Debug, component, message);
    }

    void info(std::string_view component, std::string_view message) {
        log(LogLevel::Info, component, message);
    }

    void warning(std::string_view component, std::string_view message) {
        log(LogLevel::Warning, component, message);
    }

    void error(std::string_view component, std::string_view message) {
        log(LogLevel::Error, component, message);
    }

    // =========================================================================
    // Статистика
    // =========================================================================

    /**
     * @brief Количество выведенных сообщений
     */
    [[nodiscard]] uint64_t get_messages_count() const noexcept;

    /**
     * @brief Количество сообщений уровня Error
     */
    [[nodiscard]] uint64_t get_error_count() const noexcept;

    void reset_stats();

private:
    Logger() = default;
    ~Logger() = default;

    void log_to_console(LogLevel level, std::string_view component, std::string_view message);

    LoggerConfig config_;
    LogCallback callback_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> messages_count_{0};
    std::atomic<uint64_t> error_count_{0};
};

} // namespace stablebridge::log
