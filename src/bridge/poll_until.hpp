/**
 * @file poll_until.hpp
 * @brief Повтор операции до результата или истечения срока
 *
 * Используется для ожидания receipt и аттестации. Часы подменяются
 * в тестах, поэтому ожидание 900 секунд проверяется мгновенно.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace stablebridge::bridge {

/**
 * @brief Параметры опроса
 */
struct PollPolicy {
    /// @brief Пауза между попытками
    std::chrono::milliseconds interval{std::chrono::seconds(15)};

    /// @brief Максимальное общее ожидание
    std::chrono::milliseconds max_wait{std::chrono::seconds(900)};
};

/**
 * @brief Источник времени и ожидания
 */
struct PollClock {
    std::function<std::chrono::steady_clock::time_point()> now;
    std::function<void(std::chrono::milliseconds)> sleep;

    /**
     * @brief Реальные часы: steady_clock и sleep_for
     */
    [[nodiscard]] static PollClock system() {
        return PollClock{
            [] { return std::chrono::steady_clock::now(); },
            [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); },
        };
    }
};

/**
 * @brief Повторять attempt, пока он не вернёт значение или не истечёт срок
 *
 * attempt возвращает std::optional<T>: std::nullopt означает "ещё нет".
 * Ошибки отдельной попытки attempt обрабатывает сам.
 * После каждой паузы вызывается on_tick(прошедшие секунды).
 *
 * @return Значение или std::nullopt по истечении policy.max_wait
 */
template<typename Attempt, typename OnTick>
[[nodiscard]] auto poll_until(
    const PollPolicy& policy,
    const PollClock& clock,
    Attempt&& attempt,
    OnTick&& on_tick
) -> std::invoke_result_t<Attempt&> {
    const auto start = clock.now();
    const auto deadline = start + policy.max_wait;

    while (true) {
        if (auto result = attempt()) {
            return result;
        }
        if (clock.now() + policy.interval > deadline) {
            return std::nullopt;
        }
        clock.sleep(policy.interval);

        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(clock.now() - start);
        on_tick(static_cast<uint32_t>(elapsed.count()));
    }
}

/**
 * @brief poll_until без уведомлений
 */
template<typename Attempt>
[[nodiscard]] auto poll_until(
    const PollPolicy& policy,
    const PollClock& clock,
    Attempt&& attempt
) -> std::invoke_result_t<Attempt&> {
    return poll_until(policy, clock, std::forward<Attempt>(attempt), [](uint32_t) {});
}

} // namespace stablebridge::bridge
