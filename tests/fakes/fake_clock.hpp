/**
 * @file fake_clock.hpp
 * @brief Управляемые часы для poll_until
 */

#pragma once

#include "bridge/poll_until.hpp"

#include <chrono>
#include <memory>

namespace stablebridge::tests {

/**
 * @brief Часы, которые двигаются только при sleep
 *
 * Копии PollClock разделяют одно состояние.
 */
class FakeClock {
public:
    FakeClock() : state_(std::make_shared<State>()) {}

    [[nodiscard]] bridge::PollClock clock() const {
        auto state = state_;
        return bridge::PollClock{
            [state] { return state->now; },
            [state](std::chrono::milliseconds duration) {
                state->now += duration;
                state->slept += duration;
                ++state->sleeps;
            },
        };
    }

    [[nodiscard]] std::chrono::milliseconds slept() const { return state_->slept; }
    [[nodiscard]] int sleeps() const { return state_->sleeps; }

private:
    struct State {
        std::chrono::steady_clock::time_point now{};
        std::chrono::milliseconds slept{0};
        int sleeps{0};
    };

    std::shared_ptr<State> state_;
};

} // namespace stablebridge::tests
