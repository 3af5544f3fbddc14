/**
 * @file types.cpp
 * @brief Доставка событий прогресса
 */

#include "types.hpp"
#include "../log/logger.hpp"

#include <exception>
#include <format>

namespace stablebridge::bridge {

void notify_progress(const ProgressCallback& callback, ProgressEvent event) {
    if (!callback) {
        return;
    }
    try {
        callback(event);
    } catch (const std::exception& e) {
        log::Logger::instance().warning(
            "Progress",
            std::format("Callback прогресса ({}) выбросил исключение: {}",
                        to_string(event.stage), e.what())
        );
    } catch (...) {
        log::Logger::instance().warning(
            "Progress",
            std::format("Callback прогресса ({}) выбросил неизвестное исключение",
                        to_string(event.stage))
        );
    }
}

} // namespace stablebridge::bridge
