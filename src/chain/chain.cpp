/**
 * @file chain.cpp
 * @brief Разбор имён сетей
 */

#include "chain.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <string>

namespace stablebridge::chain {

Result<Chain> parse_chain(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    for (Chain chain : ALL_CHAINS) {
        if (to_string(chain) == lowered) {
            return chain;
        }
    }
    return Err<Chain>(
        ErrorCode::UnsupportedChain,
        std::format("Неизвестная сеть: '{}'", name)
    );
}

} // namespace stablebridge::chain
