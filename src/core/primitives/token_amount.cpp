/**
 * @file token_amount.cpp
 * @brief Реализация точных десятичных сумм
 */

#include "token_amount.hpp"

#include <algorithm>
#include <format>

namespace stablebridge::core {

namespace {

/**
 * @brief Умножить на 10^exponent
 *
 * @return std::nullopt при переполнении
 */
[[nodiscard]] std::optional<uint256> scale_up(const uint256& value, unsigned exponent) noexcept {
    uint256 result = value;
    for (unsigned i = 0; i < exponent; ++i) {
        auto next = result.checked_mul(10);
        if (!next) {
            return std::nullopt;
        }
        result = *next;
    }
    return result;
}

[[nodiscard]] uint256 scale_down(const uint256& value, unsigned exponent) noexcept {
    uint256 result = value;
    for (unsigned i = 0; i < exponent && !result.is_zero(); ++i) {
        result = result.divmod(10).first;
    }
    return result;
}

} // anonymous namespace

Result<TokenAmount> TokenAmount::parse(std::string_view text, uint8_t decimals) {
    if (decimals > MAX_DECIMALS) {
        return Err<TokenAmount>(
            ErrorCode::InvalidAmount,
            std::format("Точность {} не поддерживается", decimals)
        );
    }

    // Пробелы по краям допустимы
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);

    auto dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view fraction = dot == std::string_view::npos
        ? std::string_view{}
        : text.substr(dot + 1);

    auto all_digits = [](std::string_view part) {
        return std::all_of(part.begin(), part.end(), [](char c) {
            return c >= '0' && c <= '9';
        });
    };

    if ((whole.empty() && fraction.empty()) || !all_digits(whole) || !all_digits(fraction)) {
        return Err<TokenAmount>(
            ErrorCode::InvalidAmount,
            std::format("Некорректная сумма: '{}'", text)
        );
    }

    // Дробная часть дополняется нулями или усекается до decimals знаков
    std::string digits(whole);
    std::string frac(fraction.substr(0, std::min<std::size_t>(fraction.size(), decimals)));
    frac.append(decimals - frac.size(), '0');
    digits += frac;

    auto first = digits.find_first_not_of('0');
    digits = first == std::string::npos ? "0" : digits.substr(first);

    auto raw = uint256::from_decimal(digits);
    if (!raw) {
        return Err<TokenAmount>(
            ErrorCode::InvalidAmount,
            std::format("Сумма слишком велика: '{}'", text)
        );
    }
    return TokenAmount{*raw, decimals};
}

TokenAmount TokenAmount::rescale(uint8_t new_decimals) const noexcept {
    if (new_decimals == decimals) {
        return *this;
    }
    if (new_decimals < decimals) {
        return TokenAmount{scale_down(raw, decimals - new_decimals), new_decimals};
    }
    auto scaled = scale_up(raw, new_decimals - decimals);
    return TokenAmount{scaled.value_or(uint256::max()), new_decimals};
}

TokenAmount TokenAmount::saturating_sub(const TokenAmount& other) const noexcept {
    TokenAmount rhs = other.rescale(decimals);
    if (rhs.raw >= raw) {
        return zero(decimals);
    }
    return TokenAmount{raw - rhs.raw, decimals};
}

TokenAmount TokenAmount::operator+(const TokenAmount& other) const noexcept {
    TokenAmount rhs = other.rescale(decimals);
    uint256 sum = raw + rhs.raw;
    if (sum < raw) {
        sum = uint256::max();
    }
    return TokenAmount{sum, decimals};
}

std::string TokenAmount::to_string() const {
    std::string digits = raw.to_decimal();
    if (decimals == 0) {
        return digits;
    }
    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }

    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string fraction = digits.substr(digits.size() - decimals);

    auto last = fraction.find_last_not_of('0');
    if (last == std::string::npos) {
        return whole;
    }
    return whole + "." + fraction.substr(0, last + 1);
}

std::string TokenAmount::to_string(uint8_t places) const {
    TokenAmount truncated = rescale(std::min(places, decimals)).rescale(places);
    std::string digits = truncated.raw.to_decimal();
    if (places == 0) {
        return digits;
    }
    if (digits.size() <= places) {
        digits.insert(0, places - digits.size() + 1, '0');
    }
    return digits.substr(0, digits.size() - places) + "." + digits.substr(digits.size() - places);
}

double TokenAmount::to_double() const noexcept {
    double value = raw.to_double();
    for (uint8_t i = 0; i < decimals; ++i) {
        value /= 10.0;
    }
    return value;
}

std::strong_ordering TokenAmount::operator<=>(const TokenAmount& other) const noexcept {
    if (decimals == other.decimals) {
        return raw <=> other.raw;
    }

    // Поднимаем меньшую точность до большей: операция точная
    uint8_t common = std::max(decimals, other.decimals);
    auto lhs = scale_up(raw, common - decimals);
    auto rhs = scale_up(other.raw, common - other.decimals);

    // Масштабируется только одна сторона, переполнение значит "больше"
    if (!lhs) return std::strong_ordering::greater;
    if (!rhs) return std::strong_ordering::less;
    return *lhs <=> *rhs;
}

} // namespace stablebridge::core
