/**
 * @file keccak.cpp
 * @brief Программная реализация Keccak-256
 *
 * Перестановка Keccak-f[1600] по FIPS 202, padding оригинального
 * Keccak (0x01 ... 0x80), как в Ethereum.
 */

#include "keccak.hpp"

#include <bit>
#include <cstring>

namespace stablebridge::crypto {

// =============================================================================
// Константы Keccak-f[1600]
// =============================================================================

namespace {

/// @brief Константы раундов (iota)
constexpr std::array<uint64_t, 24> ROUND_CONSTANTS = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

/// @brief Смещения поворота (rho) в порядке обхода pi
constexpr std::array<int, 24> ROTATIONS = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44,
};

/// @brief Порядок перестановки лейнов (pi)
constexpr std::array<int, 24> PI_LANES = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1,
};

[[nodiscard]] inline uint64_t load_le64(const uint8_t* p) noexcept {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | p[i];
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// Перестановка
// =============================================================================

void keccak_f1600(KeccakState& a) noexcept {
    for (uint64_t round_constant : ROUND_CONSTANTS) {
        // Theta
        std::array<uint64_t, 5> c{};
        for (int x = 0; x < 5; ++x) {
            c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
        }
        for (int x = 0; x < 5; ++x) {
            uint64_t d = c[(x + 4) % 5] ^ std::rotl(c[(x + 1) % 5], 1);
            for (int y = 0; y < 25; y += 5) {
                a[y + x] ^= d;
            }
        }

        // Rho и Pi
        uint64_t current = a[1];
        for (int i = 0; i < 24; ++i) {
            int lane = PI_LANES[i];
            uint64_t saved = a[lane];
            a[lane] = std::rotl(current, ROTATIONS[i]);
            current = saved;
        }

        // Chi
        for (int y = 0; y < 25; y += 5) {
            std::array<uint64_t, 5> row{};
            for (int x = 0; x < 5; ++x) {
                row[x] = a[y + x];
            }
            for (int x = 0; x < 5; ++x) {
                a[y + x] = row[x] ^ (~row[(x + 1) % 5] & row[(x + 2) % 5]);
            }
        }

        // Iota
        a[0] ^= round_constant;
    }
}

// =============================================================================
// Keccak256
// =============================================================================

void Keccak256::absorb_block() noexcept {
    for (std::size_t i = 0; i < RATE / 8; ++i) {
        state_[i] ^= load_le64(buffer_.data() + i * 8);
    }
    keccak_f1600(state_);
    buffer_len_ = 0;
}

void Keccak256::update(ByteSpan data) noexcept {
    for (uint8_t byte : data) {
        buffer_[buffer_len_++] = byte;
        if (buffer_len_ == RATE) {
            absorb_block();
        }
    }
}

Hash256 Keccak256::finalize() noexcept {
    // Padding: 0x01 после данных, 0x80 в последнем байте блока
    std::memset(buffer_.data() + buffer_len_, 0, RATE - buffer_len_);
    buffer_[buffer_len_] ^= 0x01;
    buffer_[RATE - 1] ^= 0x80;
    absorb_block();

    Hash256 out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(state_[i / 8] >> (8 * (i % 8)));
    }
    return out;
}

void Keccak256::reset() noexcept {
    state_.fill(0);
    buffer_.fill(0);
    buffer_len_ = 0;
}

// =============================================================================
// Функции-обёртки
// =============================================================================

Hash256 keccak256(ByteSpan data) noexcept {
    Keccak256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Hash256 keccak256(std::string_view text) noexcept {
    return keccak256(ByteSpan{reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

std::array<uint8_t, 4> function_selector(std::string_view signature) noexcept {
    Hash256 digest = keccak256(signature);
    return {digest[0], digest[1], digest[2], digest[3]};
}

} // namespace stablebridge::crypto
