/**
 * @file rlp.cpp
 * @brief Реализация RLP сериализации
 */

#include "rlp.hpp"

namespace stablebridge::evm::rlp {

namespace {

/// @brief Граница короткой формы длины
constexpr std::size_t SHORT_LENGTH_LIMIT = 55;

/// @brief Базовый префикс строки
constexpr uint8_t STRING_OFFSET = 0x80;

/// @brief Базовый префикс списка
constexpr uint8_t LIST_OFFSET = 0xc0;

/**
 * @brief Длина в big-endian без ведущих нулей
 */
[[nodiscard]] Bytes length_bytes(std::size_t length) {
    Bytes out;
    while (length > 0) {
        out.insert(out.begin(), static_cast<uint8_t>(length & 0xFF));
        length >>= 8;
    }
    return out;
}

void append_header(Bytes& out, uint8_t offset, std::size_t length) {
    if (length <= SHORT_LENGTH_LIMIT) {
        out.push_back(static_cast<uint8_t>(offset + length));
        return;
    }
    Bytes len = length_bytes(length);
    out.push_back(static_cast<uint8_t>(offset + SHORT_LENGTH_LIMIT + len.size()));
    out.insert(out.end(), len.begin(), len.end());
}

/**
 * @brief Минимальное big-endian представление целого
 */
[[nodiscard]] Bytes trim_leading_zeros(const core::uint256& value) {
    Hash256 word = value.to_be_bytes();
    std::size_t first = 0;
    while (first < word.size() && word[first] == 0) {
        ++first;
    }
    return Bytes(word.begin() + static_cast<std::ptrdiff_t>(first), word.end());
}

} // anonymous namespace

// =============================================================================
// Свободные функции
// =============================================================================

Bytes encode_bytes(ByteSpan data) {
    Bytes out;
    // Один байт < 0x80 кодируется сам собой
    if (data.size() == 1 && data[0] < STRING_OFFSET) {
        out.push_back(data[0]);
        return out;
    }
    out.reserve(data.size() + 9);
    append_header(out, STRING_OFFSET, data.size());
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

Bytes encode_uint(const core::uint256& value) {
    return encode_bytes(trim_leading_zeros(value));
}

Bytes encode_list_payload(ByteSpan payload) {
    Bytes out;
    out.reserve(payload.size() + 9);
    append_header(out, LIST_OFFSET, payload.size());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

// =============================================================================
// RlpWriter
// =============================================================================

void RlpWriter::write_bytes(ByteSpan data) {
    write_raw(encode_bytes(data));
}

void RlpWriter::write_u64(uint64_t value) {
    write_uint(core::uint256{value});
}

void RlpWriter::write_uint(const core::uint256& value) {
    write_raw(encode_uint(value));
}

void RlpWriter::write_raw(ByteSpan encoded) {
    payload_.insert(payload_.end(), encoded.begin(), encoded.end());
}

Bytes RlpWriter::finish() const {
    return encode_list_payload(payload_);
}

} // namespace stablebridge::evm::rlp
