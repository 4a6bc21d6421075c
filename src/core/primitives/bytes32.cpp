/**
 * @file bytes32.cpp
 * @brief Реализация 32-байтного значения
 */

#include "bytes32.hpp"

#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace arbor::core {

namespace {

/**
 * @brief Преобразовать hex символ в число
 */
[[nodiscard]] inline uint8_t hex_char_to_int(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw std::invalid_argument("Invalid hex character");
}

} // namespace

std::string Bytes32::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < SIZE; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data_[i]);
    }
    return oss.str();
}

Bytes32 Bytes32::from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }

    if (hex.empty() || hex.size() > SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length");
    }

    Bytes32 result;

    // Разбираем с конца: последний символ - младший полубайт
    std::size_t nibble = 0;
    for (std::size_t i = hex.size(); i-- > 0; ++nibble) {
        const uint8_t v = hex_char_to_int(hex[i]);
        const std::size_t byte_idx = SIZE - 1 - nibble / 2;
        if (nibble % 2 == 0) {
            result.data_[byte_idx] = v;
        } else {
            result.data_[byte_idx] = static_cast<uint8_t>(result.data_[byte_idx] | (v << 4));
        }
    }

    return result;
}

} // namespace arbor::core
