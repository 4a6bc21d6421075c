/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * Все 32-байтные значения Arbor (ключи, индексы, хеши) хранятся в
 * big-endian формате, а SHA256 читает и пишет слова тоже в big-endian.
 * Этот модуль предоставляет преобразования между форматом хоста и
 * big-endian буферами.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <bit>
#include <concepts>

namespace arbor {

/**
 * @brief Concept для целочисленных типов фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 1 || sizeof(T) == 2 ||
                           sizeof(T) == 4 || sizeof(T) == 8);

/**
 * @brief Проверка: система big-endian?
 */
[[nodiscard]] consteval bool is_big_endian() noexcept {
    return std::endian::native == std::endian::big;
}

/**
 * @brief Поменять порядок байт (byte swap)
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T byte_swap(T value) noexcept {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else {
        T result = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            result = static_cast<T>((result << 8) | (value & 0xFF));
            value = static_cast<T>(value >> 8);
        }
        return result;
    }
}

/**
 * @brief Преобразовать число из формата хоста в big-endian
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T to_big_endian(T value) noexcept {
    if constexpr (is_big_endian()) {
        return value;
    } else {
        return byte_swap(value);
    }
}

/**
 * @brief Преобразовать число из big-endian в формат хоста
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T from_big_endian(T value) noexcept {
    return to_big_endian(value);
}

/**
 * @brief Записать uint32_t в буфер в big-endian формате
 *
 * @param dest Указатель на буфер (минимум 4 байта)
 * @param value Значение для записи
 */
inline void write_be32(uint8_t* dest, uint32_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Прочитать uint32_t из big-endian буфера
 */
[[nodiscard]] inline uint32_t read_be32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return from_big_endian(value);
}

/**
 * @brief Записать uint64_t в буфер в big-endian формате
 */
inline void write_be64(uint8_t* dest, uint64_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

} // namespace arbor
