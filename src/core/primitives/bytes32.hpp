/**
 * @file bytes32.hpp
 * @brief 32-байтное значение (ключ, индекс, значение или хеш узла)
 *
 * Хранится в big-endian формате: байт 0 - старший. Сравнение, битовый
 * доступ и hex представление соответствуют 256-битному беззнаковому
 * числу.
 */

#pragma once

#include "../types.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace arbor::core {

/**
 * @brief Приоритет узла Cartesian дерева (старшие 16 байт хеша ключа)
 *
 * std::array сравнивается лексикографически, что совпадает со
 * сравнением big-endian чисел.
 */
using Priority = std::array<uint8_t, 16>;

/**
 * @brief 32-байтное значение с порядком 256-битного числа
 */
class Bytes32 {
public:
    /// @brief Размер в байтах
    static constexpr std::size_t SIZE = 32;

    /// @brief Конструктор по умолчанию (нулевое значение)
    constexpr Bytes32() noexcept : data_{} {}

    /// @brief Конструктор из массива байт (big-endian)
    constexpr explicit Bytes32(const Hash256& bytes) noexcept : data_(bytes) {}

    /// @brief Конструктор из 64-битного числа (записывается в младшие байты)
    constexpr explicit Bytes32(uint64_t value) noexcept : data_{} {
        for (std::size_t i = 0; i < 8; ++i) {
            data_[SIZE - 1 - i] = static_cast<uint8_t>(value >> (i * 8));
        }
    }

    // =========================================================================
    // Доступ к данным
    // =========================================================================

    [[nodiscard]] constexpr const uint8_t* data() const noexcept {
        return data_.data();
    }

    [[nodiscard]] constexpr uint8_t* data() noexcept {
        return data_.data();
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept {
        return SIZE;
    }

    [[nodiscard]] constexpr uint8_t operator[](std::size_t i) const noexcept {
        return data_[i];
    }

    [[nodiscard]] constexpr uint8_t& operator[](std::size_t i) noexcept {
        return data_[i];
    }

    /**
     * @brief Получить байты в big-endian формате
     */
    [[nodiscard]] constexpr const Hash256& bytes() const noexcept {
        return data_;
    }

    /**
     * @brief Проверить, является ли нулём
     */
    [[nodiscard]] constexpr bool is_zero() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /**
     * @brief Получить бит числа
     *
     * Бит 0 - младший бит числа (младший бит последнего байта).
     *
     * @param index Номер бита (0..255)
     * @return true если бит установлен
     */
    [[nodiscard]] constexpr bool bit(std::size_t index) const noexcept {
        const uint8_t byte = data_[SIZE - 1 - index / 8];
        return ((byte >> (index % 8)) & 1) != 0;
    }

    /**
     * @brief Старшие 16 байт (усечение до 128 бит)
     */
    [[nodiscard]] constexpr Priority high_half() const noexcept {
        Priority result{};
        for (std::size_t i = 0; i < result.size(); ++i) {
            result[i] = data_[i];
        }
        return result;
    }

    /**
     * @brief Младшие 8 байт как число
     *
     * Используется для индексов листьев Indexed дерева.
     */
    [[nodiscard]] constexpr uint64_t low_u64() const noexcept {
        uint64_t result = 0;
        for (std::size_t i = SIZE - 8; i < SIZE; ++i) {
            result = (result << 8) | data_[i];
        }
        return result;
    }

    // =========================================================================
    // Сравнение
    // =========================================================================

    [[nodiscard]] constexpr std::strong_ordering operator<=>(
        const Bytes32& other
    ) const noexcept {
        return data_ <=> other.data_;
    }

    [[nodiscard]] constexpr bool operator==(const Bytes32& other) const noexcept {
        return data_ == other.data_;
    }

    // =========================================================================
    // Строковое представление
    // =========================================================================

    /**
     * @brief Преобразовать в hex строку (64 символа, без префикса)
     */
    [[nodiscard]] std::string to_hex() const;

    /**
     * @brief Создать из hex строки
     *
     * Принимает необязательный префикс "0x" и от 1 до 64 hex символов;
     * короткие строки дополняются нулями слева.
     *
     * @throws std::invalid_argument при некорректной строке
     */
    [[nodiscard]] static Bytes32 from_hex(std::string_view hex);

    // =========================================================================
    // Статические константы
    // =========================================================================

    [[nodiscard]] static constexpr Bytes32 zero() noexcept {
        return Bytes32{};
    }

    [[nodiscard]] static constexpr Bytes32 one() noexcept {
        return Bytes32{1ULL};
    }

    [[nodiscard]] static constexpr Bytes32 max() noexcept {
        Bytes32 result;
        for (auto& b : result.data_) {
            b = 0xFF;
        }
        return result;
    }

private:
    Hash256 data_;
};

} // namespace arbor::core

namespace std {
template<>
struct hash<arbor::core::Bytes32> {
    std::size_t operator()(const arbor::core::Bytes32& v) const noexcept {
        // Младшие 8 байт достаточно случайны для ключей-хешей
        return static_cast<std::size_t>(v.low_u64());
    }
};
}
