/**
 * @file sha256.hpp
 * @brief SHA256 интерфейс
 *
 * Предоставляет:
 * - Потоковый хешер Sha256 (write/finalize) для хеширования
 *   конкатенации нескольких 32-байтных значений без копирования
 * - Функцию sha256() для данных произвольной длины
 *
 * Используется HashProvider по умолчанию и Indexed деревом.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>

namespace arbor::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Функция сжатия SHA256 для одного 64-байтного блока
 *
 * @param state Текущее состояние хеша (будет модифицировано)
 * @param block Указатель на 64 байта данных
 *
 * @warning block должен содержать ровно 64 байта!
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Потоковый SHA256
 *
 * Пример:
 * @code
 * Sha256 hasher;
 * hasher.write(left).write(right);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256() noexcept;

    /**
     * @brief Добавить данные
     */
    Sha256& write(ByteSpan data) noexcept;

    /**
     * @brief Добавить один байт
     */
    Sha256& write_byte(uint8_t byte) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова хешер сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить в начальное состояние
     */
    void reset() noexcept;

private:
    Sha256State state_;
    std::array<uint8_t, constants::SHA256_BLOCK_SIZE> buffer_{};
    std::size_t buffered_{0};
    uint64_t total_len_{0};
};

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 *
 * Полная реализация SHA256 согласно FIPS 180-4.
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

} // namespace arbor::crypto
