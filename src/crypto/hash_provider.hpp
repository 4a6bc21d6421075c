/**
 * @file hash_provider.hpp
 * @brief Подключаемая хеш-функция деревьев
 *
 * Деревья получают хеш-функцию как объект-стратегию. По умолчанию
 * используется SHA256 над big-endian конкатенацией входов
 * (32 / 64 / 96 байт). Собственную реализацию можно установить только
 * пока дерево пустое.
 */

#pragma once

#include "../core/primitives/bytes32.hpp"

#include <memory>
#include <string_view>

namespace arbor::crypto {

using core::Bytes32;

/**
 * @brief Интерфейс хеш-функции
 *
 * Реализация должна быть детерминированной и не иметь изменяемого
 * состояния: один экземпляр может разделяться несколькими деревьями.
 */
class HashProvider {
public:
    virtual ~HashProvider() = default;

    /**
     * @brief Хеш одного значения (производный приоритет узла)
     */
    [[nodiscard]] virtual Bytes32 hash1(const Bytes32& a) const = 0;

    /**
     * @brief Хеш пары значений
     */
    [[nodiscard]] virtual Bytes32 hash2(const Bytes32& a, const Bytes32& b) const = 0;

    /**
     * @brief Хеш тройки значений
     */
    [[nodiscard]] virtual Bytes32 hash3(
        const Bytes32& a,
        const Bytes32& b,
        const Bytes32& c
    ) const = 0;

    /**
     * @brief Название для логов
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief SHA256 над конкатенацией входов
 */
class Sha256HashProvider final : public HashProvider {
public:
    [[nodiscard]] Bytes32 hash1(const Bytes32& a) const override;
    [[nodiscard]] Bytes32 hash2(const Bytes32& a, const Bytes32& b) const override;
    [[nodiscard]] Bytes32 hash3(
        const Bytes32& a,
        const Bytes32& b,
        const Bytes32& c
    ) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "sha256"; }
};

/**
 * @brief Общий экземпляр хешера по умолчанию
 */
[[nodiscard]] std::shared_ptr<const HashProvider> default_hash_provider();

} // namespace arbor::crypto
