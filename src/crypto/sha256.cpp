/**
 * @file sha256.cpp
 * @brief Реализация потокового SHA256
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <cstring>

namespace arbor::crypto {

// Программная реализация функции сжатия (sha256_generic.cpp)
namespace generic {
    void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;
}

void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    generic::sha256_transform(state, block);
}

// =============================================================================
// Sha256
// =============================================================================

Sha256::Sha256() noexcept
    : state_(constants::SHA256_INIT) {}

void Sha256::reset() noexcept {
    state_ = constants::SHA256_INIT;
    buffered_ = 0;
    total_len_ = 0;
}

Sha256& Sha256::write(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    total_len_ += len;

    // Дополняем неполный блок из буфера
    if (buffered_ > 0) {
        const std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;

        if (buffered_ < buffer_.size()) {
            return *this;
        }
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    // Полные 64-байтные блоки обрабатываем напрямую
    while (len >= constants::SHA256_BLOCK_SIZE) {
        sha256_transform(state_, ptr);
        ptr += constants::SHA256_BLOCK_SIZE;
        len -= constants::SHA256_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }

    return *this;
}

Sha256& Sha256::write_byte(uint8_t byte) noexcept {
    return write(ByteSpan{&byte, 1});
}

Hash256 Sha256::finalize() noexcept {
    // Длина сообщения в битах (big-endian)
    const uint64_t bit_len = total_len_ * 8;

    // Добавляем 0x80 (1 бит + 7 нулевых битов)
    buffer_[buffered_++] = 0x80;

    if (buffered_ > 56) {
        // Длина не помещается, нужен дополнительный блок
        std::memset(buffer_.data() + buffered_, 0, buffer_.size() - buffered_);
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    std::memset(buffer_.data() + buffered_, 0, 56 - buffered_);
    write_be64(buffer_.data() + 56, bit_len);
    sha256_transform(state_, buffer_.data());

    // Конвертируем состояние в хеш (big-endian)
    Hash256 result;
    for (std::size_t i = 0; i < 8; ++i) {
        write_be32(result.data() + i * 4, state_[i]);
    }

    reset();
    return result;
}

Hash256 sha256(ByteSpan data) noexcept {
    Sha256 hasher;
    hasher.write(data);
    return hasher.finalize();
}

} // namespace arbor::crypto
