/**
 * @file hash_provider.cpp
 * @brief Реализация SHA256 хешера по умолчанию
 */

#include "hash_provider.hpp"
#include "sha256.hpp"

namespace arbor::crypto {

namespace {

[[nodiscard]] ByteSpan as_span(const Bytes32& v) noexcept {
    return ByteSpan{v.data(), Bytes32::SIZE};
}

} // anonymous namespace

Bytes32 Sha256HashProvider::hash1(const Bytes32& a) const {
    return Bytes32{sha256(as_span(a))};
}

Bytes32 Sha256HashProvider::hash2(const Bytes32& a, const Bytes32& b) const {
    Sha256 hasher;
    hasher.write(as_span(a)).write(as_span(b));
    return Bytes32{hasher.finalize()};
}

Bytes32 Sha256HashProvider::hash3(
    const Bytes32& a,
    const Bytes32& b,
    const Bytes32& c
) const {
    Sha256 hasher;
    hasher.write(as_span(a)).write(as_span(b)).write(as_span(c));
    return Bytes32{hasher.finalize()};
}

std::shared_ptr<const HashProvider> default_hash_provider() {
    static const auto instance = std::make_shared<const Sha256HashProvider>();
    return instance;
}

} // namespace arbor::crypto
