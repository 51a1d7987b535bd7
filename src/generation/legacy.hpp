#pragma once

#include "core/uuid.hpp"

#include <QUuid>

#include <string_view>

namespace chronoid::generation {

// Name-based namespaces from RFC 4122 appendix C.
inline constexpr Uuid NAMESPACE_DNS{Uint128{0x6ba7b8109dad11d1, 0x80b400c04fd430c8}};
inline constexpr Uuid NAMESPACE_URL{Uint128{0x6ba7b8119dad11d1, 0x80b400c04fd430c8}};
inline constexpr Uuid NAMESPACE_OID{Uint128{0x6ba7b8129dad11d1, 0x80b400c04fd430c8}};
inline constexpr Uuid NAMESPACE_X500{Uint128{0x6ba7b8149dad11d1, 0x80b400c04fd430c8}};

[[nodiscard]] QUuid to_quuid(const Uuid& uuid);
[[nodiscard]] Uuid from_quuid(const QUuid& uuid);

// Version 3: MD5 of namespace + name.
[[nodiscard]] Uuid generate_v3(const Uuid& name_space, std::string_view name);

// Version 4: random, from the system CSPRNG.
[[nodiscard]] Uuid generate_v4();

// Version 5: SHA-1 of namespace + name.
[[nodiscard]] Uuid generate_v5(const Uuid& name_space, std::string_view name);

} // namespace chronoid::generation
