#include "generation/legacy.hpp"

#include <QByteArray>

namespace chronoid::generation {
namespace {

QByteArray to_byte_array(std::string_view text) {
    return QByteArray(text.data(), static_cast<qsizetype>(text.size()));
}

} // namespace

QUuid to_quuid(const Uuid& uuid) {
    const auto& bytes = uuid.bytes();
    return QUuid::fromRfc4122(QByteArray(reinterpret_cast<const char*>(bytes.data()),
                                         static_cast<qsizetype>(bytes.size())));
}

Uuid from_quuid(const QUuid& uuid) {
    const auto raw = uuid.toRfc4122();
    Uuid::Bytes bytes{};
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(raw.at(static_cast<qsizetype>(i)));
    }
    return Uuid(bytes);
}

Uuid generate_v3(const Uuid& name_space, std::string_view name) {
    return from_quuid(QUuid::createUuidV3(to_quuid(name_space), to_byte_array(name)));
}

Uuid generate_v4() {
    return from_quuid(QUuid::createUuid());
}

Uuid generate_v5(const Uuid& name_space, std::string_view name) {
    return from_quuid(QUuid::createUuidV5(to_quuid(name_space), to_byte_array(name)));
}

} // namespace chronoid::generation
