#include "core/uuid.hpp"

#include <algorithm>
#include <ostream>

namespace chronoid {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void erase_all(std::string& text, std::string_view needle) {
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos)) {
        text.erase(pos, needle.size());
    }
}

Error bad_length(std::string_view what, size_t got) {
    return Error::validation(std::string(what) + " must be exactly 16 bytes (got " +
                             std::to_string(got) + ")");
}

std::optional<Error> check_field(uint64_t value, unsigned width, int index, std::string_view name) {
    if (value > low_mask(width)) {
        return Error::validation("field " + std::to_string(index) + " (" + std::string(name) +
                                 ") out of range (need a " + std::to_string(width) + "-bit value)");
    }
    return std::nullopt;
}

} // namespace

Result<Uuid, Error> Uuid::create(const UuidArgs& args) {
    const int sources = static_cast<int>(args.hex.has_value()) +
                        static_cast<int>(args.bytes.has_value()) +
                        static_cast<int>(args.bytes_le.has_value()) +
                        static_cast<int>(args.int_value.has_value()) +
                        static_cast<int>(args.fields.has_value());
    if (sources != 1) {
        return Result<Uuid, Error>::err(Error::usage(
            "one of the hex, bytes, bytes_le, fields, or int arguments must be given"
            " (got " + std::to_string(sources) + ")"));
    }

    auto built = [&]() -> Result<Uuid, Error> {
        if (args.hex) return from_string(*args.hex);
        if (args.bytes) return from_bytes(*args.bytes);
        if (args.bytes_le) return from_bytes_le(*args.bytes_le);
        if (args.fields) return from_fields(*args.fields);
        return Result<Uuid, Error>::ok(from_int(*args.int_value));
    }();

    if (!args.version) {
        return built;
    }
    const int version = *args.version;
    return built.and_then([version](const Uuid& u) { return u.with_version(version); });
}

Result<Uuid, Error> Uuid::from_string(std::string_view text) {
    std::string clean(text);
    erase_all(clean, "urn:");
    erase_all(clean, "uuid:");
    const auto first = clean.find_first_not_of("{}");
    const auto last = clean.find_last_not_of("{}");
    clean = first == std::string::npos ? std::string{} : clean.substr(first, last - first + 1);
    clean.erase(std::remove(clean.begin(), clean.end(), '-'), clean.end());

    if (clean.size() != 32) {
        return Result<Uuid, Error>::err(Error::validation(
            "badly formed hexadecimal UUID string: '" + std::string(text) + "'"));
    }

    Bytes bytes{};
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        const int high = hex_value(clean[2 * i]);
        const int low = hex_value(clean[2 * i + 1]);
        if (high < 0 || low < 0) {
            return Result<Uuid, Error>::err(Error::validation(
                "badly formed hexadecimal UUID string: '" + std::string(text) + "'"));
        }
        bytes[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return Result<Uuid, Error>::ok(Uuid(bytes));
}

Result<Uuid, Error> Uuid::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != BYTE_SIZE) {
        return Result<Uuid, Error>::err(bad_length("bytes", bytes.size()));
    }
    Bytes out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Result<Uuid, Error>::ok(Uuid(out));
}

Result<Uuid, Error> Uuid::from_bytes_le(std::span<const uint8_t> bytes) {
    if (bytes.size() != BYTE_SIZE) {
        return Result<Uuid, Error>::err(bad_length("bytes_le", bytes.size()));
    }
    Bytes out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    std::reverse(out.begin(), out.begin() + 4);
    std::reverse(out.begin() + 4, out.begin() + 6);
    std::reverse(out.begin() + 6, out.begin() + 8);
    return Result<Uuid, Error>::ok(Uuid(out));
}

Result<Uuid, Error> Uuid::from_fields(const UuidFields& f) {
    const std::optional<Error> checks[] = {
        check_field(f.time_low, 32, 1, "time_low"),
        check_field(f.time_mid, 16, 2, "time_mid"),
        check_field(f.time_hi_version, 16, 3, "time_hi_version"),
        check_field(f.clock_seq_hi_variant, 8, 4, "clock_seq_hi_variant"),
        check_field(f.clock_seq_low, 8, 5, "clock_seq_low"),
        check_field(f.node, 48, 6, "node"),
    };
    for (const auto& failure : checks) {
        if (failure) return Result<Uuid, Error>::err(*failure);
    }

    const auto clock_seq = (f.clock_seq_hi_variant << 8) | f.clock_seq_low;
    auto value = Uint128{f.time_low} << 96;
    value |= Uint128{f.time_mid} << 80;
    value |= Uint128{f.time_hi_version} << 64;
    value |= Uint128{clock_seq} << 48;
    value |= Uint128{f.node};
    return Result<Uuid, Error>::ok(Uuid(value));
}

Result<Uuid, Error> Uuid::with_version(int version) const {
    if (version < 1 || version > 8) {
        return Result<Uuid, Error>::err(Error::validation(
            "illegal version number " + std::to_string(version) + " (expected 1..8)"));
    }
    return Result<Uuid, Error>::ok(Uuid(layout::pack(version, int_value())));
}

Uuid::Bytes Uuid::bytes_le() const noexcept {
    auto out = bytes_;
    std::reverse(out.begin(), out.begin() + 4);
    std::reverse(out.begin() + 4, out.begin() + 6);
    std::reverse(out.begin() + 6, out.begin() + 8);
    return out;
}

UuidFields Uuid::fields() const noexcept {
    return UuidFields{
        .time_low = time_low(),
        .time_mid = time_mid(),
        .time_hi_version = time_hi_version(),
        .clock_seq_hi_variant = clock_seq_hi_variant(),
        .clock_seq_low = clock_seq_low(),
        .node = node(),
    };
}

uint32_t Uuid::time_low() const noexcept {
    return static_cast<uint32_t>(int_value().bits(96, 32));
}

uint16_t Uuid::time_mid() const noexcept {
    return static_cast<uint16_t>(int_value().bits(80, 16));
}

uint16_t Uuid::time_hi_version() const noexcept {
    return static_cast<uint16_t>(int_value().bits(64, 16));
}

uint8_t Uuid::clock_seq_hi_variant() const noexcept {
    return bytes_[8];
}

uint8_t Uuid::clock_seq_low() const noexcept {
    return bytes_[9];
}

uint16_t Uuid::clock_seq() const noexcept {
    return static_cast<uint16_t>(((clock_seq_hi_variant() & 0x3F) << 8) | clock_seq_low());
}

uint64_t Uuid::node() const noexcept {
    return int_value().bits(0, 48);
}

std::optional<int> Uuid::version() const noexcept {
    const auto value = int_value();
    if (layout::unpack_variant(value) != Variant::Rfc4122) {
        return std::nullopt;
    }
    return layout::unpack_version(value);
}

uint64_t Uuid::time() const noexcept {
    const auto value = int_value();
    switch (version().value_or(0)) {
        case 6: return layout::unpack_v6(value).ticks;
        case 7: return layout::unpack_v7(value).unix_ms;
        default: return layout::unpack_v1(value).ticks;
    }
}

std::optional<Timestamp> Uuid::timestamp() const noexcept {
    switch (version().value_or(0)) {
        case 1:
        case 6: return Timestamp::from_gregorian_ticks(time());
        case 7: return Timestamp(static_cast<int64_t>(time()));
        default: return std::nullopt;
    }
}

std::string Uuid::hex() const {
    return int_value().to_hex();
}

std::string Uuid::to_string() const {
    const auto digits = hex();
    std::string out;
    out.reserve(36);
    out.append(digits, 0, 8).push_back('-');
    out.append(digits, 8, 4).push_back('-');
    out.append(digits, 12, 4).push_back('-');
    out.append(digits, 16, 4).push_back('-');
    out.append(digits, 20, 12);
    return out;
}

std::string Uuid::urn() const {
    return "urn:uuid:" + to_string();
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << uuid.to_string();
}

} // namespace chronoid
