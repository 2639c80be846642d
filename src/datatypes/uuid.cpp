#include "datatypes/uuid.hpp"

#include <QByteArray>
#include <QCryptographicHash>

#include <cstring>
#include <random>
#include <type_traits>

namespace oscal {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

constexpr bool is_hyphen_position(size_t i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Error uuid_error(std::string_view text, std::string reason) {
    return Error(ErrorKind::Uuid, std::string(UuidDatatype::kName), std::move(reason)).with_input(text);
}

constexpr Uuid::Bytes namespace_bytes(uint8_t first) {
    // 6ba7b81x-9dad-11d1-80b4-00c04fd430c8
    return Uuid::Bytes{0x6b, 0xa7, 0xb8, first, 0x9d, 0xad, 0x11, 0xd1,
                       0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};
}

} // namespace

const Uuid Uuid::kNamespaceDns{namespace_bytes(0x10)};
const Uuid Uuid::kNamespaceUrl{namespace_bytes(0x11)};
const Uuid Uuid::kNamespaceOid{namespace_bytes(0x12)};
const Uuid Uuid::kNamespaceX500{namespace_bytes(0x14)};

Uuid Uuid::generate_v4() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    const uint64_t halves[2] = {dist(gen), dist(gen)};
    Bytes bytes;
    std::memcpy(bytes.data(), halves, BYTE_SIZE);

    // Set version 4 (random)
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant (RFC 4122)
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

Uuid Uuid::generate_v5(const Uuid& name_space, std::string_view name) {
    QCryptographicHash sha1(QCryptographicHash::Sha1);
    sha1.addData(QByteArrayView(reinterpret_cast<const char*>(name_space.bytes().data()),
                                static_cast<qsizetype>(BYTE_SIZE)));
    sha1.addData(QByteArrayView(name.data(), static_cast<qsizetype>(name.size())));
    const QByteArray digest = sha1.result();

    Bytes bytes;
    std::memcpy(bytes.data(), digest.constData(), BYTE_SIZE);

    // Set version 5 (name-based, SHA-1)
    bytes[6] = (bytes[6] & 0x0F) | 0x50;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

Result<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != TEXT_SIZE) {
        return Result<Uuid>::err(uuid_error(
            text, "expected " + std::to_string(TEXT_SIZE) + " characters, got " + std::to_string(text.size())));
    }

    Bytes bytes{};
    size_t nibble = 0;
    for (size_t i = 0; i < TEXT_SIZE; ++i) {
        const char c = text[i];
        if (is_hyphen_position(i)) {
            if (c != '-') {
                return Result<Uuid>::err(uuid_error(text, "expected '-' at position " + std::to_string(i)));
            }
            continue;
        }
        const int v = hex_value(c);
        if (v < 0) {
            return Result<Uuid>::err(uuid_error(
                text, std::string("invalid hex digit '") + c + "' at position " + std::to_string(i)));
        }
        bytes[nibble / 2] = static_cast<uint8_t>(bytes[nibble / 2] | (nibble % 2 == 0 ? v << 4 : v));
        ++nibble;
    }

    return Result<Uuid>::ok(Uuid(bytes));
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(TEXT_SIZE);
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHexDigits[bytes_[i] >> 4]);
        out.push_back(kHexDigits[bytes_[i] & 0x0F]);
    }
    return out;
}

const DatatypeInfo& UuidDatatype::info() {
    static const DatatypeInfo kInfo{
        .name = kName,
        .description = "A type 4 ('random' or 'pseudorandom') or type 5 UUID per RFC 4122.",
        .pattern = R"(^[0-9A-Fa-f]{8}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{12}$)",
        .min_length = Uuid::TEXT_SIZE,
        .max_length = Uuid::TEXT_SIZE,
        .cpp_type = "oscal::UuidDatatype",
    };
    return kInfo;
}

Result<UuidDatatype> UuidDatatype::parse(std::string_view text, const ParseOptions&) {
    return Uuid::parse(text).map([](const Uuid& value) { return UuidDatatype(value); });
}

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");

} // namespace oscal
