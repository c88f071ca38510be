// ====================================================================================
// schem - Named binary tag reader
//
// A forward-only cursor over a fully decompressed tag stream. Decodes the
// big-endian primitives and the tag framing (kind byte, optional name) that the
// schematic parser drives tag by tag. It has no knowledge of the schema.
// ====================================================================================

#ifndef SCHEM_TAG_READER_H_
#define SCHEM_TAG_READER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

#include "schem/config.hpp"
#include "schem/util.hpp"

namespace schem::nbt {

enum class TagKind : uint8_t {
    kEnd = 0,
    kByte = 1,
    kShort = 2,
    kInt = 3,
    kLong = 4,
    kFloat = 5,
    kDouble = 6,
    kByteArray = 7,
    kString = 8,
    kList = 9,
    kCompound = 10,
};

const char* TagKindName(TagKind kind);

/// @brief A tag header as read from the stream. End carries no name.
struct TagHeader {
    TagKind kind = TagKind::kEnd;
    std::optional<std::string> name;
};

class TagReader {
public:
    explicit TagReader(util::ByteSpan data, size_t max_byte_array_length = Limits::kMaxByteArrayLength);

    // Reads sizeof(T) bytes as a big-endian, two's-complement value.
    template <typename T>
    util::StatusOr<T> ReadBE();

    util::StatusOr<uint16_t> ReadU16() { return ReadBE<uint16_t>(); }
    util::StatusOr<int16_t> ReadI16() { return ReadBE<int16_t>(); }
    util::StatusOr<int32_t> ReadI32() { return ReadBE<int32_t>(); }

    // u16 length followed by that many raw bytes.
    util::StatusOr<std::string> ReadString();
    // i32 length followed by that many raw bytes.
    util::StatusOr<util::byte_vec> ReadByteArray();

    util::StatusOr<TagKind> ReadTagKind();
    util::StatusOr<TagHeader> ReadTagHeader();

    size_t Tell() const { return pos_; }
    size_t Remaining() const { return data_.size() - pos_; }

private:
    util::Status Require(size_t count, const char* what) const;

    util::ByteSpan data_;
    size_t pos_ = 0;
    size_t max_byte_array_length_;
};

template <typename T>
util::StatusOr<T> TagReader::ReadBE() {
    static_assert(std::is_integral_v<T>, "ReadBE requires an integral type");
    SCHEM_RETURN_IF_ERROR(Require(sizeof(T), "integer"));
    using U = std::make_unsigned_t<T>;
    U value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<U>((value << 8) | data_[pos_ + i]);
    }
    pos_ += sizeof(T);
    return static_cast<T>(value);
}

}  // namespace schem::nbt

#endif  // SCHEM_TAG_READER_H_
