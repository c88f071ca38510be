#include "schem/tag_reader.hpp"

#include <utility>

namespace schem::nbt {

const char* TagKindName(TagKind kind) {
    switch (kind) {
        case TagKind::kEnd: return "End";
        case TagKind::kByte: return "Byte";
        case TagKind::kShort: return "Short";
        case TagKind::kInt: return "Int";
        case TagKind::kLong: return "Long";
        case TagKind::kFloat: return "Float";
        case TagKind::kDouble: return "Double";
        case TagKind::kByteArray: return "ByteArray";
        case TagKind::kString: return "String";
        case TagKind::kList: return "List";
        case TagKind::kCompound: return "Compound";
    }
    return "Unknown";
}

TagReader::TagReader(util::ByteSpan data, size_t max_byte_array_length)
    : data_(data), max_byte_array_length_(max_byte_array_length) {}

util::Status TagReader::Require(size_t count, const char* what) const {
    if (Remaining() < count) {
        return util::Status::TruncatedInput("Unexpected end of tag stream reading " + std::string(what) +
                                            " at offset " + std::to_string(pos_) + ": need " +
                                            std::to_string(count) + " bytes, " +
                                            std::to_string(Remaining()) + " left");
    }
    return util::Status::Ok();
}

util::StatusOr<std::string> TagReader::ReadString() {
    SCHEM_ASSIGN_OR_RETURN(uint16_t len, ReadU16());
    SCHEM_RETURN_IF_ERROR(Require(len, "string"));
    std::string s(reinterpret_cast<const char*>(data_.data() + pos_), len);
    pos_ += len;
    return s;
}

util::StatusOr<util::byte_vec> TagReader::ReadByteArray() {
    SCHEM_ASSIGN_OR_RETURN(int32_t len, ReadI32());
    if (len < 0) {
        return util::Status::MalformedLength("Negative byte array length " + std::to_string(len) +
                                             " at offset " + std::to_string(pos_ - 4));
    }
    const size_t count = static_cast<size_t>(len);
    if (count > max_byte_array_length_) {
        return util::Status::MalformedLength("Byte array length " + std::to_string(count) +
                                             " exceeds limit of " + std::to_string(max_byte_array_length_));
    }
    SCHEM_RETURN_IF_ERROR(Require(count, "byte array"));
    util::byte_vec buffer(data_.begin() + pos_, data_.begin() + pos_ + count);
    pos_ += count;
    return buffer;
}

util::StatusOr<TagKind> TagReader::ReadTagKind() {
    SCHEM_ASSIGN_OR_RETURN(uint8_t raw, ReadBE<uint8_t>());
    if (raw > static_cast<uint8_t>(TagKind::kCompound)) {
        return util::Status::SchemaViolation("Unknown tag kind " + std::to_string(raw) +
                                             " at offset " + std::to_string(pos_ - 1));
    }
    return static_cast<TagKind>(raw);
}

util::StatusOr<TagHeader> TagReader::ReadTagHeader() {
    TagHeader header;
    SCHEM_ASSIGN_OR_RETURN(header.kind, ReadTagKind());
    if (header.kind == TagKind::kEnd) return header;
    SCHEM_ASSIGN_OR_RETURN(header.name, ReadString());
    return header;
}

}  // namespace schem::nbt
