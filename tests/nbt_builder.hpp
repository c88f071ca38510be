// Test-only helpers: assemble tag streams by hand and wrap them in gzip / zstd.

#ifndef SCHEM_TESTS_NBT_BUILDER_H_
#define SCHEM_TESTS_NBT_BUILDER_H_

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>
#include <zstd.h>

#include "schem/tag_reader.hpp"
#include "schem/util.hpp"

namespace schem::testing {

using schem::nbt::TagKind;
using schem::util::byte_vec;

class NbtBuilder {
public:
    NbtBuilder& Kind(TagKind kind) { return U8(static_cast<uint8_t>(kind)); }
    NbtBuilder& Header(TagKind kind, const std::string& name) { return Kind(kind).Str(name); }
    NbtBuilder& End() { return Kind(TagKind::kEnd); }

    NbtBuilder& U8(uint8_t v) { bytes_.push_back(v); return *this; }
    NbtBuilder& I16(int16_t v) { return BE(static_cast<uint16_t>(v), 2); }
    NbtBuilder& I32(int32_t v) { return BE(static_cast<uint32_t>(v), 4); }
    NbtBuilder& Str(const std::string& s) {
        BE(static_cast<uint16_t>(s.size()), 2);
        bytes_.insert(bytes_.end(), s.begin(), s.end());
        return *this;
    }
    NbtBuilder& Bytes(const byte_vec& data) {
        I32(static_cast<int32_t>(data.size()));
        return Raw(data);
    }
    NbtBuilder& Raw(const byte_vec& data) {
        bytes_.insert(bytes_.end(), data.begin(), data.end());
        return *this;
    }

    // Named members.
    NbtBuilder& Short(const std::string& name, int16_t v) { return Header(TagKind::kShort, name).I16(v); }
    NbtBuilder& Int(const std::string& name, int32_t v) { return Header(TagKind::kInt, name).I32(v); }
    NbtBuilder& String(const std::string& name, const std::string& v) { return Header(TagKind::kString, name).Str(v); }
    NbtBuilder& ByteArray(const std::string& name, const byte_vec& v) { return Header(TagKind::kByteArray, name).Bytes(v); }
    NbtBuilder& Compound(const std::string& name) { return Header(TagKind::kCompound, name); }

    const byte_vec& bytes() const { return bytes_; }

private:
    NbtBuilder& BE(uint32_t v, int width) {
        for (int i = width - 1; i >= 0; --i) bytes_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        return *this;
    }

    byte_vec bytes_;
};

// Describes a document; Build() emits it in member order.
struct SchematicFixture {
    std::string root_name = "Schematic";
    int16_t width = 2;
    int16_t length = 3;
    int16_t height = 4;
    std::string materials = "Alpha";
    byte_vec blocks = byte_vec(2 * 3 * 4, 0);
    bool with_data = false;
    byte_vec data;
    bool with_offsets = true;
    int32_t offset_x = -5;
    int32_t offset_y = 0;
    int32_t offset_z = 70000;
    bool with_entities = false;
    int empty_entities = 0;

    static size_t Index(int x, int y, int z, int width, int length) {
        return static_cast<size_t>(y) * width * length + static_cast<size_t>(z) * width + x;
    }
    size_t Index(int x, int y, int z) const { return Index(x, y, z, width, length); }

    byte_vec Build() const {
        NbtBuilder b;
        b.Compound(root_name);
        b.Short("Width", width).Short("Length", length).Short("Height", height);
        b.String("Materials", materials);
        if (with_offsets) b.Int("WEOffsetX", offset_x).Int("WEOffsetY", offset_y).Int("WEOffsetZ", offset_z);
        b.ByteArray("Blocks", blocks);
        if (with_data) b.ByteArray("Data", data);
        if (with_entities) {
            b.Header(TagKind::kList, "Entities");
            for (int i = 0; i < empty_entities; ++i) b.Kind(TagKind::kCompound).End();
            b.End();
        }
        b.End();
        return b.bytes();
    }
};

inline byte_vec GzipCompress(const byte_vec& input) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_BEST_SPEED, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    byte_vec out(deflateBound(&strm, static_cast<uLong>(input.size())) + 32);
    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) throw std::runtime_error("gzip deflate failed");
    out.resize(strm.total_out);
    return out;
}

inline byte_vec ZstdCompress(const byte_vec& input) {
    byte_vec out(ZSTD_compressBound(input.size()));
    size_t compressed_size = ZSTD_compress(out.data(), out.size(), input.data(), input.size(), 1);
    if (ZSTD_isError(compressed_size)) throw std::runtime_error("ZSTD compression failed");
    out.resize(compressed_size);
    return out;
}

}  // namespace schem::testing

#endif  // SCHEM_TESTS_NBT_BUILDER_H_
