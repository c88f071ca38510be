// ====================================================================================
// schem - Transport: compression envelope around the tag stream
//
// Schematic files ship gzip-compressed. zstd-wrapped and raw tag streams are
// accepted as well. Decompression is eager: the whole tag stream is materialized
// before the tag reader sees a byte.
// ====================================================================================

#ifndef SCHEM_TRANSPORT_H_
#define SCHEM_TRANSPORT_H_

#include <cstdint>
#include <optional>
#include <string_view>

#include "schem/config.hpp"
#include "schem/util.hpp"

namespace schem::transport {

constexpr uint8_t kGzipMagic[] = {0x1F, 0x8B};
constexpr uint8_t kZstdMagic[] = {0x28, 0xB5, 0x2F, 0xFD};

const char* EnvelopeName(Envelope envelope);
std::optional<Envelope> ParseEnvelope(std::string_view text);

// Never returns kAuto.
util::StatusOr<Envelope> DetectEnvelope(util::ByteSpan input);

// Resolves kAuto through DetectEnvelope, then unwraps.
util::StatusOr<util::byte_vec> Decompress(util::ByteSpan input, Envelope envelope,
                                          size_t max_size = Limits::kMaxDecompressedSize);

util::StatusOr<util::byte_vec> InflateGzip(util::ByteSpan input, size_t max_size);
util::StatusOr<util::byte_vec> DecompressZstd(util::ByteSpan input, size_t max_size);

}  // namespace schem::transport

#endif  // SCHEM_TRANSPORT_H_
