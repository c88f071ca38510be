// ====================================================================================
// schem - Decode configuration
// ====================================================================================

#ifndef SCHEM_CONFIG_H_
#define SCHEM_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace schem {

/// @brief Hard resource limits applied while decoding untrusted input.
namespace Limits {
    constexpr size_t kMaxByteArrayLength  = 1024 * 1024 * 256; // 256 MB
    constexpr size_t kMaxDecompressedSize = 1024 * 1024 * 512; // 512 MB
}

/// @brief Compression wrapped around the tag stream.
enum class Envelope : uint8_t {
    kAuto = 0,  // detect from the leading magic bytes
    kGzip = 1,
    kZstd = 2,
    kNone = 3,  // bytes are the raw tag stream
};

struct DecodeOptions {
    Envelope envelope = Envelope::kAuto;
    size_t max_decompressed_size = Limits::kMaxDecompressedSize;
    size_t max_byte_array_length = Limits::kMaxByteArrayLength;
};

}  // namespace schem

#endif  // SCHEM_CONFIG_H_
