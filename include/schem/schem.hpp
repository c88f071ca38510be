// ====================================================================================
// schem - Schematic file decoder
//
// Reads gzip-compressed "Schematic" documents (named binary tag format) into an
// immutable volumetric map of material codes:
//
//   bytes -> transport (gzip / zstd / raw) -> nbt::TagReader -> SchematicParser -> Schematic
//
// Decoding is all-or-nothing: the caller receives either a fully validated
// Schematic or the first error encountered.
// ====================================================================================

#ifndef SCHEM_SCHEM_H_
#define SCHEM_SCHEM_H_

#include <filesystem>
#include <istream>

#include "schem/config.hpp"
#include "schem/schematic.hpp"
#include "schem/schematic_parser.hpp"
#include "schem/tag_reader.hpp"
#include "schem/transport.hpp"
#include "schem/util.hpp"

namespace schem {

// Unwraps the compression envelope, then parses the tag stream.
util::StatusOr<Schematic> Decode(util::ByteSpan input, const DecodeOptions& options = {});

// Reads the stream to completion before decoding.
util::StatusOr<Schematic> Decode(std::istream& input, const DecodeOptions& options = {});

util::StatusOr<Schematic> DecodeFile(const std::filesystem::path& path, const DecodeOptions& options = {});

// Parses an already decompressed tag stream; options.envelope is ignored.
util::StatusOr<Schematic> ParseSchematic(util::ByteSpan tag_stream, const DecodeOptions& options = {});

}  // namespace schem

#endif  // SCHEM_SCHEM_H_
