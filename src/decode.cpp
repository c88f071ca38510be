#include "schem/schem.hpp"

#include <fstream>
#include <iterator>
#include <string>

#include "schem/logging.hpp"

namespace schem {

util::StatusOr<Schematic> ParseSchematic(util::ByteSpan tag_stream, const DecodeOptions& options) {
    nbt::TagReader reader(tag_stream, options.max_byte_array_length);
    SchematicParser parser(reader);
    util::StatusOr<Schematic> result = parser.ParseDocument();
    if (!result.ok()) {
        SCHEM_LOG_DEBUG("Decode", "Rejected at offset " + std::to_string(reader.Tell()) + ": " +
                                      result.status().ToString());
        return result;
    }
    if (reader.Remaining() > 0) {
        SCHEM_LOG_DEBUG("Decode", "Ignoring " + std::to_string(reader.Remaining()) +
                                      " bytes after the root compound");
    }
    const Schematic& schematic = result.value();
    SCHEM_LOG_DEBUG("Decode", "Decoded " + std::to_string(schematic.DimensionX()) + "x" +
                                  std::to_string(schematic.DimensionY()) + "x" +
                                  std::to_string(schematic.DimensionZ()) + " schematic, " +
                                  std::to_string(schematic.entities().size()) + " entities");
    return result;
}

util::StatusOr<Schematic> Decode(util::ByteSpan input, const DecodeOptions& options) {
    SCHEM_ASSIGN_OR_RETURN(util::byte_vec tag_stream,
                           transport::Decompress(input, options.envelope, options.max_decompressed_size));
    return ParseSchematic(tag_stream, options);
}

util::StatusOr<Schematic> Decode(std::istream& input, const DecodeOptions& options) {
    util::byte_vec bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) return util::Status::TransportError("Read error on input stream");
    return Decode(util::ByteSpan(bytes), options);
}

util::StatusOr<Schematic> DecodeFile(const std::filesystem::path& path, const DecodeOptions& options) {
    std::ifstream fs(path, std::ios::binary);
    if (!fs.is_open()) return util::Status::TransportError("Cannot open file: " + path.string());
    SCHEM_LOG_DEBUG("Decode", "Reading " + path.string());
    return Decode(fs, options);
}

}  // namespace schem
