// ====================================================================================
// schem - Schematic schema parser
//
// Drives a TagReader through one "Schematic" document:
//
//   kExpectRoot -> kReadingFields -> kCheckingVariant -> kDone
//
// Any read or validation error moves the parser to kFailed; a parser is single
// use. Member names are dispatched through static tables (see
// schematic_parser.cpp). Unknown names are rejected rather than skipped.
// ====================================================================================

#ifndef SCHEM_SCHEMATIC_PARSER_H_
#define SCHEM_SCHEMATIC_PARSER_H_

#include <string_view>
#include <vector>

#include "schem/schematic.hpp"
#include "schem/tag_reader.hpp"
#include "schem/util.hpp"

namespace schem {

/// @brief Name of the root compound.
constexpr std::string_view kRootTagName = "Schematic";

class SchematicParser {
public:
    enum class State { kExpectRoot, kReadingFields, kCheckingVariant, kDone, kFailed };

    explicit SchematicParser(nbt::TagReader& reader) : reader_(reader) {}

    util::StatusOr<Schematic> ParseDocument();

    // The entity list payload: kind bytes, each followed by a compound body,
    // closed by an End kind.
    util::StatusOr<std::vector<Entity>> ParseEntityList();
    util::StatusOr<Entity> ParseEntity();

    nbt::TagReader& reader() { return reader_; }
    State state() const { return state_; }

private:
    util::StatusOr<Schematic> ParseDocumentBody();

    nbt::TagReader& reader_;
    State state_ = State::kExpectRoot;
};

}  // namespace schem

#endif  // SCHEM_SCHEMATIC_PARSER_H_
