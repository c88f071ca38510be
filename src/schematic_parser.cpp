#include "schem/schematic_parser.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <utility>

namespace schem {

namespace {

using nbt::TagKind;

// ====================================================================================
// Dispatch tables
// ====================================================================================

using FieldReader = util::Status (*)(SchematicParser& parser, SchematicData& data);

struct FieldRule {
    std::string_view name;
    TagKind kind;
    bool required;
    FieldReader read;
};

util::Status ReadDimension(nbt::TagReader& reader, int& out) {
    SCHEM_ASSIGN_OR_RETURN(int16_t value, reader.ReadI16());
    out = value;
    return util::Status::Ok();
}

util::Status ReadOffset(nbt::TagReader& reader, int32_t& out) {
    SCHEM_ASSIGN_OR_RETURN(out, reader.ReadI32());
    return util::Status::Ok();
}

const std::array<FieldRule, 10> kDocumentFields = {{
    {"Width", TagKind::kShort, true,
     [](SchematicParser& p, SchematicData& d) { return ReadDimension(p.reader(), d.width); }},
    {"Length", TagKind::kShort, true,
     [](SchematicParser& p, SchematicData& d) { return ReadDimension(p.reader(), d.length); }},
    {"Height", TagKind::kShort, true,
     [](SchematicParser& p, SchematicData& d) { return ReadDimension(p.reader(), d.height); }},
    {"Materials", TagKind::kString, true,
     [](SchematicParser& p, SchematicData& d) -> util::Status {
         SCHEM_ASSIGN_OR_RETURN(d.materials, p.reader().ReadString());
         return util::Status::Ok();
     }},
    {"Blocks", TagKind::kByteArray, true,
     [](SchematicParser& p, SchematicData& d) -> util::Status {
         SCHEM_ASSIGN_OR_RETURN(d.blocks, p.reader().ReadByteArray());
         return util::Status::Ok();
     }},
    {"Data", TagKind::kByteArray, false,
     [](SchematicParser& p, SchematicData& d) -> util::Status {
         SCHEM_ASSIGN_OR_RETURN(d.data, p.reader().ReadByteArray());
         return util::Status::Ok();
     }},
    {"WEOffsetX", TagKind::kInt, false,
     [](SchematicParser& p, SchematicData& d) { return ReadOffset(p.reader(), d.offset_x); }},
    {"WEOffsetY", TagKind::kInt, false,
     [](SchematicParser& p, SchematicData& d) { return ReadOffset(p.reader(), d.offset_y); }},
    {"WEOffsetZ", TagKind::kInt, false,
     [](SchematicParser& p, SchematicData& d) { return ReadOffset(p.reader(), d.offset_z); }},
    {"Entities", TagKind::kList, false,
     [](SchematicParser& p, SchematicData& d) -> util::Status {
         SCHEM_ASSIGN_OR_RETURN(d.entities, p.ParseEntityList());
         return util::Status::Ok();
     }},
}};

using EntityFieldReader = util::Status (*)(nbt::TagReader& reader, Entity& entity);

struct EntityFieldRule {
    std::string_view name;
    TagKind kind;
    EntityFieldReader read;
};

// No entity members are decoded yet: every named member is an unknown field.
const std::array<EntityFieldRule, 0> kEntityFields = {};

std::string Quoted(const std::string& name) {
    return "'" + name + "'";
}

util::Status KindMismatch(const std::string& name, TagKind want, TagKind got) {
    return util::Status::SchemaViolation("Field " + Quoted(name) + " must be " + nbt::TagKindName(want) +
                                         ", got " + nbt::TagKindName(got));
}

}  // namespace

// ====================================================================================
// Document
// ====================================================================================

util::StatusOr<Schematic> SchematicParser::ParseDocument() {
    if (state_ != State::kExpectRoot) {
        return util::Status::SchemaViolation("Parser is not positioned at a document root");
    }
    util::StatusOr<Schematic> result = ParseDocumentBody();
    state_ = result.ok() ? State::kDone : State::kFailed;
    return result;
}

util::StatusOr<Schematic> SchematicParser::ParseDocumentBody() {
    SCHEM_ASSIGN_OR_RETURN(nbt::TagHeader root, reader_.ReadTagHeader());
    if (root.kind != TagKind::kCompound) {
        return util::Status::SchemaViolation(std::string("Top level tag must be Compound, got ") +
                                             nbt::TagKindName(root.kind));
    }
    if (*root.name != kRootTagName) {
        return util::Status::SchemaViolation("Unexpected root tag name " + Quoted(*root.name) +
                                             ", want 'Schematic'");
    }

    state_ = State::kReadingFields;
    SchematicData data;
    uint32_t seen = 0;
    while (true) {
        SCHEM_ASSIGN_OR_RETURN(nbt::TagHeader header, reader_.ReadTagHeader());
        if (header.kind == TagKind::kEnd) break;
        const std::string& name = *header.name;
        auto rule = std::find_if(kDocumentFields.begin(), kDocumentFields.end(),
                                 [&name](const FieldRule& r) { return r.name == name; });
        if (rule == kDocumentFields.end()) {
            return util::Status::SchemaViolation("Unknown field " + Quoted(name) + " of kind " +
                                                 nbt::TagKindName(header.kind));
        }
        if (header.kind != rule->kind) return KindMismatch(name, rule->kind, header.kind);
        const uint32_t bit = 1u << (rule - kDocumentFields.begin());
        if (seen & bit) return util::Status::SchemaViolation("Duplicate field " + Quoted(name));
        seen |= bit;
        SCHEM_RETURN_IF_ERROR(rule->read(*this, data));
    }

    state_ = State::kCheckingVariant;
    for (size_t i = 0; i < kDocumentFields.size(); ++i) {
        if (kDocumentFields[i].required && !(seen & (1u << i))) {
            return util::Status::SchemaViolation("Missing required field " +
                                                 Quoted(std::string(kDocumentFields[i].name)));
        }
    }
    if (data.materials != kSupportedMaterials) {
        return util::Status::SchemaViolation("Materials must have 'Alpha' value, got " + Quoted(data.materials));
    }
    return Schematic::Create(std::move(data));
}

// ====================================================================================
// Entities
// ====================================================================================

util::StatusOr<std::vector<Entity>> SchematicParser::ParseEntityList() {
    std::vector<Entity> entities;
    while (true) {
        SCHEM_ASSIGN_OR_RETURN(TagKind kind, reader_.ReadTagKind());
        if (kind == TagKind::kEnd) break;
        if (kind != TagKind::kCompound) {
            return util::Status::SchemaViolation("Entity " + std::to_string(entities.size()) +
                                                 " must be Compound, got " + nbt::TagKindName(kind));
        }
        SCHEM_ASSIGN_OR_RETURN(Entity entity, ParseEntity());
        entities.push_back(std::move(entity));
    }
    return entities;
}

util::StatusOr<Entity> SchematicParser::ParseEntity() {
    Entity entity;
    while (true) {
        SCHEM_ASSIGN_OR_RETURN(nbt::TagHeader header, reader_.ReadTagHeader());
        if (header.kind == TagKind::kEnd) break;
        const std::string& name = *header.name;
        auto rule = std::find_if(kEntityFields.begin(), kEntityFields.end(),
                                 [&name](const EntityFieldRule& r) { return r.name == name; });
        if (rule == kEntityFields.end()) {
            return util::Status::SchemaViolation("Unknown entity field " + Quoted(name) + " of kind " +
                                                 nbt::TagKindName(header.kind));
        }
        if (header.kind != rule->kind) return KindMismatch(name, rule->kind, header.kind);
        SCHEM_RETURN_IF_ERROR(rule->read(reader_, entity));
    }
    return entity;
}

}  // namespace schem
