// ====================================================================================
// schem - Schematic: the decoded volumetric map
//
// Cells are addressed by (x, y, z) with x in [0, width), y in [0, height) and
// z in [0, length). Buffers are flattened with x fastest, then z, then y:
//
//     index = y * (width * length) + z * width + x
//
// A Schematic is immutable once created and safe for concurrent readers.
// ====================================================================================

#ifndef SCHEM_SCHEMATIC_H_
#define SCHEM_SCHEMATIC_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "schem/util.hpp"

namespace schem {

/// @brief The only schema variant ("Materials" value) the decoder accepts.
constexpr std::string_view kSupportedMaterials = "Alpha";

/// @brief One member of the entity list. No entity fields are decoded yet, so
/// the identifier stays empty.
struct Entity {
    std::string id;
};

/// @brief Field values as collected by the parser, before validation.
struct SchematicData {
    int width = 0;
    int length = 0;
    int height = 0;
    int32_t offset_x = 0;
    int32_t offset_y = 0;
    int32_t offset_z = 0;
    std::string materials;
    util::byte_vec blocks;
    std::optional<util::byte_vec> data;  // high-order material bits
    std::vector<Entity> entities;
};

class Schematic {
public:
    // Rejects negative dimensions and buffers whose length is not
    // width * length * height.
    static util::StatusOr<Schematic> Create(SchematicData data);

    int DimensionX() const { return data_.width; }
    int DimensionY() const { return data_.height; }
    int DimensionZ() const { return data_.length; }

    int32_t OffsetX() const { return data_.offset_x; }
    int32_t OffsetY() const { return data_.offset_y; }
    int32_t OffsetZ() const { return data_.offset_z; }

    const std::string& materials() const { return data_.materials; }
    const util::byte_vec& blocks() const { return data_.blocks; }
    bool HasExtension() const { return data_.data.has_value(); }
    const std::optional<util::byte_vec>& extension() const { return data_.data; }
    const std::vector<Entity>& entities() const { return data_.entities; }

    size_t CellCount() const;
    bool Contains(int x, int y, int z) const;

    // 0 for coordinates outside the volume.
    uint16_t MaterialAt(int x, int y, int z) const;
    bool IsFilled(int x, int y, int z) const { return MaterialAt(x, y, z) != 0; }

private:
    explicit Schematic(SchematicData data) : data_(std::move(data)) {}
    size_t IndexOf(int x, int y, int z) const;

    SchematicData data_;
};

}  // namespace schem

#endif  // SCHEM_SCHEMATIC_H_
