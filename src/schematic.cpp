#include "schem/schematic.hpp"

#include <utility>

namespace schem {

util::StatusOr<Schematic> Schematic::Create(SchematicData data) {
    if (data.width < 0 || data.length < 0 || data.height < 0) {
        return util::Status::SchemaViolation("Negative dimensions: Width=" + std::to_string(data.width) +
                                             " Length=" + std::to_string(data.length) +
                                             " Height=" + std::to_string(data.height));
    }
    const size_t cells = static_cast<size_t>(data.width) * static_cast<size_t>(data.length) *
                         static_cast<size_t>(data.height);
    if (data.blocks.size() != cells) {
        return util::Status::SchemaViolation("Blocks holds " + std::to_string(data.blocks.size()) +
                                             " bytes, dimensions require " + std::to_string(cells));
    }
    if (data.data && data.data->size() != cells) {
        return util::Status::SchemaViolation("Data holds " + std::to_string(data.data->size()) +
                                             " bytes, dimensions require " + std::to_string(cells));
    }
    return Schematic(std::move(data));
}

size_t Schematic::CellCount() const {
    return data_.blocks.size();
}

bool Schematic::Contains(int x, int y, int z) const {
    return x >= 0 && y >= 0 && z >= 0 && x < DimensionX() && y < DimensionY() && z < DimensionZ();
}

size_t Schematic::IndexOf(int x, int y, int z) const {
    const size_t width = static_cast<size_t>(data_.width);
    const size_t length = static_cast<size_t>(data_.length);
    return static_cast<size_t>(y) * width * length + static_cast<size_t>(z) * width + static_cast<size_t>(x);
}

uint16_t Schematic::MaterialAt(int x, int y, int z) const {
    if (!Contains(x, y, z)) return 0;
    const size_t index = IndexOf(x, y, z);
    uint16_t material = data_.blocks[index];
    if (data_.data) material = static_cast<uint16_t>(material | ((*data_.data)[index] << 8));
    return material;
}

}  // namespace schem
