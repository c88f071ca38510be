// ====================================================================================
// SCHEMATIC INSPECTOR (schem-inspect)
//
// A command-line tool to decode a .schematic file and display its dimensions,
// placement offsets, entity list and material usage. Individual cells can be
// probed with --probe.
// ====================================================================================

#include <cstdlib> // For EXIT_SUCCESS, EXIT_FAILURE
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "schem/logging.hpp"
#include "schem/schem.hpp"

using namespace schem;

namespace {

constexpr int kExitUsage = 2;

struct Probe { int x; int y; int z; };

struct InspectorConfig {
    std::filesystem::path file_path;
    DecodeOptions decode;
    logging::LoggingConfig logging;
    std::vector<Probe> probes;
};

// --- Forward Declarations for Printing ---
void PrintUsage();
void PrintHeader(const std::string& title);
void PrintSummary(const std::filesystem::path& path, const Schematic& schematic);
void PrintEntities(const Schematic& schematic);
void PrintMaterials(const Schematic& schematic);
void PrintProbes(const Schematic& schematic, const std::vector<Probe>& probes);

bool ParseProbe(const std::string& text, Probe& probe) {
    std::istringstream in(text);
    char sep1 = 0, sep2 = 0;
    if (!(in >> probe.x >> sep1 >> probe.y >> sep2 >> probe.z)) return false;
    if (sep1 != ',' || sep2 != ',') return false;
    return in.peek() == std::char_traits<char>::eof();
}

// Returns false (after printing why) on malformed arguments.
bool ParseArguments(int argc, char* argv[], InspectorConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value." << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string value;
        if (arg == "--envelope") {
            if (!next_value(value)) return false;
            auto envelope = transport::ParseEnvelope(value);
            if (!envelope) {
                std::cerr << "Error: unknown envelope '" << value << "'." << std::endl;
                return false;
            }
            config.decode.envelope = *envelope;
        } else if (arg == "--probe") {
            if (!next_value(value)) return false;
            Probe probe{};
            if (!ParseProbe(value, probe)) {
                std::cerr << "Error: --probe expects X,Y,Z, got '" << value << "'." << std::endl;
                return false;
            }
            config.probes.push_back(probe);
        } else if (arg == "--log-level") {
            if (!next_value(value)) return false;
            auto level = logging::ParseLogLevel(value);
            if (!level) {
                std::cerr << "Error: unknown log level '" << value << "'." << std::endl;
                return false;
            }
            config.logging.level = *level;
        } else if (arg == "--log-file") {
            if (!next_value(config.logging.log_file)) return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return false;
        } else if (config.file_path.empty()) {
            config.file_path = arg;
        } else {
            std::cerr << "Error: only one input file may be given." << std::endl;
            return false;
        }
    }
    if (config.file_path.empty()) {
        std::cerr << "Error: no input file given." << std::endl;
        return false;
    }
    return true;
}

} // namespace

// --- Main Application Logic ---

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return EXIT_SUCCESS;
        }
    }

    InspectorConfig config;
    if (!ParseArguments(argc, argv, config)) {
        PrintUsage();
        return kExitUsage;
    }
    logging::Logger::instance().configure(config.logging);

    if (!std::filesystem::exists(config.file_path)) {
        std::cerr << "Error: File not found: " << config.file_path << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "=========================================" << std::endl;
    std::cout << " SCHEMATIC INSPECTOR" << std::endl;
    std::cout << "=========================================" << std::endl;

    SCHEM_LOG_INFO("Inspector", "Decoding " + config.file_path.string() + " (envelope: " +
                                    transport::EnvelopeName(config.decode.envelope) + ")");
    auto schematic_or = DecodeFile(config.file_path, config.decode);
    if (!schematic_or.ok()) {
        SCHEM_LOG_ERROR("Inspector", schematic_or.status().ToString());
        std::cerr << "\n[ERROR] Failed to decode file: " << schematic_or.status().ToString() << std::endl;
        return EXIT_FAILURE;
    }

    const Schematic& schematic = schematic_or.value();
    PrintSummary(config.file_path, schematic);
    PrintEntities(schematic);
    PrintMaterials(schematic);
    PrintProbes(schematic, config.probes);

    std::cout << "\n--- Inspection Complete ---" << std::endl;
    return EXIT_SUCCESS;
}

// --- Implementation of Printing Functions ---

namespace {

void PrintUsage() {
    std::cout << "Schematic Inspector (schem-inspect)" << std::endl;
    std::cout << "Decodes a .schematic file and displays its contents." << std::endl;
    std::cout << "\nUSAGE:" << std::endl;
    std::cout << "  schem-inspect [options] <path_to_file.schematic>" << std::endl;
    std::cout << "\nOPTIONS:" << std::endl;
    std::cout << "  --envelope <auto|gzip|zstd|none>   Compression around the tag stream (default: auto)." << std::endl;
    std::cout << "  --probe <X,Y,Z>                    Print the material at a cell. Repeatable." << std::endl;
    std::cout << "  --log-level <trace|debug|info|warn|error>" << std::endl;
    std::cout << "  --log-file <path>                  Append log lines to a file." << std::endl;
    std::cout << "  -h, --help                         Show this help message." << std::endl;
}

void PrintHeader(const std::string& title) {
    const size_t width = title.length() < 40 ? 40 - title.length() : 4;
    std::cout << "\n--- " << title << " " << std::string(width, '-') << std::endl;
}

void PrintSummary(const std::filesystem::path& path, const Schematic& schematic) {
    PrintHeader("File Summary");
    std::cout << std::left;
    std::cout << "  " << std::setw(20) << "File Path:" << path << std::endl;
    std::cout << "  " << std::setw(20) << "File Size:" << std::filesystem::file_size(path) << " bytes" << std::endl;
    std::cout << "  " << std::setw(20) << "Materials:" << schematic.materials() << std::endl;
    std::cout << "  " << std::setw(20) << "Dimensions:" << schematic.DimensionX() << " x "
              << schematic.DimensionY() << " x " << schematic.DimensionZ() << " (X x Y x Z)" << std::endl;
    std::cout << "  " << std::setw(20) << "Cells:" << schematic.CellCount() << std::endl;
    std::cout << "  " << std::setw(20) << "Offset:" << schematic.OffsetX() << ", "
              << schematic.OffsetY() << ", " << schematic.OffsetZ() << std::endl;
    std::cout << "  " << std::setw(20) << "High bits (Data):" << (schematic.HasExtension() ? "present" : "absent")
              << std::endl;
}

void PrintEntities(const Schematic& schematic) {
    PrintHeader("Entities (" + std::to_string(schematic.entities().size()) + ")");
    if (schematic.entities().empty()) {
        std::cout << "  (No entities)" << std::endl;
        return;
    }
    for (size_t i = 0; i < schematic.entities().size(); ++i) {
        const Entity& entity = schematic.entities()[i];
        std::cout << "  [" << i << "] " << (entity.id.empty() ? "(no id)" : entity.id) << std::endl;
    }
}

void PrintMaterials(const Schematic& schematic) {
    std::map<uint16_t, uint64_t> counts;
    uint64_t filled = 0;
    for (int y = 0; y < schematic.DimensionY(); ++y) {
        for (int z = 0; z < schematic.DimensionZ(); ++z) {
            for (int x = 0; x < schematic.DimensionX(); ++x) {
                uint16_t material = schematic.MaterialAt(x, y, z);
                if (material == 0) continue;
                ++filled;
                ++counts[material];
            }
        }
    }
    PrintHeader("Materials (" + std::to_string(counts.size()) + " distinct)");
    std::cout << "  " << std::setw(20) << "Filled cells:" << filled << " of " << schematic.CellCount() << std::endl;
    if (counts.empty()) return;
    std::cout << "  " << std::setw(12) << "Code" << "Cells" << std::endl;
    std::cout << "  " << std::string(40, '-') << std::endl;
    for (const auto& [code, count] : counts) {
        std::cout << "  " << std::setw(12) << code << count << std::endl;
    }
}

void PrintProbes(const Schematic& schematic, const std::vector<Probe>& probes) {
    if (probes.empty()) return;
    PrintHeader("Probes (" + std::to_string(probes.size()) + ")");
    for (const auto& probe : probes) {
        std::ostringstream coords;
        coords << "(" << probe.x << "," << probe.y << "," << probe.z << ")";
        std::cout << "  " << std::setw(20) << coords.str()
                  << "material=" << schematic.MaterialAt(probe.x, probe.y, probe.z)
                  << (schematic.IsFilled(probe.x, probe.y, probe.z) ? "  filled" : "  empty")
                  << (schematic.Contains(probe.x, probe.y, probe.z) ? "" : "  (out of bounds)") << std::endl;
    }
}

} // namespace
