#include "listing_analyzer.hpp"
#include "core/csd_log.h"

#include <filesystem>
#include <fstream>
#include <regex>

namespace CSD {
namespace Model {

static std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static TypeKind KindFromKeyword(const std::string& keyword) {
    if (keyword == "struct") return TypeKind::Struct;
    if (keyword == "enum") return TypeKind::Enum;
    if (keyword == "interface") return TypeKind::Interface;
    return TypeKind::Class;
}

std::vector<Image> ListingAnalyzer::ParseListing(std::istream& in, const std::string& default_image_name) {
    std::vector<Image> images;

    std::regex image_regex(R"(^//\s*Image\s+(\d+)\s*:\s*(.+)$)");
    std::regex dll_regex(R"(^//\s*Dll\s*:\s*(.+)$)");
    std::regex attribute_regex(R"(^//\s*Attribute\s*:\s*(.+)$)");
    std::regex ns_regex(R"(^//\s*Namespace:\s*(.*)$)");
    std::regex type_regex(R"(^(public|internal|private)\s+((?:sealed\s+|abstract\s+|static\s+)*)(class|interface|enum|struct)\s+([^\s:{]+)(?:\s*:\s*([^\s,{]+))?)");
    std::regex index_regex(R"(//\s*TypeDefIndex:\s*(-?\d{1,9}))");

    Image* current_image = nullptr;
    std::string current_dll;
    std::string current_ns;
    int32_t next_index = 0;
    size_t total_types = 0;

    auto ensure_image = [&]() -> Image& {
        if (!current_image) {
            images.emplace_back();
            current_image = &images.back();
            current_image->index = images.size() - 1;
            current_image->name = default_image_name;
        }
        return *current_image;
    };

    auto find_assembly = [&](Image& image, const std::string& name) -> AssemblyInfo& {
        for (auto& asm_info : image.assemblies) {
            if (asm_info.name == name) return asm_info;
        }
        image.assemblies.push_back(AssemblyInfo{ name, {} });
        return image.assemblies.back();
    };

    std::string raw;
    size_t line_number = 0;
    while (std::getline(in, raw)) {
        ++line_number;
        std::string line = Trim(raw);
        if (line.empty()) continue;

        std::smatch match;

        if (std::regex_search(line, match, image_regex)) {
            images.emplace_back();
            current_image = &images.back();
            current_image->index = images.size() - 1;
            current_image->name = Trim(match[2].str());
            current_dll.clear();
            current_ns.clear();
            next_index = 0;
            continue;
        }

        if (std::regex_search(line, match, dll_regex)) {
            current_dll = Trim(match[1].str());
            find_assembly(ensure_image(), current_dll);
            continue;
        }

        if (std::regex_search(line, match, attribute_regex)) {
            if (current_dll.empty()) {
                LOG_WARN("Line %zu: assembly attribute before any '// Dll' line, ignored", line_number);
                continue;
            }
            find_assembly(ensure_image(), current_dll).attributes.push_back(Trim(match[1].str()));
            continue;
        }

        if (std::regex_search(line, match, ns_regex)) {
            current_ns = Trim(match[1].str());
            continue;
        }

        if (std::regex_search(line, match, type_regex)) {
            TypeEntry type;
            type.visibility = match[1].str();
            type.modifiers = match[2].str();
            type.kind = KindFromKeyword(match[3].str());
            type.name = match[4].str();
            if (match[5].matched) {
                type.base_type = match[5].str();
            }
            type.ns = current_ns;
            type.assembly = current_dll;

            std::smatch index_match;
            if (std::regex_search(line, index_match, index_regex)) {
                type.index = std::stoi(index_match[1].str());
            } else {
                type.index = next_index;
            }
            next_index = type.index + 1;

            Image& image = ensure_image();
            if (!type.assembly.empty()) find_assembly(image, type.assembly);
            image.types.push_back(type);
            ++total_types;
            continue;
        }

        LOG_TRACE("Line %zu: not a listing record: %s", line_number, line.c_str());
    }

    if (total_types == 0) {
        images.clear();
    }
    return images;
}

std::optional<std::vector<Image>> ListingAnalyzer::LoadFromFile(const std::string& binary_path,
                                                                const std::string& metadata_path) {
    std::ifstream binary(binary_path, std::ios::binary);
    if (!binary.is_open()) {
        LOG_ERROR("Cannot open binary: %s", binary_path.c_str());
        return std::nullopt;
    }

    std::ifstream metadata(metadata_path);
    if (!metadata.is_open()) {
        LOG_ERROR("Cannot open metadata: %s", metadata_path.c_str());
        return std::nullopt;
    }

    std::string default_name = std::filesystem::path(binary_path).filename().string();
    auto images = ParseListing(metadata, default_name);
    if (images.empty()) {
        LOG_ERROR("No type definitions found in %s", metadata_path.c_str());
        return std::nullopt;
    }

    size_t type_count = 0;
    for (const auto& image : images) type_count += image.types.size();
    LOG_INFO("Found %zu image(s), %zu type definitions", images.size(), type_count);
    return images;
}

} // namespace Model
} // namespace CSD
