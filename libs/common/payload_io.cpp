/**
 * @file payload_io.cpp
 * @brief Artifact file loading (JSON / YAML) and file writing helpers
 */

#include "arcas/payload_io.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>
#include <fstream>
#include <iterator>
#include <string>

#include <yaml-cpp/yaml.h>

namespace arcas::io {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] bool is_yaml_path(const fs::path& path)
{
    std::string ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".yaml" || ext == ".yml";
}

[[nodiscard]] nlohmann::json scalar_to_json(const YAML::Node& node)
{
    // Quoted scalars carry the non-specific "!" tag and always stay strings.
    if (node.Tag() == "!") {
        return node.Scalar();
    }
    const std::string& text = node.Scalar();
    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
    }
    std::int64_t integer{};
    if (YAML::convert<std::int64_t>::decode(node, integer)) {
        return integer;
    }
    double real{};
    if (YAML::convert<double>::decode(node, real)) {
        return real;
    }
    bool flag{};
    if (YAML::convert<bool>::decode(node, flag)) {
        return flag;
    }
    return text;
}

[[nodiscard]] nlohmann::json yaml_to_json(const YAML::Node& node)
{
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

}  // namespace

arcas::Result<nlohmann::json> read_json_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            arcas::make_error(errc::kIOError, "Failed to open file for read: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    try {
        return nlohmann::json::parse(content);
    } catch (const std::exception& ex) {
        return std::unexpected(arcas::make_error(
            errc::kParseError, std::format("Failed to parse JSON from {}: {}", path.string(), ex.what())));
    }
}

arcas::Result<nlohmann::json> load_payload(const fs::path& path)
{
    if (!is_yaml_path(path)) {
        return read_json_file(path);
    }
    try {
        return yaml_to_json(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile& ex) {
        return std::unexpected(arcas::make_error(
            errc::kIOError, std::format("Failed to open YAML file {}: {}", path.string(), ex.what())));
    } catch (const YAML::Exception& ex) {
        return std::unexpected(arcas::make_error(
            errc::kParseError, std::format("Failed to parse YAML from {}: {}", path.string(), ex.what())));
    }
}

arcas::VoidResult write_text_file(const fs::path& path, std::string_view content)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(arcas::make_error(
                errc::kIOError,
                std::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message())));
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(
            arcas::make_error(errc::kIOError, "Failed to open file for write: " + path.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        return std::unexpected(arcas::make_error(errc::kIOError, "Failed to write file: " + path.string()));
    }
    return {};
}

}  // namespace arcas::io
