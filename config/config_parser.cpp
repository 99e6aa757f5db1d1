#include "config_parser.hpp"

#include <simdjson.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "parser.hpp"

namespace ConfigUtil {

std::string ConfigParser::get_config_path_relative_to_source(
    const std::string& filename) {
    return std::filesystem::path(__FILE__).parent_path() / filename;
}

std::string ConfigParser::resolve_path(const std::filesystem::path& base_dir,
                                       const std::string& path) {
    if (path.empty()) return path;
    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) return path;
    return (base_dir / candidate).lexically_normal().string();
}

std::string ConfigParser::get_optional_string_field(
    simdjson::ondemand::object& obj, const char* name) {
    auto field = obj.find_field_unordered(name);
    if (field.error() == simdjson::NO_SUCH_FIELD) return "";
    return std::string(field.get_string().value());
}

int ConfigParser::get_int_field(simdjson::ondemand::object& obj,
                                const char* name) {
    return static_cast<int>(obj.find_field_unordered(name).get_int64().value());
}

Config ConfigParser::parse_config_file(const std::optional<std::string>& path) {
    Config parsed_config;
    parsed_config.config_path
        = path ? *path : get_config_path_relative_to_source("config.json");
    const std::filesystem::path base_dir
        = std::filesystem::absolute(parsed_config.config_path).parent_path();

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded_json
        = simdjson::padded_string::load(parsed_config.config_path).value();
    simdjson::ondemand::document document = parser.iterate(padded_json).value();
    simdjson::ondemand::object root_object = document.get_object().value();

    std::string method = exospec::get_string(root_object, "method");
    if (method == "xsec") {
        parsed_config.method = exospec::Method::Xsec;
    } else if (method == "ktables") {
        parsed_config.method = exospec::Method::KTables;
    } else {
        throw std::invalid_argument("key 'method': unknown method '" + method
                                    + "'");
    }
    parsed_config.n_gauss = get_int_field(root_object, "n_gauss");
    if (parsed_config.n_gauss <= 0) {
        throw std::invalid_argument("key 'n_gauss': must be positive");
    }
    parsed_config.include_condensation = exospec::get_bool_or(
        root_object, "include_condensation", true);
    for (const std::string& file :
         exospec::get_string_array(root_object, "opacity_files")) {
        parsed_config.opacity_files.push_back(resolve_path(base_dir, file));
    }
    for (const std::string& file :
         exospec::get_string_array(root_object, "collision_files")) {
        parsed_config.collision_files.push_back(resolve_path(base_dir, file));
    }
    parsed_config.abundance_file = resolve_path(
        base_dir, get_optional_string_field(root_object, "abundance_file"));
    parsed_config.abundance_file_no_condensation = resolve_path(
        base_dir, get_optional_string_field(root_object,
                                            "abundance_file_no_condensation"));
    parsed_config.db_path = resolve_path(
        base_dir, exospec::get_string(root_object, "db_path"));

    std::cerr << "[config] " << parsed_config.config_path << ": " << method
              << ", " << parsed_config.opacity_files.size()
              << " opacity files\n";
    return parsed_config;
}

std::string ConfigParser::data_fingerprint(const Config& config) {
    std::string fingerprint
        = (config.method == exospec::Method::Xsec ? "xsec" : "ktables");
    fingerprint += ";" + std::to_string(config.n_gauss);
    fingerprint += config.include_condensation ? ";cond" : ";nocond";
    auto add_file = [&fingerprint](const std::string& file) {
        fingerprint += ";" + file;
        if (file.empty()) return;
        std::error_code ec;
        auto size = std::filesystem::file_size(file, ec);
        if (ec) return;
        auto mtime = std::filesystem::last_write_time(file, ec);
        if (ec) return;
        fingerprint += ":" + std::to_string(size) + ":"
                       + std::to_string(mtime.time_since_epoch().count());
    };
    for (const std::string& file : config.opacity_files) add_file(file);
    for (const std::string& file : config.collision_files) add_file(file);
    add_file(config.abundance_file);
    add_file(config.abundance_file_no_condensation);
    return fingerprint;
}
}  // namespace ConfigUtil
