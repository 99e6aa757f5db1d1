#pragma once

#include <simdjson.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "model.hpp"

namespace ConfigUtil {
struct Config {
    std::string config_path;
    exospec::Method method = exospec::Method::Xsec;
    int n_gauss = 10;
    bool include_condensation = true;
    std::vector<std::string> opacity_files;
    std::vector<std::string> collision_files;
    // empty when runs rely on custom abundances only
    std::string abundance_file;
    std::string abundance_file_no_condensation;
    std::string db_path;
};
class ConfigParser {
   public:
    // Without a path, reads config.json next to these sources.
    static Config parse_config_file(
        const std::optional<std::string>& path = std::nullopt);

    // Identifies the data a run was computed from: solver settings plus
    // the size and modification time of every data file.
    static std::string data_fingerprint(const Config& config);

   private:
    static std::string get_config_path_relative_to_source(
        const std::string& filename);
    static std::string resolve_path(const std::filesystem::path& base_dir,
                                    const std::string& path);
    static std::string get_optional_string_field(
        simdjson::ondemand::object& obj, const char* name);
    static int get_int_field(simdjson::ondemand::object& obj, const char* name);
};
}  // namespace ConfigUtil
