#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "config_parser.hpp"
#include "test_fixtures.hpp"

using namespace exospec::test_support;
using ConfigUtil::Config;
using ConfigUtil::ConfigParser;

namespace {

void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

}  // namespace

TEST(ConfigParser, ResolvesPathsAgainstTheConfigDirectory) {
    ScratchDir dir("exospec_config");
    const std::string absolute_cia = data_path("H2-H2_cia.json");
    write_file(dir.file("config.json"), R"({
      "method": "ktables",
      "n_gauss": 4,
      "include_condensation": false,
      "opacity_files": ["tables/H2O.json", "../shared/CO.json"],
      "collision_files": [")" + absolute_cia + R"("],
      "abundance_file": "abundances.json",
      "db_path": "runs.db"
    })");

    Config config = ConfigParser::parse_config_file(dir.file("config.json"));
    const std::filesystem::path base
        = std::filesystem::absolute(dir.file("config.json")).parent_path();
    EXPECT_EQ(config.method, exospec::Method::KTables);
    EXPECT_EQ(config.n_gauss, 4);
    EXPECT_FALSE(config.include_condensation);
    ASSERT_EQ(config.opacity_files.size(), 2u);
    EXPECT_EQ(config.opacity_files[0], (base / "tables/H2O.json").string());
    EXPECT_EQ(config.opacity_files[1],
              (base.parent_path() / "shared/CO.json").string());
    ASSERT_EQ(config.collision_files.size(), 1u);
    EXPECT_EQ(config.collision_files[0], absolute_cia);
    EXPECT_EQ(config.abundance_file, (base / "abundances.json").string());
    EXPECT_TRUE(config.abundance_file_no_condensation.empty());
    EXPECT_EQ(config.db_path, (base / "runs.db").string());
}

TEST(ConfigParser, RejectsUnknownMethodAndBadGaussCount) {
    ScratchDir dir("exospec_config");
    write_file(dir.file("bad_method.json"), R"({
      "method": "line_by_line", "n_gauss": 10, "opacity_files": [],
      "collision_files": [], "db_path": "runs.db"
    })");
    EXPECT_THROW(ConfigParser::parse_config_file(dir.file("bad_method.json")),
                 std::invalid_argument);

    write_file(dir.file("bad_gauss.json"), R"({
      "method": "xsec", "n_gauss": 0, "opacity_files": [],
      "collision_files": [], "db_path": "runs.db"
    })");
    EXPECT_THROW(ConfigParser::parse_config_file(dir.file("bad_gauss.json")),
                 std::invalid_argument);

    write_file(dir.file("no_db.json"), R"({
      "method": "xsec", "n_gauss": 10, "opacity_files": [],
      "collision_files": []
    })");
    EXPECT_THROW(ConfigParser::parse_config_file(dir.file("no_db.json")),
                 std::invalid_argument);
}

TEST(ConfigParser, DefaultConfigPointsAtTheBundledTables) {
    Config config = ConfigParser::parse_config_file();
    EXPECT_EQ(config.method, exospec::Method::Xsec);
    ASSERT_EQ(config.opacity_files.size(), 2u);
    for (const std::string& file : config.opacity_files) {
        EXPECT_TRUE(std::filesystem::exists(file)) << file;
    }
    EXPECT_TRUE(std::filesystem::exists(config.abundance_file));
}

TEST(ConfigParser, FingerprintTracksSettingsAndFiles) {
    ScratchDir dir("exospec_config");
    write_file(dir.file("table.json"), "{}");
    Config config;
    config.opacity_files = {dir.file("table.json")};
    const std::string before = ConfigParser::data_fingerprint(config);
    EXPECT_EQ(before, ConfigParser::data_fingerprint(config));

    Config more_points = config;
    more_points.n_gauss = 20;
    EXPECT_NE(before, ConfigParser::data_fingerprint(more_points));

    write_file(dir.file("table.json"), "{\"grown\": true}");
    EXPECT_NE(before, ConfigParser::data_fingerprint(config));
}
