#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "model.hpp"

namespace exospec {

struct AbsorptionTable {
    std::string species;
    std::vector<double> wavelengths;
    std::vector<double> temperatures;
    std::vector<double> pressures;
    // flattened [T][P][lambda], m^2
    std::vector<double> cross_sections;
};

struct CollisionTable {
    std::string species_a;
    std::string species_b;
    std::vector<double> wavelengths;
    std::vector<double> temperatures;
    // flattened [T][lambda], m^5
    std::vector<double> coefficients;
};

class OpacityDatabase {
   public:
    explicit OpacityDatabase(Method method = Method::Xsec, int n_gauss = 10);

    void add_absorption_table(AbsorptionTable table);
    void add_collision_table(CollisionTable table);

    Method method() const {
        return method_;
    }
    int n_gauss() const {
        return n_gauss_;
    }
    const std::vector<double>& lambda_grid() const {
        return lambda_grid_;
    }
    const std::vector<double>& temperatures() const {
        return temperatures_;
    }
    const std::vector<double>& pressures() const {
        return pressures_;
    }
    const std::vector<CollisionTable>& collision_tables() const {
        return collision_tables_;
    }
    std::vector<std::string> species() const;
    bool has_species(const std::string& species) const;
    double d_ln_lambda() const;

    // Bilinear in T and ln P, P clamped to the table.
    double cross_section(const std::string& species, double T, double P,
                         size_t lambda_index) const;
    std::vector<double> cross_sections(
        const std::string& species, double T, double P,
        const std::vector<size_t>& lambda_indices) const;
    std::vector<double> collision_coefficients(
        const CollisionTable& table, double T,
        const std::vector<size_t>& lambda_indices) const;

   private:
    void check_wavelengths(const std::vector<double>& wavelengths,
                           const std::string& source);

    Method method_;
    int n_gauss_;
    std::vector<double> lambda_grid_;
    std::vector<double> temperatures_;
    std::vector<double> pressures_;
    std::map<std::string, std::vector<double>> cross_sections_;
    std::vector<CollisionTable> collision_tables_;
};

OpacityDatabase load_opacity_database(
    const std::vector<std::string>& absorption_files,
    const std::vector<std::string>& collision_files, Method method,
    int n_gauss);

AbsorptionTable load_absorption_table(const std::string& path);
CollisionTable load_collision_table(const std::string& path);

}  // namespace exospec
