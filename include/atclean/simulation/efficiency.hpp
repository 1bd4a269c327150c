#pragma once

#include "atclean/simulation/monte_carlo.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace atclean::simulation {

// Fraction of records with max_fom >= fom_limit. `width` selects records of
// one injected width (template widths with template_width); seasons restrict
// the peak times. std::nullopt when no record qualifies.
std::optional<double> efficiency(const std::vector<SimDetecRecord>& records, double fom_limit,
                                 std::optional<double> width = std::nullopt,
                                 bool template_width = false,
                                 const std::vector<Season>& seasons = {});

// "pct_detec_<limit with 2 decimals>"
std::string pct_detec_column(double fom_limit);

struct EfficiencyRow {
    double sigma_kern = 0.0;
    double peak_appmag = 0.0;
    double peak_flux = 0.0;
    std::optional<double> sigma_sim;
    std::optional<double> sim_erup_sigma;
    std::map<double, double> pct_detec;  // limit -> percent, NaN if undefined

    bool is_template() const { return sim_erup_sigma.has_value(); }
};

// Detection efficiency per (kernel width, peak brightness, injected width)
class EfficiencyTable {
public:
    EfficiencyTable() = default;
    // `template_sigma` is required when a width list contains std::nullopt
    EfficiencyTable(const std::vector<double>& sigma_kerns,
                    const std::vector<std::vector<std::optional<double>>>& sigma_sims,
                    const PeakGrid& peaks, std::optional<double> template_sigma = std::nullopt);

    // One limit list per kernel
    void set_fom_limits(const std::vector<std::vector<double>>& fom_limits);
    const std::vector<double>& fom_limits(double sigma_kern) const;

    // Fills the pct_detec values from the matching simulation tables
    void compute(const SimDetecArena& arena, const std::vector<Season>& seasons = {});

    EfficiencyTable subset(std::optional<double> sigma_kern = std::nullopt,
                           std::optional<double> fom_limit = std::nullopt,
                           std::optional<double> sigma_sim = std::nullopt, bool erup = false) const;
    void merge(const EfficiencyTable& other);

    // Throws IOError if the file exists and `overwrite` is false
    void save(const fs::path& path, bool overwrite = true) const;
    static EfficiencyTable load(const fs::path& path);

    const std::vector<EfficiencyRow>& rows() const { return rows_; }
    // Limits in column order
    const std::vector<double>& limit_columns() const { return limit_columns_; }

private:
    void add_limit_column(double limit);

    std::vector<double> sigma_kerns_;
    std::map<double, std::vector<double>> fom_limits_;
    std::vector<double> limit_columns_;
    std::vector<EfficiencyRow> rows_;
};

} // namespace atclean::simulation
