#pragma once

#include "atclean/simulation/monte_carlo.hpp"

#include <vector>

namespace atclean::simulation {

// Columns: sigma_kern peak_appmag peak_flux peak_mjd sigma_sim sim_erup_sigma
// max_fom max_fom_mjd
void save_simdetec_table(const SimDetecTable& table, const fs::path& dir);
SimDetecTable load_simdetec_table(const fs::path& dir, double sigma_kern, double peak_appmag);

void save_simdetec_arena(const SimDetecArena& arena, const fs::path& dir);
SimDetecArena load_simdetec_arena(const fs::path& dir, const std::vector<double>& sigma_kerns,
                                  const std::vector<double>& peak_appmags);

} // namespace atclean::simulation
