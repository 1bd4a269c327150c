#include "atclean/config/configuration.hpp"
#include "atclean/core/events.hpp"
#include "atclean/io/lc_table.hpp"
#include "atclean/pipeline/simdetec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <sstream>

using namespace atclean;

namespace {

core::LightCurve make_binned(int control_index, Eigen::Index n) {
  core::LightCurve lc(control_index, "o");
  const VectorXd t = VectorXd::LinSpaced(n, 60000.5, 60000.5 + static_cast<double>(n - 1));
  lc.set_column(col::MJDBIN, t, true);
  lc.set_column(col::MJD, t, true);
  lc.set_column(col::FLUX, VectorXd::Zero(n), true);
  lc.set_column(col::DFLUX, VectorXd::Constant(n, 1.0), true);
  lc.set_mask(std::vector<Mask>(static_cast<size_t>(n), 0));
  lc.set_binned(1.0);
  return lc;
}

config::Config small_config(const fs::path &dir) {
  config::Config cfg;
  cfg.input.output_dir = dir.string();
  cfg.input.filters = {"o"};
  cfg.input.num_controls = 2;
  cfg.simulation.sigma_kerns = {5};
  cfg.simulation.sigma_sims = {{2, 5}};
  cfg.simulation.peak_mag_min = 20.0;
  cfg.simulation.peak_mag_max = 18.0;
  cfg.simulation.n_peaks = 2;
  cfg.simulation.iterations = 50;
  cfg.efficiency.fom_limits = {{3, 5}};
  cfg.runtime.parallel_workers = 1;
  return cfg;
}

} // namespace

TEST_CASE("simdetec_writes_rolling_sums_tables_and_efficiencies") {
  const fs::path dir = fs::temp_directory_path() / "atclean_test_simdetec";
  fs::remove_all(dir);

  core::Supernova sn("2023abc", "o");
  for (int i = 0; i <= 2; ++i) sn.add(make_binned(i, 80));
  io::save_supernova(sn, dir, true, false, 1.0);

  const auto cfg = small_config(dir);
  REQUIRE_NOTHROW(cfg.validate());
  core::EventEmitter emitter;
  std::ostringstream events;
  pipeline::SimDetecPipeline simdetec(cfg, emitter, "test_run", events);

  const auto result = simdetec.run_object("2023abc", "o", true);
  REQUIRE(result.success);
  REQUIRE(result.summary["simdetec_tables"] == 2);
  REQUIRE(result.summary["efficiency_rows"] == 4);

  const fs::path bump = pipeline::bump_analysis_dir(dir, "2023abc");
  REQUIRE(fs::exists(bump / "2023abc.o.1days.fom_5.txt"));
  REQUIRE(fs::exists(bump / "tables" / "simdetec_5_20.00.txt"));
  REQUIRE(fs::exists(bump / "tables" / "simdetec_5_18.00.txt"));
  REQUIRE(fs::exists(bump / "tables" / "efficiencies.txt"));

  const auto reloaded = simdetec.run_object("2023abc", "o", false);
  REQUIRE(reloaded.success);
  REQUIRE(reloaded.summary["efficiency_rows"] == 4);

  const auto missing = simdetec.run_object("2099zzz", "o", true);
  REQUIRE_FALSE(missing.success);
  REQUIRE(events.str().find("\"object_failed\"") != std::string::npos);

  fs::remove_all(dir);
}
