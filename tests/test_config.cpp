#include "atclean/config/configuration.hpp"
#include "atclean/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace atclean;
using Catch::Approx;

TEST_CASE("config_defaults_are_valid") {
  config::Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.cuts.x2_cut.flag == 0x1);
  REQUIRE(cfg.cuts.averaging.flag == 0x800000);
  REQUIRE(cfg.simulation.sigma_kerns.size() == cfg.simulation.sigma_sims.size());
}

TEST_CASE("config_reads_yaml_sections") {
  const auto node = YAML::Load(R"(
input:
  lc_dir: /data/lcs
  filters: [o]
  num_controls: 4
cuts:
  x2_cut:
    max_value: 5
    flag: 0x10
    limcuts:
      cut_start: 2
  averaging:
    mjd_bin_size: 2.0
    empty_bin_policy: all_rows
  custom:
    - name: tiny_flux_cut
      column: duJy
      max_value: 100
      flag: 0x4
  order:
    - [uncert_cut, x2_cut]
simulation:
  sigma_kerns: [5, 15]
  sigma_sims:
    - [2, template]
    - [null, 20]
  seasons:
    - [60000, 60100]
  template:
    filename: erup.txt
    sigma: 3.0
efficiency:
  fom_limits: [[3, 5], [4]]
runtime:
  parallel_workers: 2
)");
  const auto cfg = config::Config::from_yaml(node);

  REQUIRE(cfg.input.lc_dir == "/data/lcs");
  REQUIRE(cfg.input.filters == std::vector<std::string>{"o"});
  REQUIRE(cfg.input.num_controls == 4);
  REQUIRE(cfg.cuts.x2_cut.max_value == Approx(5.0));
  REQUIRE(cfg.cuts.x2_cut.flag == 0x10);
  REQUIRE(cfg.cuts.x2_cut.limcuts.cut_start == 2);
  REQUIRE(cfg.cuts.x2_cut.limcuts.cut_stop == 50);
  REQUIRE(cfg.cuts.averaging.mjd_bin_size == Approx(2.0));
  REQUIRE(cfg.cuts.averaging.empty_bin_policy == EmptyBinPolicy::ALL_ROWS);

  REQUIRE(cfg.cuts.custom.size() == 1);
  REQUIRE(cfg.cuts.custom[0].column == "duJy");
  REQUIRE_FALSE(cfg.cuts.custom[0].min_value.has_value());
  REQUIRE(*cfg.cuts.custom[0].max_value == Approx(100.0));
  REQUIRE(cfg.cuts.custom[0].flag == 0x4);
  REQUIRE(cfg.cuts.custom[0].precedes == "badday_cut");
  REQUIRE(cfg.cuts.order.size() == 1);
  REQUIRE(cfg.cuts.order[0][1] == "x2_cut");

  REQUIRE(cfg.simulation.sigma_sims.size() == 2);
  REQUIRE(*cfg.simulation.sigma_sims[0][0] == Approx(2.0));
  REQUIRE_FALSE(cfg.simulation.sigma_sims[0][1].has_value());
  REQUIRE_FALSE(cfg.simulation.sigma_sims[1][0].has_value());
  REQUIRE(cfg.simulation.seasons.size() == 1);
  REQUIRE(cfg.simulation.seasons[0].end == Approx(60100.0));
  REQUIRE(cfg.simulation.template_model.sigma == Approx(3.0));
  REQUIRE(cfg.efficiency.fom_limits[1] == std::vector<double>{4});
  REQUIRE(cfg.runtime.parallel_workers == 2);
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_rejects_bad_flags") {
  const auto node = YAML::Load("cuts:\n  uncert_cut:\n    flag: notaflag\n");
  REQUIRE_THROWS_AS(config::Config::from_yaml(node), ConfigError);
}

TEST_CASE("config_validation_errors") {
  SECTION("unknown filter") {
    config::Config cfg;
    cfg.input.filters = {"g"};
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
  SECTION("non-positive bin size") {
    config::Config cfg;
    cfg.cuts.averaging.mjd_bin_size = 0.0;
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
  SECTION("duplicate custom cut names") {
    config::Config cfg;
    cfg.cuts.custom.resize(2);
    cfg.cuts.custom[0].name = "a";
    cfg.cuts.custom[1].name = "a";
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
  SECTION("kernel and width lists differ") {
    config::Config cfg;
    cfg.simulation.sigma_sims.pop_back();
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  }
  SECTION("template width without a template file") {
    config::Config cfg;
    cfg.simulation.sigma_sims[0].push_back(std::nullopt);
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  }
  SECTION("fom limits per kernel") {
    config::Config cfg;
    cfg.efficiency.fom_limits.pop_back();
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  }
  SECTION("season end before start") {
    config::Config cfg;
    cfg.simulation.seasons = {Season{60100.0, 60000.0}};
    REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
  }
}

TEST_CASE("config_missing_file") {
  REQUIRE_THROWS_AS(config::Config::load("/nonexistent/atclean.yaml"), ConfigError);
}

TEST_CASE("config_save_and_load") {
  config::Config cfg;
  cfg.cuts.controls_cut.flag = 0x200000;
  cfg.cuts.custom.push_back({"tiny", "duJy", 1.0, std::nullopt, 0x8, "x2_cut"});
  cfg.simulation.sigma_kerns = {5};
  cfg.simulation.sigma_sims = {{2, std::nullopt}};
  cfg.simulation.template_model.filename = "erup.txt";
  cfg.efficiency.fom_limits = {{3, 5}};

  const auto path = std::filesystem::temp_directory_path() / "atclean_test_config.yaml";
  cfg.save(path);
  const auto loaded = config::Config::load(path);
  std::filesystem::remove(path);

  REQUIRE(loaded.cuts.controls_cut.flag == 0x200000);
  REQUIRE(loaded.cuts.custom.size() == 1);
  REQUIRE(*loaded.cuts.custom[0].min_value == Approx(1.0));
  REQUIRE_FALSE(loaded.cuts.custom[0].max_value.has_value());
  REQUIRE(loaded.cuts.custom[0].precedes == "x2_cut");
  REQUIRE(loaded.simulation.sigma_sims.size() == 1);
  REQUIRE_FALSE(loaded.simulation.sigma_sims[0][1].has_value());
  REQUIRE(loaded.efficiency.fom_limits == cfg.efficiency.fom_limits);
  REQUIRE_NOTHROW(loaded.validate());
}
