#include "atclean/config/configuration.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/lightcurve.hpp"
#include "atclean/cuts/cut_engine.hpp"
#include "atclean/cuts/cut_list.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace atclean;
using Catch::Approx;

namespace {

core::LightCurve make_lc(const std::vector<double> &dflux) {
  const auto n = static_cast<Eigen::Index>(dflux.size());
  core::LightCurve lc(0, "o");
  lc.set_column(col::MJD, VectorXd::LinSpaced(n, 60000.0, 60000.0 + n - 1), true);
  lc.set_column(col::FLUX, VectorXd::Constant(n, 10.0), true);
  lc.set_column(col::DFLUX,
                Eigen::Map<const VectorXd>(dflux.data(), n), true);
  lc.set_mask(std::vector<Mask>(dflux.size(), 0));
  return lc;
}

config::CustomCutConfig custom_cut(const std::string &name, Mask flag) {
  config::CustomCutConfig c;
  c.name = name;
  c.column = col::SNR;
  c.max_value = 100.0;
  c.flag = flag;
  return c;
}

} // namespace

TEST_CASE("default_cut_list_applies_builtin_cuts_in_chain_order") {
  config::Config cfg;
  const auto list = cuts::make_cut_list(cfg);

  const std::vector<std::string> expected{cuts::UNCERT_CUT, cuts::UNCERT_EST, cuts::X2_CUT,
                                          cuts::CONTROLS_CUT, cuts::BADDAY_CUT};
  REQUIRE(list.application_order() == expected);
  REQUIRE(list.custom_cuts().empty());
}

TEST_CASE("disabled_cut_is_left_out_of_the_order") {
  config::Config cfg;
  cfg.cuts.controls_cut.enabled = false;
  const auto list = cuts::make_cut_list(cfg);

  REQUIRE_FALSE(list.has(cuts::CONTROLS_CUT));
  const std::vector<std::string> expected{cuts::UNCERT_CUT, cuts::UNCERT_EST, cuts::X2_CUT,
                                          cuts::BADDAY_CUT};
  REQUIRE(list.application_order() == expected);
}

TEST_CASE("custom_cut_runs_before_the_cut_it_precedes") {
  config::Config cfg;
  cfg.cuts.custom.push_back(custom_cut("snr_cut", 0x8));
  const auto list = cuts::make_cut_list(cfg);

  const std::vector<std::string> expected{cuts::UNCERT_CUT, cuts::UNCERT_EST, cuts::X2_CUT,
                                          cuts::CONTROLS_CUT, "snr_cut", cuts::BADDAY_CUT};
  REQUIRE(list.application_order() == expected);
  REQUIRE(list.custom_cuts() == std::vector<std::string>{"snr_cut"});
}

TEST_CASE("previous_flags_are_the_flags_of_all_earlier_cuts") {
  config::Config cfg;
  cfg.cuts.custom.push_back(custom_cut("snr_cut", 0x8));
  const auto list = cuts::make_cut_list(cfg);

  REQUIRE(list.get_previous_flags(cuts::UNCERT_CUT) == 0u);
  REQUIRE(list.get_previous_flags(cuts::X2_CUT) == 0x2u);
  REQUIRE(list.get_previous_flags(cuts::CONTROLS_CUT) == (0x2u | 0x1u));
  REQUIRE(list.get_previous_flags(cuts::BADDAY_CUT) == (0x2u | 0x1u | 0x400000u | 0x8u));
  REQUIRE_THROWS_AS(list.get_previous_flags("snr_cut"), ConfigError);
}

TEST_CASE("all_flags_combine_every_cut_flag") {
  config::Config cfg;
  const auto list = cuts::make_cut_list(cfg);
  REQUIRE(list.get_all_flags() == (0x1u | 0x2u | 0x400000u | 0x800000u));
}

TEST_CASE("shared_flag_bits_are_rejected") {
  config::Config cfg;
  cfg.cuts.custom.push_back(custom_cut("snr_cut", 0x1));
  REQUIRE_THROWS_AS(cuts::make_cut_list(cfg), ConfigError);

  config::Config cfg2;
  cfg2.cuts.controls_cut.x2_flag = 0x2000;  // averaging smallnum flag
  REQUIRE_THROWS_AS(cuts::make_cut_list(cfg2), ConfigError);
}

TEST_CASE("cyclic_ordering_is_rejected") {
  config::Config cfg;
  auto list = cuts::make_cut_list(cfg);
  REQUIRE_THROWS_AS(list.add_order(cuts::BADDAY_CUT, cuts::UNCERT_CUT), ConfigError);

  cuts::CutOrdering ordering;
  ordering.add_edge("a", "b");
  ordering.add_edge("b", "c");
  REQUIRE(ordering.ancestors("c") == std::set<std::string>{"a", "b"});
  ordering.add_edge("c", "a");
  REQUIRE_THROWS_AS(ordering.validate(), ConfigError);
}

TEST_CASE("custom_cut_without_bounds_is_rejected") {
  config::Config cfg;
  auto c = custom_cut("bad", 0x8);
  c.max_value.reset();
  cfg.cuts.custom.push_back(c);
  REQUIRE_THROWS_AS(cuts::make_cut_list(cfg), ConfigError);
}

TEST_CASE("apply_cut_flags_rows_outside_bounds_and_missing_values") {
  auto lc = make_lc({10.0, 200.0, std::nan(""), 160.0});
  lc.mask()[3] = 0x1000;

  cuts::Cut cut;
  cut.column = col::DFLUX;
  cut.max_value = 160.0;
  cut.flag = 0x2;

  const double percent = cuts::apply_cut(cut, lc);
  REQUIRE(percent == Approx(50.0));
  REQUIRE(lc.mask()[0] == 0u);
  REQUIRE(lc.mask()[1] == 0x2u);
  REQUIRE(lc.mask()[2] == 0x2u);
  REQUIRE(lc.mask()[3] == 0x1000u);

  // Applying again gives the same mask
  cuts::apply_cut(cut, lc);
  REQUIRE(lc.mask()[1] == 0x2u);
  REQUIRE(lc.mask()[3] == 0x1000u);

  // A looser bound clears the earlier result
  cut.max_value = 1000.0;
  REQUIRE(cuts::apply_cut(cut, lc) == Approx(25.0));
  REQUIRE(lc.mask()[1] == 0u);
}

TEST_CASE("apply_cut_needs_flag_column_and_bound") {
  auto lc = make_lc({10.0});
  cuts::Cut cut;
  cut.column = col::DFLUX;
  cut.flag = 0x2;
  REQUIRE_FALSE(cut.can_apply_directly());
  REQUIRE_THROWS_AS(cuts::apply_cut(cut, lc), ConfigError);
}

TEST_CASE("apply_cut_on_supernova_flags_every_light_curve") {
  core::Supernova sn("2023abc", "o");
  sn.add(make_lc({10.0, 200.0}));
  auto ctrl = make_lc({200.0, 200.0});
  ctrl.set_control_index(1);
  sn.add(ctrl);

  cuts::Cut cut;
  cut.column = col::DFLUX;
  cut.max_value = 160.0;
  cut.flag = 0x2;

  REQUIRE(cuts::apply_cut(cut, sn) == Approx(50.0));
  REQUIRE(cuts::percent_flagged(sn.lc(1), 0x2) == Approx(100.0));
}
