#include "atclean/config/configuration.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/lightcurve.hpp"
#include "atclean/cuts/control_consistency.hpp"
#include "atclean/cuts/cut_list.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace atclean;
using Catch::Approx;

namespace {

constexpr Mask kFlag = 0x400000;
constexpr Mask kQuestionable = 0x80000;
constexpr Mask kX2 = 0x100;
constexpr Mask kStn = 0x200;
constexpr Mask kNclip = 0x400;
constexpr Mask kNgood = 0x800;

core::LightCurve make_lc(int control_index, const std::vector<double> &flux) {
  const auto n = static_cast<Eigen::Index>(flux.size());
  core::LightCurve lc(control_index, "o");
  lc.set_column(col::MJD, VectorXd::LinSpaced(n, 60000.0, 60000.0 + n - 1), true);
  lc.set_column(col::FLUX, Eigen::Map<const VectorXd>(flux.data(), n), true);
  lc.set_column(col::DFLUX, VectorXd::Constant(n, 1.0), true);
  lc.set_mask(std::vector<Mask>(flux.size(), 0));
  return lc;
}

// Epoch 0: quiet controls. Epoch 1: one control far off. Epoch 2: all
// controls agree on a significant flux.
core::Supernova make_supernova() {
  core::Supernova sn("2023abc", "o");
  sn.add(make_lc(0, {5.0, 5.0, 5.0}));
  for (int i = 1; i <= 5; ++i) {
    sn.add(make_lc(i, {0.0, i == 3 ? 100.0 : 0.0, 10.0}));
  }
  return sn;
}

cuts::Cut controls_cut() {
  config::Config cfg;
  cfg.cuts.controls_cut.Nclip_max = 0;
  return cuts::make_cut_list(cfg).get(cuts::CONTROLS_CUT);
}

} // namespace

TEST_CASE("control_stats_are_written_to_the_transient") {
  auto sn = make_supernova();
  const cuts::ControlConsistencyAnalyzer analyzer(controls_cut());
  analyzer.calculate_control_stats(sn, 0);

  const auto &lc = sn.transient();
  REQUIRE(lc.column(cuts::c2::MEAN)[0] == Approx(0.0).margin(1e-12));
  REQUIRE(lc.column(cuts::c2::NGOOD)[0] == Approx(5.0));
  REQUIRE(lc.column(cuts::c2::NCLIP)[1] == Approx(1.0));
  REQUIRE(lc.column(cuts::c2::NGOOD)[1] == Approx(4.0));
  REQUIRE(lc.column(cuts::c2::MEAN)[2] == Approx(10.0));
  REQUIRE(lc.column(cuts::c2::MEAN_ERR)[2] == Approx(1.0 / std::sqrt(5.0)));
  REQUIRE(lc.column(cuts::c2::ABS_STN)[2] == Approx(10.0 * std::sqrt(5.0)));
}

TEST_CASE("controls_cut_flags_clipped_epochs_and_marks_unclipped_failures_questionable") {
  auto sn = make_supernova();
  const cuts::ControlConsistencyAnalyzer analyzer(controls_cut());
  const auto report = analyzer.apply(sn, 0);

  const auto &mask = sn.transient().mask();
  REQUIRE(mask[0] == 0u);

  REQUIRE((mask[1] & kNclip) != 0u);
  REQUIRE((mask[1] & kFlag) != 0u);
  REQUIRE((mask[1] & kQuestionable) == 0u);

  REQUIRE((mask[2] & kStn) != 0u);
  REQUIRE((mask[2] & kQuestionable) != 0u);
  REQUIRE((mask[2] & kFlag) == 0u);
  REQUIRE((mask[2] & (kX2 | kNgood)) == 0u);

  REQUIRE(report.percent == Approx(100.0 / 3.0));
  REQUIRE(report.questionable_percent == Approx(100.0 / 3.0));
  REQUIRE(report.Nclip_percent == Approx(100.0 / 3.0));
  REQUIRE(report.stn_percent == Approx(100.0 / 3.0));
  REQUIRE(report.Ngood_percent == Approx(0.0));

  for (int idx : sn.control_indices()) {
    REQUIRE(sn.lc(idx).mask() == mask);
  }
}

TEST_CASE("controls_cut_replaces_its_own_earlier_flags") {
  auto sn = make_supernova();
  sn.transient().mask()[0] = kFlag | 0x1;
  const cuts::ControlConsistencyAnalyzer analyzer(controls_cut());
  analyzer.apply(sn, 0);

  REQUIRE(sn.transient().mask()[0] == 0x1u);
  REQUIRE(sn.lc(1).mask()[0] == 0u);
}

TEST_CASE("controls_flagged_by_previous_cuts_are_left_out") {
  auto sn = make_supernova();
  sn.lc(3).mask()[1] = 0x1;
  const cuts::ControlConsistencyAnalyzer analyzer(controls_cut());
  analyzer.apply(sn, 0x1);

  const auto &lc = sn.transient();
  REQUIRE(lc.column(cuts::c2::NMASK)[1] == Approx(1.0));
  REQUIRE(lc.column(cuts::c2::NCLIP)[1] == Approx(0.0));
  REQUIRE((lc.mask()[1] & kFlag) == 0u);
}

TEST_CASE("controls_cut_needs_aligned_controls") {
  auto sn = make_supernova();
  sn.add(make_lc(6, {0.0, 0.0}));
  const cuts::ControlConsistencyAnalyzer analyzer(controls_cut());
  REQUIRE_THROWS_AS(analyzer.apply(sn, 0), AlignmentError);

  core::Supernova lonely("2023xyz", "o");
  lonely.add(make_lc(0, {1.0}));
  REQUIRE_THROWS_AS(analyzer.apply(lonely, 0), DataInsufficientError);
}
