#include "atclean/core/errors.hpp"
#include "atclean/core/lightcurve.hpp"
#include "atclean/simulation/injection_model.hpp"
#include "atclean/simulation/rolling_fom.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace atclean;
using Catch::Approx;

namespace {

constexpr Mask kBadDay = 0x800000;

core::LightCurve make_binned(Eigen::Index n) {
  core::LightCurve lc(1, "o");
  const VectorXd t = VectorXd::LinSpaced(n, 60000.5, 60000.5 + static_cast<double>(n - 1));
  lc.set_column(col::MJD, t, true);
  lc.set_column(col::MJDBIN, t, true);
  lc.set_column(col::FLUX, VectorXd::Zero(n), true);
  lc.set_column(col::DFLUX, VectorXd::Constant(n, 1.0), true);
  lc.set_mask(std::vector<Mask>(static_cast<size_t>(n), 0));
  lc.set_binned(1.0);
  return lc;
}

Eigen::Index argmax(const VectorXd &v) {
  Eigen::Index i = 0;
  v.maxCoeff(&i);
  return i;
}

} // namespace

TEST_CASE("kernel_spans_three_sigma_in_bins") {
  const simulation::RollingFomEngine engine(3.0, 1.0, kBadDay);
  REQUIRE(engine.sigma_bins() == 3);
  REQUIRE(engine.half_window() == 9);
  REQUIRE(engine.kernel().size() == 19);
  REQUIRE(engine.kernel()[9] == Approx(1.0));
  REQUIRE(engine.kernel()[12] == Approx(std::exp(-0.5)));

  const simulation::RollingFomEngine narrow(0.2, 1.0, kBadDay);
  REQUIRE(narrow.sigma_bins() == 1);
  REQUIRE_THROWS_AS(simulation::RollingFomEngine(0.0, 1.0, kBadDay), ConfigError);
}

TEST_CASE("flagged_and_missing_rows_do_not_count") {
  auto lc = make_binned(20);
  lc.mask()[3] = kBadDay;
  VectorXd f = lc.flux();
  f[5] = std::nan("");
  lc.set_column(col::FLUX, f, true);

  const simulation::RollingFomEngine engine(2.0, 1.0, kBadDay);
  const auto valid = engine.valid_rows(lc);
  REQUIRE_FALSE(valid[3]);
  REQUIRE_FALSE(valid[5]);
  REQUIRE(valid[4]);

  const VectorXd snr = engine.snr(lc, false);
  REQUIRE(snr[5] == 0.0);
}

TEST_CASE("flat_light_curve_has_zero_figure_of_merit") {
  auto lc = make_binned(40);
  const simulation::RollingFomEngine engine(3.0, 1.0, kBadDay);
  const auto fom = engine.apply(lc);

  REQUIRE(fom.norm.maxCoeff() == Approx(engine.kernel().sum()));
  REQUIRE(fom.normalized.cwiseAbs().maxCoeff() == Approx(0.0).margin(1e-12));
}

TEST_CASE("normalization_compensates_for_missing_neighbours") {
  auto lc = make_binned(40);
  VectorXd f = VectorXd::Constant(40, 2.0);
  lc.set_column(col::FLUX, f, true);
  for (size_t i = 15; i < 20; ++i) lc.mask()[i] = kBadDay;

  const simulation::RollingFomEngine engine(3.0, 1.0, kBadDay);
  const auto fom = engine.apply(lc);
  const double full = 2.0 * engine.kernel().sum();

  REQUIRE(fom.normalized[30] == Approx(full));
  REQUIRE(fom.normalized[22] == Approx(full));
  REQUIRE(fom.sum[22] < full);
  REQUIRE(fom.normalized[0] == Approx(full));
}

TEST_CASE("rows_without_valid_neighbours_score_zero") {
  auto lc = make_binned(10);
  for (auto &m : lc.mask()) m = kBadDay;
  const simulation::RollingFomEngine engine(1.0, 1.0, kBadDay);
  const auto fom = engine.apply(lc);
  REQUIRE(fom.normalized.cwiseAbs().maxCoeff() == 0.0);
}

TEST_CASE("injected_bump_peaks_where_it_was_injected") {
  auto lc = make_binned(60);
  const simulation::GaussianModel model;
  const simulation::RollingFomEngine engine(3.0, 1.0, kBadDay);
  const double peak = lc.time()[30];

  simulation::inject(lc, model, peak, 10.0, 3.0, engine.valid_rows(lc));
  REQUIRE(lc.injection().has_value());
  REQUIRE(lc.injection()->model == "gaussian");
  REQUIRE(lc.injection()->flux[30] == Approx(10.0).epsilon(1e-4));

  const auto plain = engine.apply(lc, false);
  const auto injected = engine.apply(lc, true);
  REQUIRE(plain.normalized.cwiseAbs().maxCoeff() == Approx(0.0).margin(1e-12));
  REQUIRE(argmax(injected.normalized) == 30);

  simulation::add_rolling_fom_columns(lc, engine);
  REQUIRE(lc.has_column(simulation::fomcol::SNRSIMSUM));
  REQUIRE(lc.column(simulation::fomcol::SNRSIMSUM)[30] ==
          Approx(injected.normalized[30]));
  lc.drop_extra_columns();
  REQUIRE_FALSE(lc.has_column(simulation::fomcol::SNRSUM));
}

TEST_CASE("partial_range_matches_the_full_series") {
  auto lc = make_binned(50);
  VectorXd f = VectorXd::LinSpaced(50, -5.0, 5.0);
  lc.set_column(col::FLUX, f, true);

  const simulation::RollingFomEngine engine(2.0, 1.0, kBadDay);
  const auto full = engine.apply(lc);
  const VectorXd part =
      engine.apply_range(full.snr, full.norm, full.norm.maxCoeff(), 10, 20);

  REQUIRE(part.size() == 11);
  for (Eigen::Index i = 0; i < part.size(); ++i) {
    REQUIRE(part[i] == Approx(full.normalized[10 + i]));
  }
  REQUIRE_THROWS_AS(engine.apply_range(full.snr, full.norm, 1.0, 20, 10), ValidationError);
  REQUIRE_THROWS_AS(engine.apply(VectorXd(), std::vector<bool>{}), DataInsufficientError);
}

TEST_CASE("injection_skips_invalid_rows_and_checks_lengths") {
  auto lc = make_binned(20);
  lc.mask()[10] = kBadDay;
  const simulation::GaussianModel model;
  const simulation::RollingFomEngine engine(2.0, 1.0, kBadDay);
  const auto valid = engine.valid_rows(lc);

  core::Injectable &target = lc;
  simulation::inject(target, lc.time(), model, lc.time()[10], 50.0, 2.0, valid);
  REQUIRE(lc.injection()->flux[10] == 0.0);
  REQUIRE(lc.injection()->flux[11] > 0.0);
  REQUIRE(lc.injection()->width == 2.0);

  const VectorXd short_times = lc.time().head(5);
  REQUIRE_THROWS_AS(simulation::inject(target, short_times, model, 60005.5, 50.0, 2.0, valid),
                    ValidationError);
}
