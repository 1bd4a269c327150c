#include "atclean/averaging/day_binning.hpp"
#include "atclean/config/configuration.hpp"
#include "atclean/core/lightcurve.hpp"
#include "atclean/cuts/cut_list.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace atclean;
using Catch::Approx;

namespace {

constexpr Mask kFlag = 0x800000;
constexpr Mask kIxclip = 0x1000;
constexpr Mask kSmallnum = 0x2000;
constexpr Mask kNodata = 0x4000;

// Bin 0: four good rows. Bin 1: empty. Bin 2: two good rows.
// Bin 3: three rows flagged by an earlier cut.
core::LightCurve make_lc() {
  const std::vector<double> t{60000.1, 60000.2, 60000.3, 60000.4, 60002.1,
                              60002.2, 60003.1, 60003.2, 60003.3};
  const std::vector<double> f{10, 10, 10, 10, 5, 5, 7, 7, 7};
  const auto n = static_cast<Eigen::Index>(t.size());
  core::LightCurve lc(0, "o");
  lc.set_column(col::MJD, Eigen::Map<const VectorXd>(t.data(), n), true);
  lc.set_column(col::FLUX, Eigen::Map<const VectorXd>(f.data(), n), true);
  lc.set_column(col::DFLUX, VectorXd::Constant(n, 1.0), true);
  std::vector<Mask> mask(t.size(), 0);
  mask[6] = mask[7] = mask[8] = 0x1;
  lc.set_mask(mask);
  return lc;
}

averaging::DayBinningAverager make_averager(
    EmptyBinPolicy policy = EmptyBinPolicy::NO_VALUE) {
  config::Config cfg;
  const cuts::Cut cut = cuts::make_cut_list(cfg).get(cuts::BADDAY_CUT);
  averaging::DayBinningOptions options;
  options.empty_bin_policy = policy;
  return averaging::DayBinningAverager(cut, options);
}

} // namespace

TEST_CASE("bins_start_at_the_floor_of_the_first_epoch") {
  auto lc = make_lc();
  const auto avg = make_averager().average(lc, 0x1);

  REQUIRE(avg.size() == 4);
  REQUIRE(avg.binned());
  REQUIRE(avg.bin_size() == Approx(1.0));
  REQUIRE(avg.column(col::MJDBIN)[0] == Approx(60000.5));
  REQUIRE(avg.column(col::MJDBIN)[3] == Approx(60003.5));
}

TEST_CASE("good_bin_carries_weighted_mean_and_time") {
  auto lc = make_lc();
  const auto avg = make_averager().average(lc, 0x1);

  REQUIRE(avg.mask()[0] == 0u);
  REQUIRE(avg.column(col::MJD)[0] == Approx(60000.25));
  REQUIRE(avg.column(col::FLUX)[0] == Approx(10.0));
  REQUIRE(avg.column(col::DFLUX)[0] == Approx(0.5));
  REQUIRE(avg.column(col::NGOOD)[0] == Approx(4.0));
  REQUIRE(avg.column(col::NCLIP)[0] == Approx(0.0));
  REQUIRE(avg.column(col::MAG)[0] == Approx(21.4));
  REQUIRE(avg.column(col::DMAG)[0] == Approx(2.5 / std::log(10.0) * 0.05));
}

TEST_CASE("empty_bin_is_flagged_without_data") {
  auto lc = make_lc();
  const auto avg = make_averager().average(lc, 0x1);

  REQUIRE(avg.mask()[1] == (kFlag | kNodata));
  REQUIRE(std::isnan(avg.column(col::FLUX)[1]));
  REQUIRE(std::isnan(avg.column(col::MJD)[1]));
}

TEST_CASE("bin_with_fewer_than_three_good_rows_is_smallnum") {
  auto lc = make_lc();
  const auto avg = make_averager().average(lc, 0x1);

  REQUIRE(avg.mask()[2] == kSmallnum);
  REQUIRE(avg.column(col::FLUX)[2] == Approx(5.0));
  REQUIRE((lc.mask()[4] & kSmallnum) != 0u);
  REQUIRE((lc.mask()[5] & kSmallnum) != 0u);
}

TEST_CASE("bin_without_good_rows_has_no_value_by_default") {
  auto lc = make_lc();
  const auto avg = make_averager().average(lc, 0x1);

  REQUIRE(avg.mask()[3] == (kFlag | kNodata));
  REQUIRE(std::isnan(avg.column(col::FLUX)[3]));
  REQUIRE(avg.column(col::NEXCLUDED)[3] == Approx(3.0));
  for (size_t i = 6; i < 9; ++i) {
    REQUIRE(lc.mask()[i] == (0x1u | kFlag));
  }
}

TEST_CASE("bin_without_good_rows_can_average_all_rows") {
  auto lc = make_lc();
  const auto avg = make_averager(EmptyBinPolicy::ALL_ROWS).average(lc, 0x1);

  REQUIRE(avg.mask()[3] == (kFlag | kNodata));
  REQUIRE(avg.column(col::FLUX)[3] == Approx(7.0));
  REQUIRE(avg.column(col::MJD)[3] == Approx(60003.2));
  for (size_t i = 6; i < 9; ++i) {
    REQUIRE((lc.mask()[i] & kNodata) == 0u);
  }
}

TEST_CASE("bin_time_weights_rows_by_inverse_variance") {
  const std::vector<double> t{60000.2, 60000.5, 60000.8};
  const std::vector<double> df{1.0, 1.0, 2.0};
  core::LightCurve lc(0, "o");
  lc.set_column(col::MJD, Eigen::Map<const VectorXd>(t.data(), 3), true);
  lc.set_column(col::FLUX, VectorXd::Constant(3, 10.0), true);
  lc.set_column(col::DFLUX, Eigen::Map<const VectorXd>(df.data(), 3), true);
  lc.set_mask(std::vector<Mask>(3, 0));

  const auto avg = make_averager().average(lc, 0x1);
  REQUIRE(avg.size() == 1);
  REQUIRE(avg.column(col::NGOOD)[0] == Approx(3.0));
  REQUIRE(avg.column(col::MJD)[0] == Approx(60000.4));
}

TEST_CASE("outlier_rows_are_clipped_and_flagged") {
  const std::vector<double> t{60000.1, 60000.2, 60000.3, 60000.4, 60000.5};
  const std::vector<double> f{10, 10, 10, 10, 100};
  core::LightCurve lc(0, "o");
  lc.set_column(col::MJD, Eigen::Map<const VectorXd>(t.data(), 5), true);
  lc.set_column(col::FLUX, Eigen::Map<const VectorXd>(f.data(), 5), true);
  lc.set_column(col::DFLUX, VectorXd::Constant(5, 1.0), true);
  lc.set_mask(std::vector<Mask>(5, 0));

  const auto avg = make_averager().average(lc, 0x1);
  REQUIRE(avg.size() == 1);
  REQUIRE(avg.column(col::NCLIP)[0] == Approx(1.0));
  REQUIRE(avg.column(col::FLUX)[0] == Approx(10.0));
  REQUIRE(avg.mask()[0] == 0u);
  REQUIRE(lc.mask()[4] == kIxclip);
  REQUIRE(lc.mask()[0] == 0u);
}

TEST_CASE("averaging_twice_gives_the_same_masks") {
  auto lc = make_lc();
  const auto averager = make_averager();
  averager.average(lc, 0x1);
  const auto first = lc.mask();
  averager.average(lc, 0x1);
  REQUIRE(lc.mask() == first);
}

TEST_CASE("average_supernova_reports_flagged_transient_bins") {
  core::Supernova sn("2023abc", "o");
  sn.add(make_lc());
  auto ctrl = make_lc();
  ctrl.set_control_index(1);
  sn.add(ctrl);

  const auto result = averaging::average_supernova(sn, make_averager(), 0x1);
  REQUIRE(result.sn.num_controls() == 1);
  REQUIRE(result.sn.transient().size() == 4);
  // Bins 1, 2 and 3 carry an averaging flag
  REQUIRE(result.percent == Approx(75.0));
}

TEST_CASE("faint_flux_becomes_an_upper_limit") {
  core::LightCurve lc(0, "o");
  VectorXd f(2);
  f << 100.0, 2.0;
  lc.set_column(col::FLUX, f, true);
  lc.set_column(col::DFLUX, VectorXd::Constant(2, 1.0), true);
  averaging::flux_to_mag_columns(lc, 3.0);

  REQUIRE(lc.column(col::MAG)[0] == Approx(18.9));
  REQUIRE_FALSE(std::isnan(lc.column(col::DMAG)[0]));
  REQUIRE(lc.column(col::MAG)[1] == Approx(23.9 - 2.5 * std::log10(3.0)));
  REQUIRE(std::isnan(lc.column(col::DMAG)[1]));
}
