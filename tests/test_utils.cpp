#include "atclean/core/utils.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace atclean;
using Catch::Approx;

TEST_CASE("median_skips_nan") {
  REQUIRE(core::median_of({3.0, 1.0, 2.0}) == Approx(2.0));
  REQUIRE(core::median_of({4.0, 1.0, 3.0, 2.0}) == Approx(2.5));
  REQUIRE(core::median_of({kNaN, 5.0}) == Approx(5.0));
  REQUIRE(std::isnan(core::median_of(std::vector<double>{})));

  VectorXd data(5);
  data << 10, 1, 7, 3, 100;
  REQUIRE(core::median_of(data, {1, 2, 3}) == Approx(3.0));
  REQUIRE(core::mean_of(data, {0, 2}) == Approx(8.5));
}

TEST_CASE("linear_interpolation_fills_outside_the_range") {
  VectorXd x(3), y(3), at(5);
  x << 0, 1, 3;
  y << 0, 10, 30;
  at << -1, 0.5, 2, 3, 4;
  const VectorXd out = core::interp_linear(x, y, at, 0.0);
  REQUIRE(out[0] == 0.0);
  REQUIRE(out[1] == Approx(5.0));
  REQUIRE(out[2] == Approx(20.0));
  REQUIRE(out[3] == Approx(30.0));
  REQUIRE(out[4] == 0.0);
}

TEST_CASE("magnitudes_and_fluxes") {
  REQUIRE(core::mag_to_flux(23.9) == Approx(1.0));
  REQUIRE(core::mag_to_flux(18.9) == Approx(100.0));
  REQUIRE(core::flux_to_mag(100.0) == Approx(18.9));
  REQUIRE(std::isnan(core::flux_to_mag(0.0)));
  REQUIRE(std::isnan(core::flux_to_mag(-3.0)));
}

TEST_CASE("index_set_operations") {
  const IndexList a{0, 1, 2, 5, 7};
  const IndexList b{1, 5, 6};
  REQUIRE(core::index_and(a, b) == IndexList{1, 5});
  REQUIRE(core::index_not(a, b) == IndexList{0, 2, 7});
  REQUIRE(core::index_range(3) == IndexList{0, 1, 2});
}

TEST_CASE("mask_parsing_accepts_hex_decimal_and_float_text") {
  REQUIRE(*core::parse_mask("0x800000") == 0x800000u);
  REQUIRE(*core::parse_mask("16") == 16u);
  REQUIRE(*core::parse_mask(" 0 ") == 0u);
  REQUIRE(*core::parse_mask("2.0") == 2u);
  REQUIRE_FALSE(core::parse_mask("2.5").has_value());
  REQUIRE_FALSE(core::parse_mask("flag").has_value());
  REQUIRE_FALSE(core::parse_mask("").has_value());
}

TEST_CASE("number_formatting") {
  REQUIRE(core::format_double(5.0) == "5");
  REQUIRE(core::format_double(0.1) == "0.1");
  REQUIRE(core::format_double(60000.123) == "60000.123");
  REQUIRE(core::format_double(kNaN) == "NaN");
  REQUIRE(core::format_fixed(17.5, 2) == "17.50");
  REQUIRE(core::format_hex(0x400000) == "0x400000");
  REQUIRE(std::isnan(*core::parse_double("nan")));
  REQUIRE_FALSE(core::parse_double("12abc").has_value());
}

TEST_CASE("string_helpers") {
  REQUIRE(core::trim("  a b \n") == "a b");
  REQUIRE(core::split_whitespace(" a  b\tc ") == std::vector<std::string>{"a", "b", "c"});
  REQUIRE(core::join({"a", "b"}, ",") == "a,b");
  REQUIRE(core::starts_with("pct_detec_3.00", "pct_detec_"));
  REQUIRE(core::ends_with("x.lc.txt", ".lc.txt"));
}

TEST_CASE("log_line_writes_whole_lines_from_threads") {
  std::ostringstream out;
  const int n_threads = 8;
  const int n_lines = 200;
  std::vector<std::thread> workers;
  for (int t = 0; t < n_threads; ++t) {
    workers.emplace_back([&out, t]() {
      for (int i = 0; i < n_lines; ++i) {
        core::LogLine(out) << "[worker " << t << "] line " << i << " done";
      }
    });
  }
  for (auto &w : workers) {
    w.join();
  }

  std::istringstream in(out.str());
  std::string line;
  int count = 0;
  while (std::getline(in, line)) {
    REQUIRE(core::starts_with(line, "[worker "));
    REQUIRE(core::ends_with(line, " done"));
    ++count;
  }
  REQUIRE(count == n_threads * n_lines);
}
