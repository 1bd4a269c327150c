#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/io/lc_table.hpp"
#include "atclean/io/sninfo.hpp"
#include "atclean/io/text_table.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace atclean;
using Catch::Approx;

namespace {

const char *kLcText = "MJD uJy duJy F\n"
                      "60000.10 12.50 2.0 o\n"
                      "60001.10 -3.00 2.5 o\n"
                      "60002.10 40.00 3.0 o\n";

struct TempDir {
  fs::path path;
  explicit TempDir(const std::string &name)
      : path(fs::temp_directory_path() / name) {
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempDir() { fs::remove_all(path); }
};

void write_lc(const fs::path &dir, const io::LcId &id, const std::string &text) {
  const fs::path path = io::lc_filename(dir, id);
  fs::create_directories(path.parent_path());
  core::write_text(path, text);
}

} // namespace

TEST_CASE("light_curve_file_names") {
  const fs::path dir("/data");
  REQUIRE(io::lc_filename(dir, {"2020abc", "c"}) == fs::path("/data/2020abc/2020abc.c.lc.txt"));
  REQUIRE(io::lc_filename(dir, {"2020abc", "o", 1, 1.0, true}) ==
          fs::path("/data/2020abc/controls/2020abc_i001.o.1.00days.clean.lc.txt"));
  REQUIRE(io::lc_filename(dir, {"2020abc", "o", 12, std::nullopt, true}) ==
          fs::path("/data/2020abc/controls/2020abc_i012.o.clean.lc.txt"));
}

TEST_CASE("light_curves_keep_unchanged_cells") {
  TempDir tmp("atclean_test_lc_io");
  write_lc(tmp.path, {"2020abc", "o"}, kLcText);

  auto lc = io::load_lc(tmp.path, {"2020abc", "o"});
  REQUIRE(lc.size() == 3);
  REQUIRE(lc.flux()[1] == Approx(-3.0));
  REQUIRE(lc.columns().back() == col::MASK);
  REQUIRE(lc.cell_text(col::FLUX, 0) == "12.50");
  REQUIRE(lc.cell_text("F", 2) == "o");
  REQUIRE(lc.cell_text(col::MASK, 0) == "0x0");

  VectorXd flux = lc.flux();
  flux[0] = 13.0;
  lc.set_column(col::FLUX, flux, true);
  lc.mask()[1] = 0x2;
  REQUIRE(lc.cell_text(col::FLUX, 0) == "13");
  REQUIRE(lc.cell_text(col::FLUX, 1) == "-3.00");

  const fs::path out = tmp.path / "out.lc.txt";
  io::save_lc(lc, out, false);
  const auto table = io::read_table(out);
  REQUIRE(table.header == std::vector<std::string>{"MJD", "uJy", "duJy", "F", "Mask"});
  REQUIRE(table.rows[1][1] == "-3.00");
  REQUIRE(table.rows[1][4] == "0x2");
  REQUIRE_THROWS_AS(io::save_lc(lc, out, false), IOError);

  const IndexList rows{2};
  io::save_lc(lc, out, true, &rows);
  REQUIRE(io::read_table(out).rows.size() == 1);
}

TEST_CASE("light_curves_need_flux_columns") {
  TempDir tmp("atclean_test_lc_missing");
  write_lc(tmp.path, {"2020abc", "o"}, "MJD uJy\n60000.1 1.0\n");
  REQUIRE_THROWS_AS(io::load_lc(tmp.path, {"2020abc", "o"}), IOError);
  REQUIRE_THROWS_AS(io::load_lc(tmp.path, {"2020xyz", "o"}), IOError);

  write_lc(tmp.path, {"2020abc", "o", 0, 1.0}, "MJD uJy duJy\n60000.1 1.0 1.0\n");
  REQUIRE_THROWS_AS(io::load_lc(tmp.path, {"2020abc", "o", 0, 1.0}), IOError);
}

TEST_CASE("supernova_loading_skips_missing_controls") {
  TempDir tmp("atclean_test_lc_sn");
  write_lc(tmp.path, {"2020abc", "o"}, kLcText);
  write_lc(tmp.path, {"2020abc", "o", 1}, kLcText);
  write_lc(tmp.path, {"2020abc", "o", 3}, kLcText);

  io::LoadOptions options;
  options.num_controls = 2;
  const auto sn = io::load_supernova(tmp.path, "2020abc", options);
  REQUIRE(sn.control_indices() == std::vector<int>{1, 3});
  REQUIRE(sn.lc(3).control_index() == 3);

  options.max_missing_controls = 0;
  REQUIRE(io::load_supernova(tmp.path, "2020abc", options).num_controls() == 1);

  options.num_controls = 0;
  REQUIRE(io::load_supernova(tmp.path, "2020abc", options).num_controls() == 0);
}

TEST_CASE("text_tables") {
  const auto t = io::TextTable::parse("# comment\na bb\n\n10 1\n", "test");
  REQUIRE(t.header == std::vector<std::string>{"a", "bb"});
  REQUIRE(t.column("bb") == std::vector<std::string>{"1"});
  REQUIRE(t.to_string() == " a bb\n10  1\n");
  REQUIRE_THROWS_AS(t.column("c"), IOError);
  REQUIRE_THROWS_AS(io::TextTable::parse("a b\n1\n", "test"), IOError);
  REQUIRE_THROWS_AS(io::TextTable::parse("# only comments\n", "test"), IOError);
}

TEST_CASE("sninfo_table") {
  TempDir tmp("atclean_test_sninfo");
  const fs::path path = tmp.path / "snlist.txt";

  REQUIRE(io::SnInfoTable::load(path).size() == 0);

  core::write_text(path, "tnsname ra dec mjd0\n"
                         "2020abc 10:00:00 -20:00:00 60000\n"
                         "2021xyz NaN NaN NaN\n"
                         "2020abc 11:00:00 -21:00:00 60100\n");
  auto table = io::SnInfoTable::load(path);
  REQUIRE(table.size() == 3);

  const auto info = table.get("2020abc");
  REQUIRE(info.has_value());
  REQUIRE(info->coords.ra == "10:00:00");
  REQUIRE(*info->mjd0 == Approx(60000));
  REQUIRE(table.size() == 2);

  const auto unknown = table.get("2021xyz");
  REQUIRE(unknown->coords.is_empty());
  REQUIRE_FALSE(unknown->mjd0.has_value());
  REQUIRE_FALSE(table.get("2022new").has_value());

  table.update({"2021xyz", {"12:00:00", "+01:00:00"}, std::nullopt});
  table.update({"2022new", {}, 60500.0});
  table.save(path);

  auto loaded = io::SnInfoTable::load(path);
  REQUIRE(loaded.size() == 3);
  REQUIRE(loaded.get("2021xyz")->coords.dec == "+01:00:00");
  REQUIRE(*loaded.get("2022new")->mjd0 == Approx(60500));

  core::Supernova sn("2021xyz", "o");
  io::apply_sninfo(sn, loaded);
  REQUIRE(sn.coords().ra == "12:00:00");
  REQUIRE_FALSE(sn.mjd0().has_value());
}
