#include "runner_shared.hpp"

#include "atclean/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace atclean;

TEST_CASE("tee_buf_copies_to_both_buffers") {
  std::stringbuf a;
  std::stringbuf b;
  runner::TeeBuf tee(&a, &b);
  std::ostream out(&tee);
  out << "Run ID: 42" << '\n' << std::flush;
  REQUIRE(a.str() == "Run ID: 42\n");
  REQUIRE(b.str() == "Run ID: 42\n");
}

TEST_CASE("tee_buf_keeps_lines_intact_under_concurrent_log_lines") {
  std::stringbuf a;
  std::stringbuf b;
  runner::TeeBuf tee(&a, &b);
  std::ostream out(&tee);

  const int n_threads = 6;
  const int n_lines = 150;
  std::vector<std::thread> workers;
  for (int t = 0; t < n_threads; ++t) {
    workers.emplace_back([&out, t]() {
      for (int i = 0; i < n_lines; ++i) {
        core::LogLine(out) << "[CLEAN] object_" << t << " step " << i << " ok";
      }
    });
  }
  for (auto &w : workers) {
    w.join();
  }

  REQUIRE(a.str() == b.str());
  std::istringstream in(a.str());
  std::string line;
  int count = 0;
  while (std::getline(in, line)) {
    REQUIRE(core::starts_with(line, "[CLEAN] object_"));
    REQUIRE(core::ends_with(line, " ok"));
    ++count;
  }
  REQUIRE(count == n_threads * n_lines);
}

TEST_CASE("resolve_object_names_prefers_command_line") {
  io::SnInfoTable sninfo;
  io::SnInfo info;
  info.tnsname = "2023ixf";
  sninfo.update(info);
  info.tnsname = "2024abc";
  sninfo.update(info);

  const auto given = runner::resolve_object_names({" 2020lse ", "2020lse", ""}, sninfo);
  REQUIRE(given == std::vector<std::string>{"2020lse"});

  const auto all = runner::resolve_object_names({}, sninfo);
  REQUIRE(all == std::vector<std::string>{"2023ixf", "2024abc"});
}
