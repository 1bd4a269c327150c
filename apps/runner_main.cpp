#include "atclean/config/configuration.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/events.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/io/sninfo.hpp"
#include "atclean/pipeline/cleaning.hpp"
#include "atclean/pipeline/simdetec.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using atclean::Phase;
using atclean::runner::TeeBuf;

namespace {

// Restores std::cout's buffer when the run ends
class CoutRedirect {
public:
  explicit CoutRedirect(std::streambuf *buf) : old_(std::cout.rdbuf(buf)) {}
  ~CoutRedirect() { std::cout.rdbuf(old_); }

  CoutRedirect(const CoutRedirect &) = delete;
  CoutRedirect &operator=(const CoutRedirect &) = delete;

  std::streambuf *original() const { return old_; }

private:
  std::streambuf *old_;
};

struct CommandOptions {
  std::string config_path;
  std::string runs_dir = "runs";
  std::vector<std::string> names;
  std::vector<std::string> filters;
  std::string sninfo_file;
  int workers = 0;
};

enum class Command { CLEAN, SIMDETEC, EFFICIENCY };

std::string command_name(Command command) {
  switch (command) {
  case Command::CLEAN:
    return "clean";
  case Command::SIMDETEC:
    return "simdetec";
  case Command::EFFICIENCY:
    return "efficiency";
  }
  return "unknown";
}

int run_command(Command command, const CommandOptions &opts) {
  using namespace atclean;

  fs::path cfg_path(opts.config_path);
  if (!fs::exists(cfg_path)) {
    std::cerr << "Error: Config file not found: " << opts.config_path << std::endl;
    return 1;
  }

  config::Config cfg;
  try {
    cfg = config::Config::load(cfg_path);
    if (!opts.filters.empty())
      cfg.input.filters = opts.filters;
    if (!opts.sninfo_file.empty())
      cfg.input.sninfo_file = opts.sninfo_file;
    if (opts.workers > 0)
      cfg.runtime.parallel_workers = opts.workers;
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  io::SnInfoTable sninfo;
  try {
    sninfo = io::SnInfoTable::load(cfg.input.sninfo_file);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const std::vector<std::string> names =
      runner::resolve_object_names(opts.names, sninfo);
  if (names.empty()) {
    std::cerr << "Error: No objects given and " << cfg.input.sninfo_file
              << " lists none" << std::endl;
    return 1;
  }

  std::string run_id = core::get_run_id();
  fs::path run_dir = fs::path(opts.runs_dir) / run_id;
  fs::create_directories(run_dir / "logs");
  cfg.save(run_dir / "config.yaml");

  std::ofstream run_log_file(run_dir / "logs" / "run.log");
  TeeBuf stdout_tee(std::cout.rdbuf(), run_log_file.rdbuf());
  CoutRedirect redirect(&stdout_tee);

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl");
  TeeBuf tee_buf(redirect.original(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  const std::string config_sha256 = core::sha256_file(cfg_path);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"command", command_name(command)},
                     {"config_path", opts.config_path},
                     {"config_sha256", config_sha256},
                     {"sninfo_file", cfg.input.sninfo_file},
                     {"sninfo_sha256", runner::sha256_if_exists(cfg.input.sninfo_file)},
                     {"run_dir", run_dir.string()},
                     {"objects", names.size()},
                     {"filters", cfg.input.filters}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Objects: " << names.size() << std::endl;
  std::cout << "Output: " << cfg.input.output_dir << std::endl;

  std::vector<pipeline::ObjectResult> results;
  try {
    if (command == Command::CLEAN) {
      pipeline::CleaningPipeline cleaning(cfg, emitter, run_id, log_file);
      std::cout << "[CLEAN] Cut order: "
                << core::join(cleaning.cut_list().application_order(), " -> ")
                << std::endl;
      results = cleaning.run(names, sninfo);
      if (sninfo.size() > 0)
        sninfo.save(cfg.input.sninfo_file);
    } else {
      pipeline::SimDetecPipeline simdetec(cfg, emitter, run_id, log_file);
      const bool simulate = command == Command::SIMDETEC;
      for (const auto &name : names) {
        for (const auto &filter : cfg.input.filters) {
          results.push_back(simdetec.run_object(name, filter, simulate));
          if (!results.back().success && cfg.pipeline.abort_on_fail)
            break;
        }
        if (!results.empty() && !results.back().success &&
            cfg.pipeline.abort_on_fail)
          break;
      }
    }
  } catch (const std::exception &e) {
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  size_t n_failed = 0;
  for (const auto &r : results) {
    if (!r.success)
      ++n_failed;
  }

  try {
    pipeline::write_manifest(run_dir / "run_manifest.json", run_id,
                             command_name(command), config_sha256, results);
  } catch (const std::exception &e) {
    emitter.warning(run_id, std::string("Could not write run manifest: ") + e.what(),
                    log_file);
  }

  std::cout << "Done: " << (results.size() - n_failed) << " of " << results.size()
            << " succeeded" << std::endl;
  emitter.phase_end(run_id, Phase::DONE, n_failed == 0 ? "ok" : "partial",
                    {{"succeeded", results.size() - n_failed}, {"failed", n_failed}},
                    log_file);
  emitter.run_end(run_id, n_failed == 0, n_failed == 0 ? "ok" : "partial", log_file);
  return n_failed == 0 ? 0 : 2;
}

void add_common_options(CLI::App *cmd, CommandOptions &opts) {
  cmd->add_option("--config", opts.config_path, "Path to config.yaml")->required();
  cmd->add_option("--runs-dir", opts.runs_dir, "Runs directory")->default_val("runs");
  cmd->add_option("--names,-n", opts.names, "TNS names (default: all in the SN info table)");
  cmd->add_option("--filters,-f", opts.filters, "ATLAS filters (o, c)");
  cmd->add_option("--sninfo", opts.sninfo_file, "SN info table");
  cmd->add_option("--workers", opts.workers, "Parallel workers (0 = from config)");
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"ATLAS light curve cleaning and bump detection"};
  app.require_subcommand(1);

  CommandOptions clean_opts;
  CommandOptions simdetec_opts;
  CommandOptions efficiency_opts;

  auto clean_cmd = app.add_subcommand("clean", "Apply cuts and average light curves");
  add_common_options(clean_cmd, clean_opts);

  auto simdetec_cmd = app.add_subcommand(
      "simdetec", "Simulate injected bumps on the control light curves");
  add_common_options(simdetec_cmd, simdetec_opts);

  auto efficiency_cmd = app.add_subcommand(
      "efficiency", "Detection efficiencies from saved simulation tables");
  add_common_options(efficiency_cmd, efficiency_opts);

  CLI11_PARSE(app, argc, argv);

  if (clean_cmd->parsed()) {
    return run_command(Command::CLEAN, clean_opts);
  }
  if (simdetec_cmd->parsed()) {
    return run_command(Command::SIMDETEC, simdetec_opts);
  }
  if (efficiency_cmd->parsed()) {
    return run_command(Command::EFFICIENCY, efficiency_opts);
  }

  std::cout << app.help() << std::endl;
  return 1;
}
