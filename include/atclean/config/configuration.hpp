#pragma once

#include "atclean/core/types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace atclean::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  std::string mode = "production";
  bool abort_on_fail = false; // abort the batch on the first failed object
};

struct InputConfig {
  std::string lc_dir = "data";
  std::string output_dir = "data";
  std::string sninfo_file = "snlist.txt";
  std::vector<std::string> filters{"o", "c"};
  int num_controls = 8;
  int max_missing_controls = 4;
  bool overwrite = true;
};

struct SigmaClipConfig {
  double nsigma = 3.0;
  int max_iterations = 10;
  bool median_first_iteration = true;
};

struct UncertEstConfig {
  bool enabled = true;
  double temp_x2_max_value = 20.0;
  double apply_min_sigma_extra = 0.0; // sigma_extra must exceed this to be applied
};

struct UncertCutConfig {
  bool enabled = true;
  double max_value = 160.0;
  Mask flag = 0x2;
};

struct X2CutConfig {
  struct LimCutsConfig {
    double stn_bound = 3.0;
    int cut_start = 3;
    int cut_stop = 50;
    int cut_step = 1;
  } limcuts;

  bool enabled = true;
  double max_value = 10.0;
  Mask flag = 0x1;
};

struct ControlsCutConfig {
  bool enabled = true;
  Mask flag = 0x400000;
  Mask questionable_flag = 0x80000;
  Mask x2_flag = 0x100;
  Mask stn_flag = 0x200;
  Mask Nclip_flag = 0x400;
  Mask Ngood_flag = 0x800;
  double x2_max = 2.5;
  double stn_max = 3.0;
  int Nclip_max = 2;
  int Ngood_min = 4;
};

struct AveragingConfig {
  bool enabled = true;
  Mask flag = 0x800000;
  Mask ixclip_flag = 0x1000;
  Mask smallnum_flag = 0x2000;
  Mask nodata_flag = 0x4000;
  double mjd_bin_size = 1.0;
  double x2_max = 4.0;
  int Nclip_max = 1;
  int Ngood_min = 2;
  double flux2mag_sigmalimit = 3.0;
  EmptyBinPolicy empty_bin_policy = EmptyBinPolicy::NO_VALUE;
};

struct CustomCutConfig {
  std::string name;
  std::string column;
  std::optional<double> min_value;
  std::optional<double> max_value;
  Mask flag = 0;
  std::string precedes = "badday_cut";
};

struct CutsConfig {
  UncertEstConfig uncert_est;
  UncertCutConfig uncert_cut;
  X2CutConfig x2_cut;
  ControlsCutConfig controls_cut;
  AveragingConfig averaging;
  std::vector<CustomCutConfig> custom;
  std::vector<std::array<std::string, 2>> order; // extra [before, after] edges
};

struct SimulationConfig {
  struct TemplateConfig {
    std::string filename;
    double sigma = 2.8;
  } template_model;

  struct GaussianConfig {
    double rise_scale = 1.0;
    double decline_scale = 1.0;
  } gaussian;

  std::vector<double> sigma_kerns{5, 15, 25, 40, 80, 130, 200, 300};
  // One list per kernel; std::nullopt selects the empirical template
  std::vector<std::vector<std::optional<double>>> sigma_sims{
      {2, 5, 20, 40, 80, 120},
      {2, 5, 20, 40, 80, 120},
      {2, 5, 20, 40, 80, 120},
      {5, 20, 40, 80, 110, 150, 200, 250},
      {5, 20, 40, 80, 110, 150, 200, 250},
      {20, 40, 80, 110, 150, 200, 250, 300},
      {20, 40, 80, 110, 150, 200, 250, 300},
      {20, 40, 80, 110, 150, 200, 250, 300}};
  double peak_mag_min = 23.0;
  double peak_mag_max = 16.0;
  int n_peaks = 20;
  int iterations = 50000;
  std::vector<int> skip_controls;
  std::vector<Season> seasons;
  Mask flags = 0x800000;
  int max_redraws = 1000;
  uint64_t seed = 42;
};

struct EfficiencyConfig {
  // One list per kernel
  std::vector<std::vector<double>> fom_limits{
      {3, 5}, {4, 6}, {4, 6}, {5, 7}, {6, 8}, {7, 9}, {8, 10}, {9, 11}};
  bool restrict_to_seasons = false;
};

struct RuntimeConfig {
  int parallel_workers = 4;
};

struct Config {
  PipelineConfig pipeline;
  InputConfig input;
  SigmaClipConfig sigma_clip;
  CutsConfig cuts;
  SimulationConfig simulation;
  EfficiencyConfig efficiency;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace atclean::config
