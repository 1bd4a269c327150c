#pragma once

#include "atclean/core/lightcurve.hpp"

#include <optional>
#include <string>

namespace atclean::io {

// Identity of a light curve file
struct LcId {
    std::string tnsname;
    std::string filter = "o";
    int control_index = 0;
    std::optional<double> bin_size;  // averaged light curves
    bool cleaned = false;
};

// <dir>/<name>[/controls]/<name>[_iNNN].<filter>[.<bin>days][.clean].lc.txt
fs::path lc_filename(const fs::path& dir, const LcId& id);

// Loads a whitespace table. Requires MJD, uJy and duJy (MJDbin, uJy, duJy
// and Mask for averaged light curves); adds a zero Mask if absent.
core::LightCurve load_lc(const fs::path& path, int control_index, const std::string& filter,
                         std::optional<double> bin_size = std::nullopt);
core::LightCurve load_lc(const fs::path& dir, const LcId& id);

// Writes the persisted columns, optionally only `rows`. Throws IOError if
// the file exists and `overwrite` is false.
void save_lc(const core::LightCurve& lc, const fs::path& path, bool overwrite,
             const IndexList* rows = nullptr);
void save_lc(const core::LightCurve& lc, const fs::path& dir, const LcId& id, bool overwrite,
             const IndexList* rows = nullptr);

struct LoadOptions {
    std::string filter = "o";
    int num_controls = 0;
    // Missing control files tolerated while looking for num_controls controls
    int max_missing_controls = 4;
    std::optional<double> bin_size;
    bool cleaned = false;
};

// Transient plus controls 1, 2, ... until num_controls are loaded
core::Supernova load_supernova(const fs::path& dir, const std::string& tnsname,
                               const LoadOptions& options);

void save_supernova(const core::Supernova& sn, const fs::path& dir, bool overwrite,
                    bool cleaned, std::optional<double> bin_size = std::nullopt);

} // namespace atclean::io
