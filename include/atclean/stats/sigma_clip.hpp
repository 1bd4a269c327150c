#pragma once

#include "atclean/core/types.hpp"

#include <vector>

namespace atclean::stats {

struct SigmaClipOptions {
    double nsigma = 3.0;
    int max_iterations = 10;
    bool median_first_iteration = true;
};

struct SigmaClipResult {
    bool has_data = false;  // false if no usable point was supplied
    bool converged = false;
    int iterations = 0;

    double mean = kNaN;
    double mean_err = kNaN;
    double stdev = kNaN;
    double x2norm = kNaN;

    size_t n_good = 0;   // kept
    size_t n_clip = 0;   // clipped by the iteration
    size_t n_mask = 0;   // excluded by the caller
    size_t n_nan = 0;    // missing value or uncertainty

    IndexList ix_good;
    IndexList ix_clip;

    size_t n_excluded() const { return n_mask + n_nan; }
};

// Iterative sigma-clipped average. With uncertainties, points farther than
// nsigma * uncertainty from the center are clipped and the mean is inverse-
// variance weighted; without, the clip radius is nsigma * sample stdev.
// `noise` may be empty; `excluded` may be empty or one entry per value.
SigmaClipResult sigma_clip(const VectorXd& values, const VectorXd& noise,
                           const std::vector<bool>& excluded,
                           const SigmaClipOptions& options = {});

// Convenience for a subset of rows of longer columns
SigmaClipResult sigma_clip_rows(const VectorXd& values, const VectorXd& noise,
                                const IndexList& rows, const IndexList& excluded_rows,
                                const SigmaClipOptions& options = {});

} // namespace atclean::stats
