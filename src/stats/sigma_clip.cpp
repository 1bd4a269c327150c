#include "atclean/stats/sigma_clip.hpp"
#include "atclean/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace atclean::stats {

namespace {

struct Moments {
    double mean = kNaN;
    double mean_err = kNaN;
    double stdev = kNaN;
    double x2norm = kNaN;
};

Moments compute_moments(const VectorXd& values, const VectorXd& noise, const IndexList& use) {
    Moments m;
    const size_t n = use.size();
    if (n == 0) return m;
    const bool weighted = noise.size() > 0;

    if (weighted) {
        double sw = 0.0;
        double swx = 0.0;
        for (size_t i : use) {
            const auto k = static_cast<Eigen::Index>(i);
            const double w = 1.0 / (noise[k] * noise[k]);
            sw += w;
            swx += w * values[k];
        }
        m.mean = swx / sw;
        m.mean_err = std::sqrt(1.0 / sw);
    } else {
        double sum = 0.0;
        for (size_t i : use) sum += values[static_cast<Eigen::Index>(i)];
        m.mean = sum / static_cast<double>(n);
    }

    if (n > 1) {
        double ss = 0.0;
        double x2 = 0.0;
        for (size_t i : use) {
            const auto k = static_cast<Eigen::Index>(i);
            const double d = values[k] - m.mean;
            ss += d * d;
            if (weighted) x2 += (d / noise[k]) * (d / noise[k]);
        }
        m.stdev = std::sqrt(ss / static_cast<double>(n - 1));
        if (weighted) {
            m.x2norm = x2 / static_cast<double>(n - 1);
        } else {
            m.mean_err = m.stdev / std::sqrt(static_cast<double>(n - 1));
        }
    }
    return m;
}

} // namespace

SigmaClipResult sigma_clip(const VectorXd& values, const VectorXd& noise,
                           const std::vector<bool>& excluded,
                           const SigmaClipOptions& options) {
    SigmaClipResult r;
    const size_t n = static_cast<size_t>(values.size());
    const bool weighted = noise.size() > 0;

    IndexList valid;
    valid.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const auto k = static_cast<Eigen::Index>(i);
        if (!excluded.empty() && excluded[i]) {
            ++r.n_mask;
            continue;
        }
        if (std::isnan(values[k]) ||
            (weighted && (std::isnan(noise[k]) || !(noise[k] > 0.0)))) {
            ++r.n_nan;
            continue;
        }
        valid.push_back(i);
    }

    if (valid.empty()) {
        return r;
    }
    r.has_data = true;

    IndexList kept = valid;
    for (int it = 0; it < options.max_iterations; ++it) {
        const Moments m = compute_moments(values, noise, kept);
        double center = m.mean;
        if (it == 0 && options.median_first_iteration) {
            center = core::median_of(values, kept);
        }
        r.iterations = it + 1;

        if (!weighted && !(m.stdev > 0.0)) {
            r.converged = true;
            break;
        }

        IndexList new_kept;
        new_kept.reserve(valid.size());
        for (size_t i : valid) {
            const auto k = static_cast<Eigen::Index>(i);
            const double radius = options.nsigma * (weighted ? noise[k] : m.stdev);
            if (std::abs(values[k] - center) <= radius) {
                new_kept.push_back(i);
            }
        }

        if (new_kept.empty()) {
            // Nothing within the clip radius; keep the last iterate
            break;
        }
        if (new_kept == kept) {
            r.converged = true;
            break;
        }
        kept.swap(new_kept);
    }

    const Moments m = compute_moments(values, noise, kept);
    r.mean = m.mean;
    r.mean_err = m.mean_err;
    r.stdev = m.stdev;
    r.x2norm = m.x2norm;
    r.ix_good = kept;
    r.ix_clip = core::index_not(valid, kept);
    r.n_good = r.ix_good.size();
    r.n_clip = r.ix_clip.size();
    return r;
}

SigmaClipResult sigma_clip_rows(const VectorXd& values, const VectorXd& noise,
                                const IndexList& rows, const IndexList& excluded_rows,
                                const SigmaClipOptions& options) {
    const bool weighted = noise.size() > 0;
    VectorXd v(static_cast<Eigen::Index>(rows.size()));
    VectorXd dv(weighted ? static_cast<Eigen::Index>(rows.size()) : 0);
    std::vector<bool> excluded(rows.size(), false);

    for (size_t j = 0; j < rows.size(); ++j) {
        const auto k = static_cast<Eigen::Index>(rows[j]);
        v[static_cast<Eigen::Index>(j)] = values[k];
        if (weighted) dv[static_cast<Eigen::Index>(j)] = noise[k];
        excluded[j] = std::binary_search(excluded_rows.begin(), excluded_rows.end(), rows[j]);
    }

    SigmaClipResult r = sigma_clip(v, dv, excluded, options);
    for (auto& i : r.ix_good) i = rows[i];
    for (auto& i : r.ix_clip) i = rows[i];
    return r;
}

} // namespace atclean::stats
