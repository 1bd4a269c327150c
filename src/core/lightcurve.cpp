#include "atclean/core/lightcurve.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace atclean::core {

LightCurve::LightCurve(int control_index, std::string filter)
    : control_index_(control_index), filter_(std::move(filter)) {}

bool LightCurve::has_column(const std::string& name) const {
    return data_.count(name) > 0;
}

const VectorXd& LightCurve::column(const std::string& name) const {
    auto it = data_.find(name);
    if (it == data_.end()) {
        throw ValidationError("light curve " + std::to_string(control_index_) +
                              " has no column '" + name + "'");
    }
    return it->second.values;
}

void LightCurve::check_length(const std::string& name, size_t n) {
    if (data_.empty() && mask_.empty()) {
        n_rows_ = n;
        return;
    }
    if (n != n_rows_) {
        throw ValidationError("column '" + name + "' has " + std::to_string(n) +
                              " rows, expected " + std::to_string(n_rows_));
    }
}

const VectorXd& LightCurve::bin_times() const {
    if (!binned_) {
        throw ValidationError("light curve " + std::to_string(control_index_) +
                              " is not binned");
    }
    return column(col::MJDBIN);
}

void LightCurve::set_injection(InjectionState state) {
    if (static_cast<size_t>(state.flux.size()) != n_rows_) {
        throw ValidationError("injected flux has " + std::to_string(state.flux.size()) +
                              " rows, expected " + std::to_string(n_rows_));
    }
    injection_ = std::move(state);
}

void LightCurve::set_binned(double bin_size) {
    if (!(bin_size > 0.0)) {
        throw ValidationError("bin size must be > 0");
    }
    binned_ = true;
    bin_size_ = bin_size;
}

void LightCurve::set_column(const std::string& name, VectorXd values, bool persist) {
    if (name == col::MASK) {
        throw ValidationError("the Mask column is set through set_mask()");
    }
    check_length(name, static_cast<size_t>(values.size()));
    auto it = data_.find(name);
    if (it != data_.end()) {
        it->second.values = std::move(values);
        if (persist && !it->second.persist) {
            it->second.persist = true;
            columns_.push_back(name);
        }
        return;
    }
    Column c;
    c.values = std::move(values);
    c.persist = persist;
    data_.emplace(name, std::move(c));
    if (persist) columns_.push_back(name);
}

void LightCurve::set_raw_column(const std::string& name, VectorXd values,
                                std::vector<std::string> cells) {
    if (cells.size() != static_cast<size_t>(values.size())) {
        throw ValidationError("column '" + name + "' cell count mismatch");
    }
    set_column(name, std::move(values), true);
    data_[name].raw = std::move(cells);
}

void LightCurve::set_mask(std::vector<Mask> values, std::vector<std::string> cells) {
    if (!cells.empty() && cells.size() != values.size()) {
        throw ValidationError("Mask cell count mismatch");
    }
    check_length(col::MASK, values.size());
    mask_ = std::move(values);
    mask_raw_ = std::move(cells);
    if (std::find(columns_.begin(), columns_.end(), col::MASK) == columns_.end()) {
        columns_.push_back(col::MASK);
    }
}

void LightCurve::ensure_mask() {
    if (std::find(columns_.begin(), columns_.end(), col::MASK) == columns_.end()) {
        set_mask(std::vector<Mask>(n_rows_, 0));
    }
}

void LightCurve::drop_extra_columns() {
    for (auto it = data_.begin(); it != data_.end();) {
        if (!it->second.persist) {
            it = data_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string LightCurve::cell_text(const std::string& name, size_t row) const {
    if (name == col::MASK) {
        if (row < mask_raw_.size() && !mask_raw_[row].empty()) {
            auto parsed = parse_mask(mask_raw_[row]);
            if (parsed && *parsed == mask_[row]) return mask_raw_[row];
        }
        return format_hex(mask_[row]);
    }

    const Column& c = data_.at(name);
    const double v = c.values[static_cast<Eigen::Index>(row)];
    if (row < c.raw.size() && !c.raw[row].empty()) {
        const std::string& raw = c.raw[row];
        auto parsed = parse_double(raw);
        if (!parsed) {
            // Text cell (e.g. observation id)
            if (std::isnan(v)) return raw;
        } else if (*parsed == v || (std::isnan(*parsed) && std::isnan(v))) {
            return raw;
        }
    }
    return format_double(v);
}

void LightCurve::set_dflux_column(const std::string& name) {
    if (!has_column(name)) {
        throw ValidationError("cannot use missing column '" + name + "' as uncertainty");
    }
    dflux_column_ = name;
}

IndexList LightCurve::ix_unmasked(Mask flags) const {
    IndexList out;
    out.reserve(n_rows_);
    for (size_t i = 0; i < mask_.size(); ++i) {
        if ((mask_[i] & flags) == 0) out.push_back(i);
    }
    return out;
}

IndexList LightCurve::ix_inrange(const std::string& name, std::optional<double> lower,
                                 std::optional<double> upper, const IndexList* subset) const {
    const VectorXd& v = column(name);
    IndexList out;
    auto test = [&](size_t i) {
        const double x = v[static_cast<Eigen::Index>(i)];
        if (std::isnan(x)) return;
        if (lower && x < *lower) return;
        if (upper && x > *upper) return;
        out.push_back(i);
    };
    if (subset) {
        for (size_t i : *subset) test(i);
    } else {
        for (size_t i = 0; i < n_rows_; ++i) test(i);
    }
    return out;
}

void LightCurve::select_rows(const IndexList& ix) {
    std::vector<std::optional<size_t>> source(ix.begin(), ix.end());
    reindex(source, VectorXd());
}

void LightCurve::sort_by_time() {
    if (!has_column(col::MJD)) return;
    const VectorXd& t = column(col::MJD);
    IndexList order = index_range(n_rows_);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return t[static_cast<Eigen::Index>(a)] < t[static_cast<Eigen::Index>(b)];
    });
    select_rows(order);
}

void LightCurve::reindex(const std::vector<std::optional<size_t>>& source,
                         const VectorXd& times) {
    const size_t n = source.size();
    for (auto& [name, c] : data_) {
        VectorXd values(static_cast<Eigen::Index>(n));
        std::vector<std::string> raw;
        if (!c.raw.empty()) raw.resize(n);
        for (size_t i = 0; i < n; ++i) {
            if (source[i]) {
                values[static_cast<Eigen::Index>(i)] = c.values[static_cast<Eigen::Index>(*source[i])];
                if (!c.raw.empty()) raw[i] = c.raw[*source[i]];
            } else {
                values[static_cast<Eigen::Index>(i)] =
                    (name == col::MJD && times.size() > 0) ? times[static_cast<Eigen::Index>(i)] : kNaN;
            }
        }
        c.values = std::move(values);
        c.raw = std::move(raw);
    }

    std::vector<Mask> mask(n, 0);
    std::vector<std::string> mask_raw;
    if (!mask_raw_.empty()) mask_raw.resize(n);
    for (size_t i = 0; i < n; ++i) {
        if (!source[i]) continue;
        if (*source[i] < mask_.size()) mask[i] = mask_[*source[i]];
        if (!mask_raw_.empty()) mask_raw[i] = mask_raw_[*source[i]];
    }
    if (std::find(columns_.begin(), columns_.end(), col::MASK) != columns_.end()) {
        mask_ = std::move(mask);
        mask_raw_ = std::move(mask_raw);
    }
    if (injection_) injection_.reset();
    n_rows_ = n;
}

Supernova::Supernova(std::string tnsname, std::string filter)
    : tnsname_(std::move(tnsname)), filter_(std::move(filter)) {}

void Supernova::add(LightCurve lc) {
    const int idx = lc.control_index();
    if (idx < 0) {
        throw ValidationError("control index must be >= 0, got " + std::to_string(idx));
    }
    lc.set_filter(filter_);
    lcs_[idx] = std::move(lc);
}

bool Supernova::has(int control_index) const {
    return lcs_.count(control_index) > 0;
}

LightCurve& Supernova::lc(int control_index) {
    auto it = lcs_.find(control_index);
    if (it == lcs_.end()) {
        throw ValidationError(tnsname_ + ": no light curve with control index " +
                              std::to_string(control_index));
    }
    return it->second;
}

const LightCurve& Supernova::lc(int control_index) const {
    auto it = lcs_.find(control_index);
    if (it == lcs_.end()) {
        throw ValidationError(tnsname_ + ": no light curve with control index " +
                              std::to_string(control_index));
    }
    return it->second;
}

std::vector<int> Supernova::control_indices() const {
    std::vector<int> out;
    for (const auto& [idx, lc] : lcs_) {
        if (idx > 0) out.push_back(idx);
    }
    return out;
}

size_t Supernova::num_controls() const {
    return control_indices().size();
}

void Supernova::align_controls() {
    if (!has(0)) {
        throw AlignmentError(tnsname_ + ": transient light curve missing");
    }
    LightCurve& sn = transient();
    sn.sort_by_time();
    const VectorXd& t = sn.time();

    std::unordered_map<double, size_t> position;
    for (Eigen::Index i = 0; i < t.size(); ++i) {
        if (std::isnan(t[i])) {
            throw AlignmentError(tnsname_ + ": transient row " + std::to_string(i) +
                                 " has no MJD");
        }
        if (!position.emplace(t[i], static_cast<size_t>(i)).second) {
            throw AlignmentError(tnsname_ + ": duplicate transient MJD " + format_double(t[i]));
        }
    }

    for (int idx : control_indices()) {
        LightCurve& ctrl = lc(idx);
        const VectorXd& ct = ctrl.time();
        std::vector<std::optional<size_t>> source(static_cast<size_t>(t.size()));
        for (Eigen::Index i = 0; i < ct.size(); ++i) {
            // Control-only epochs are dropped
            auto it = position.find(ct[i]);
            if (it == position.end()) continue;
            if (source[it->second]) {
                throw AlignmentError(tnsname_ + ": control " + std::to_string(idx) +
                                     " has duplicate MJD " + format_double(ct[i]));
            }
            source[it->second] = static_cast<size_t>(i);
        }
        ctrl.reindex(source, t);
    }
}

void prepare_for_cleaning(LightCurve& lc) {
    lc.set_mask(std::vector<Mask>(lc.size(), 0));

    const VectorXd& flux = lc.flux();
    const VectorXd& dflux = lc.column(col::DFLUX);
    IndexList keep;
    keep.reserve(lc.size());
    for (size_t i = 0; i < lc.size(); ++i) {
        const auto k = static_cast<Eigen::Index>(i);
        if (dflux[k] == 0.0 || std::isnan(flux[k])) continue;
        keep.push_back(i);
    }
    if (keep.size() != lc.size()) lc.select_rows(keep);

    for (const std::string& name : lc.columns()) {
        if (name == col::MASK || !lc.has_column(name)) continue;
        VectorXd v = lc.column(name);
        bool changed = false;
        for (Eigen::Index i = 0; i < v.size(); ++i) {
            if (std::isinf(v[i])) {
                v[i] = kNaN;
                changed = true;
            }
        }
        if (changed) lc.set_column(name, std::move(v), true);
    }

    VectorXd snr = lc.flux().cwiseQuotient(lc.dflux());
    lc.set_column(col::SNR, std::move(snr));
}

void prepare_for_cleaning(Supernova& sn) {
    for (auto& [idx, lc] : sn.lcs()) {
        prepare_for_cleaning(lc);
    }
    sn.align_controls();
}

} // namespace atclean::core
