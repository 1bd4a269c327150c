#pragma once

#include "types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace atclean::core {

// Row access and bitmask of a table that cuts can be applied to
class Cuttable {
public:
    virtual ~Cuttable() = default;

    virtual size_t size() const = 0;
    virtual bool has_column(const std::string& name) const = 0;
    virtual const VectorXd& column(const std::string& name) const = 0;
    virtual std::vector<Mask>& mask() = 0;
    virtual const std::vector<Mask>& mask() const = 0;
};

// Time series that can be binned in time
class Averageable : public Cuttable {
public:
    virtual const VectorXd& time() const = 0;
    virtual const VectorXd& flux() const = 0;
    virtual const VectorXd& dflux() const = 0;
    virtual int control_index() const = 0;
    virtual const std::string& filter() const = 0;
};

// Flux added on top of the measured flux for injection-recovery tests
struct InjectionState {
    std::string model;      // "gaussian" or "template"
    double peak_mjd = kNaN;
    double peak_flux = kNaN;
    double width = kNaN;
    VectorXd flux;          // per-row injected flux, zero on excluded rows
};

// Binned series that can receive an injected signal
class Injectable {
public:
    virtual ~Injectable() = default;

    virtual bool binned() const = 0;
    virtual double bin_size() const = 0;
    virtual const VectorXd& bin_times() const = 0;
    virtual const std::optional<InjectionState>& injection() const = 0;
    virtual void set_injection(InjectionState state) = 0;
    virtual void clear_injection() = 0;
};

class LightCurve : public Averageable, public Injectable {
public:
    LightCurve() = default;
    LightCurve(int control_index, std::string filter);

    // Cuttable
    size_t size() const override { return n_rows_; }
    bool has_column(const std::string& name) const override;
    const VectorXd& column(const std::string& name) const override;
    std::vector<Mask>& mask() override { return mask_; }
    const std::vector<Mask>& mask() const override { return mask_; }

    // Averageable
    const VectorXd& time() const override { return column(col::MJD); }
    const VectorXd& flux() const override { return column(col::FLUX); }
    const VectorXd& dflux() const override { return column(dflux_column_); }
    int control_index() const override { return control_index_; }
    const std::string& filter() const override { return filter_; }

    // Injectable
    bool binned() const override { return binned_; }
    double bin_size() const override { return bin_size_; }
    const VectorXd& bin_times() const override;
    const std::optional<InjectionState>& injection() const override { return injection_; }
    void set_injection(InjectionState state) override;
    void clear_injection() override { injection_.reset(); }

    void set_control_index(int index) { control_index_ = index; }
    void set_filter(const std::string& filter) { filter_ = filter; }
    void set_binned(double bin_size);

    bool is_transient() const { return control_index_ == 0; }

    // Persisted columns in file order, "Mask" included
    const std::vector<std::string>& columns() const { return columns_; }

    // Adds or replaces a numeric column. Non-persisted columns are derived
    // values that drop_extra_columns() removes.
    void set_column(const std::string& name, VectorXd values, bool persist = false);
    // Column parsed from text cells; the cells are kept for writing back unchanged
    void set_raw_column(const std::string& name, VectorXd values,
                        std::vector<std::string> cells);
    void set_mask(std::vector<Mask> values, std::vector<std::string> cells = {});
    void ensure_mask();
    void drop_extra_columns();

    // Text of one cell as it will be written
    std::string cell_text(const std::string& name, size_t row) const;

    // Uncertainty column used by the statistics ("duJy" or "duJy_new")
    const std::string& dflux_column() const { return dflux_column_; }
    void set_dflux_column(const std::string& name);

    // Row selection
    IndexList ix_unmasked(Mask flags) const;
    IndexList ix_inrange(const std::string& name, std::optional<double> lower,
                         std::optional<double> upper, const IndexList* subset = nullptr) const;

    // Row layout changes; every column follows
    void select_rows(const IndexList& ix);
    void sort_by_time();
    // Rebuilds the rows from source rows; std::nullopt entries become
    // placeholder rows (values missing, mask 0) at the given time.
    void reindex(const std::vector<std::optional<size_t>>& source, const VectorXd& times);

private:
    struct Column {
        VectorXd values;
        std::vector<std::string> raw;
        bool persist = false;
    };

    void check_length(const std::string& name, size_t n);

    std::vector<std::string> columns_;
    std::map<std::string, Column> data_;
    std::vector<Mask> mask_;
    std::vector<std::string> mask_raw_;
    size_t n_rows_ = 0;

    int control_index_ = 0;
    std::string filter_ = "o";
    std::string dflux_column_ = col::DFLUX;
    bool binned_ = false;
    double bin_size_ = 0.0;
    std::optional<InjectionState> injection_;
};

struct Coordinates {
    std::string ra;
    std::string dec;

    bool is_empty() const { return ra.empty() || dec.empty(); }
};

// Transient light curve (control index 0) plus its control light curves
class Supernova {
public:
    Supernova() = default;
    Supernova(std::string tnsname, std::string filter);

    const std::string& name() const { return tnsname_; }
    const std::string& filter() const { return filter_; }

    const Coordinates& coords() const { return coords_; }
    void set_coords(Coordinates coords) { coords_ = std::move(coords); }
    const std::optional<double>& mjd0() const { return mjd0_; }
    void set_mjd0(std::optional<double> mjd0) { mjd0_ = mjd0; }

    void add(LightCurve lc);
    bool has(int control_index) const;
    LightCurve& lc(int control_index);
    const LightCurve& lc(int control_index) const;
    LightCurve& transient() { return lc(0); }
    const LightCurve& transient() const { return lc(0); }

    std::vector<int> control_indices() const;
    size_t num_controls() const;

    std::map<int, LightCurve>& lcs() { return lcs_; }
    const std::map<int, LightCurve>& lcs() const { return lcs_; }

    // Sorts the transient and puts every control on its time axis
    void align_controls();

private:
    std::string tnsname_;
    std::string filter_ = "o";
    Coordinates coords_;
    std::optional<double> mjd0_;
    std::map<int, LightCurve> lcs_;
};

// Clears the mask, drops unusable rows, adds the signal-to-noise column
void prepare_for_cleaning(LightCurve& lc);

// Prepares every light curve and aligns the controls
void prepare_for_cleaning(Supernova& sn);

} // namespace atclean::core
