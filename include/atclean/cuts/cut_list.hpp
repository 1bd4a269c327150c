#pragma once

#include "atclean/config/configuration.hpp"
#include "atclean/core/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace atclean::cuts {

// Names of the built-in cuts
constexpr const char* UNCERT_EST = "uncert_est";
constexpr const char* UNCERT_CUT = "uncert_cut";
constexpr const char* X2_CUT = "x2_cut";
constexpr const char* CONTROLS_CUT = "controls_cut";
constexpr const char* BADDAY_CUT = "badday_cut";

struct Cut {
    std::string column;
    std::optional<double> min_value;  // inclusive
    std::optional<double> max_value;  // inclusive
    Mask flag = 0;
    // Auxiliary thresholds and sub-flags; keys ending in "_flag" are flag bits
    std::map<std::string, double> params;

    bool can_apply_directly() const;
    Mask param_flag(const std::string& key) const;
    double param(const std::string& key) const;

    std::string to_string() const;
};

// Directed "applies before" relation between named cuts
class CutOrdering {
public:
    void add_node(const std::string& name);
    void add_edge(const std::string& before, const std::string& after);
    bool has_node(const std::string& name) const { return nodes_.count(name) > 0; }

    // Throws ConfigError on a cycle
    void validate() const;
    std::vector<std::string> topological_order() const;
    std::set<std::string> ancestors(const std::string& name) const;

private:
    std::set<std::string> nodes_;
    std::map<std::string, std::set<std::string>> edges_;  // before -> afters
};

class CutList {
public:
    CutList();

    void add(const std::string& name, const Cut& cut);
    bool has(const std::string& name) const;
    const Cut& get(const std::string& name) const;
    void remove(const std::string& name);
    std::vector<std::string> names() const { return order_; }

    // Cuts that are not one of the built-in cuts
    std::vector<std::string> custom_cuts() const;

    // Declares that `before` is applied before `after`
    void add_order(const std::string& before, const std::string& after);
    const CutOrdering& ordering() const { return ordering_; }
    // Built-in and custom cuts in application order
    std::vector<std::string> application_order() const;

    Mask get_all_flags() const;
    // Flags of the cuts applied before a built-in cut
    Mask get_previous_flags(const std::string& name) const;

    // Returns "name.key" pairs sharing a flag bit; empty if none
    std::vector<std::string> find_flag_duplicates() const;
    // Throws ConfigError if two entries share a flag bit
    void check_for_flag_duplicates() const;

private:
    std::vector<std::string> order_;
    std::map<std::string, Cut> cuts_;
    CutOrdering ordering_;
};

bool is_builtin_cut(const std::string& name);

// Default cut definitions
CutList make_cut_list(const config::Config& cfg);

} // namespace atclean::cuts
