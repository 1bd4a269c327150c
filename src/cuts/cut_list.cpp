#include "atclean/cuts/cut_list.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"

#include <algorithm>
#include <sstream>

namespace atclean::cuts {

namespace {

const std::vector<std::string>& builtin_chain() {
    static const std::vector<std::string> chain{UNCERT_CUT, UNCERT_EST, X2_CUT,
                                                CONTROLS_CUT, BADDAY_CUT};
    return chain;
}

} // namespace

bool is_builtin_cut(const std::string& name) {
    const auto& chain = builtin_chain();
    return std::find(chain.begin(), chain.end(), name) != chain.end();
}

bool Cut::can_apply_directly() const {
    return flag != 0 && !column.empty() && (min_value.has_value() || max_value.has_value());
}

Mask Cut::param_flag(const std::string& key) const {
    auto it = params.find(key);
    if (it == params.end()) {
        throw ConfigError("cut has no parameter '" + key + "'");
    }
    return static_cast<Mask>(it->second);
}

double Cut::param(const std::string& key) const {
    auto it = params.find(key);
    if (it == params.end()) {
        throw ConfigError("cut has no parameter '" + key + "'");
    }
    return it->second;
}

std::string Cut::to_string() const {
    std::ostringstream oss;
    oss << "column=" << (column.empty() ? "-" : column);
    if (min_value) oss << " min=" << core::format_double(*min_value);
    if (max_value) oss << " max=" << core::format_double(*max_value);
    oss << " flag=" << core::format_hex(flag);
    for (const auto& [key, value] : params) {
        oss << " " << key << "=";
        if (core::ends_with(key, "_flag")) {
            oss << core::format_hex(static_cast<Mask>(value));
        } else {
            oss << core::format_double(value);
        }
    }
    return oss.str();
}

void CutOrdering::add_node(const std::string& name) {
    nodes_.insert(name);
}

void CutOrdering::add_edge(const std::string& before, const std::string& after) {
    if (before == after) {
        throw ConfigError("cut '" + before + "' cannot be ordered before itself");
    }
    add_node(before);
    add_node(after);
    edges_[before].insert(after);
}

std::vector<std::string> CutOrdering::topological_order() const {
    std::map<std::string, int> indegree;
    for (const auto& n : nodes_) indegree[n] = 0;
    for (const auto& [from, tos] : edges_) {
        for (const auto& to : tos) ++indegree[to];
    }

    // Built-in cuts first among the ready nodes, then by name
    auto rank = [](const std::string& n) {
        const auto& chain = builtin_chain();
        auto it = std::find(chain.begin(), chain.end(), n);
        return it == chain.end() ? chain.size() : static_cast<size_t>(it - chain.begin());
    };
    auto less = [&](const std::string& a, const std::string& b) {
        const size_t ra = rank(a);
        const size_t rb = rank(b);
        return ra != rb ? ra < rb : a < b;
    };

    std::vector<std::string> ready;
    for (const auto& [n, d] : indegree) {
        if (d == 0) ready.push_back(n);
    }

    std::vector<std::string> order;
    while (!ready.empty()) {
        auto it = std::min_element(ready.begin(), ready.end(), less);
        const std::string n = *it;
        ready.erase(it);
        order.push_back(n);
        auto e = edges_.find(n);
        if (e == edges_.end()) continue;
        for (const auto& to : e->second) {
            if (--indegree[to] == 0) ready.push_back(to);
        }
    }

    if (order.size() != nodes_.size()) {
        std::vector<std::string> stuck;
        for (const auto& [n, d] : indegree) {
            if (d > 0) stuck.push_back(n);
        }
        throw ConfigError("cut ordering has a cycle through: " + core::join(stuck, ", "));
    }
    return order;
}

void CutOrdering::validate() const {
    (void)topological_order();
}

std::set<std::string> CutOrdering::ancestors(const std::string& name) const {
    std::map<std::string, std::vector<std::string>> reverse;
    for (const auto& [from, tos] : edges_) {
        for (const auto& to : tos) reverse[to].push_back(from);
    }

    std::set<std::string> seen;
    std::vector<std::string> stack{name};
    while (!stack.empty()) {
        const std::string n = stack.back();
        stack.pop_back();
        auto it = reverse.find(n);
        if (it == reverse.end()) continue;
        for (const auto& from : it->second) {
            if (seen.insert(from).second) stack.push_back(from);
        }
    }
    seen.erase(name);
    return seen;
}

CutList::CutList() {
    const auto& chain = builtin_chain();
    for (size_t i = 0; i + 1 < chain.size(); ++i) {
        ordering_.add_edge(chain[i], chain[i + 1]);
    }
}

void CutList::add(const std::string& name, const Cut& cut) {
    if (name.empty()) {
        throw ConfigError("cut name must not be empty");
    }
    if (cuts_.count(name) == 0) {
        order_.push_back(name);
    }
    cuts_[name] = cut;
    ordering_.add_node(name);
}

bool CutList::has(const std::string& name) const {
    return cuts_.count(name) > 0;
}

const Cut& CutList::get(const std::string& name) const {
    auto it = cuts_.find(name);
    if (it == cuts_.end()) {
        throw ConfigError("no cut named '" + name + "'");
    }
    return it->second;
}

void CutList::remove(const std::string& name) {
    cuts_.erase(name);
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
}

std::vector<std::string> CutList::custom_cuts() const {
    std::vector<std::string> out;
    for (const auto& name : order_) {
        if (!is_builtin_cut(name)) out.push_back(name);
    }
    return out;
}

void CutList::add_order(const std::string& before, const std::string& after) {
    ordering_.add_edge(before, after);
    ordering_.validate();
}

std::vector<std::string> CutList::application_order() const {
    std::vector<std::string> out;
    for (const auto& name : ordering_.topological_order()) {
        if (has(name)) out.push_back(name);
    }
    return out;
}

Mask CutList::get_all_flags() const {
    Mask flags = 0;
    for (const auto& [name, cut] : cuts_) {
        flags |= cut.flag;
    }
    return flags;
}

Mask CutList::get_previous_flags(const std::string& name) const {
    if (!is_builtin_cut(name)) {
        throw ConfigError("cannot get previous flags for custom cut '" + name +
                          "': custom cuts have no fixed position");
    }
    Mask flags = 0;
    for (const auto& before : ordering_.ancestors(name)) {
        auto it = cuts_.find(before);
        if (it != cuts_.end()) flags |= it->second.flag;
    }
    return flags;
}

std::vector<std::string> CutList::find_flag_duplicates() const {
    std::vector<std::pair<std::string, Mask>> entries;
    for (const auto& name : order_) {
        const Cut& cut = cuts_.at(name);
        if (cut.flag != 0) entries.emplace_back(name + ".flag", cut.flag);
        for (const auto& [key, value] : cut.params) {
            if (core::ends_with(key, "_flag")) {
                entries.emplace_back(name + "." + key, static_cast<Mask>(value));
            }
        }
    }

    std::vector<std::string> duplicates;
    for (size_t i = 0; i < entries.size(); ++i) {
        for (size_t j = i + 1; j < entries.size(); ++j) {
            if ((entries[i].second & entries[j].second) != 0) {
                duplicates.push_back(entries[i].first + "/" + entries[j].first + " (" +
                                     core::format_hex(entries[i].second & entries[j].second) + ")");
            }
        }
    }
    return duplicates;
}

void CutList::check_for_flag_duplicates() const {
    const auto duplicates = find_flag_duplicates();
    if (!duplicates.empty()) {
        throw ConfigError("duplicate flag bits: " + core::join(duplicates, ", "));
    }
}

CutList make_cut_list(const config::Config& cfg) {
    CutList list;
    const auto& c = cfg.cuts;

    if (c.uncert_est.enabled) {
        Cut cut;
        cut.params["temp_x2_max_value"] = c.uncert_est.temp_x2_max_value;
        cut.params["apply_min_sigma_extra"] = c.uncert_est.apply_min_sigma_extra;
        list.add(UNCERT_EST, cut);
    }

    if (c.uncert_cut.enabled) {
        Cut cut;
        cut.column = col::DFLUX;
        cut.max_value = c.uncert_cut.max_value;
        cut.flag = c.uncert_cut.flag;
        list.add(UNCERT_CUT, cut);
    }

    if (c.x2_cut.enabled) {
        Cut cut;
        cut.column = col::CHI_N;
        cut.max_value = c.x2_cut.max_value;
        cut.flag = c.x2_cut.flag;
        cut.params["stn_bound"] = c.x2_cut.limcuts.stn_bound;
        cut.params["cut_start"] = c.x2_cut.limcuts.cut_start;
        cut.params["cut_stop"] = c.x2_cut.limcuts.cut_stop;
        cut.params["cut_step"] = c.x2_cut.limcuts.cut_step;
        list.add(X2_CUT, cut);
    }

    if (c.controls_cut.enabled) {
        const auto& cc = c.controls_cut;
        Cut cut;
        cut.flag = cc.flag;
        cut.params["questionable_flag"] = cc.questionable_flag;
        cut.params["x2_flag"] = cc.x2_flag;
        cut.params["stn_flag"] = cc.stn_flag;
        cut.params["Nclip_flag"] = cc.Nclip_flag;
        cut.params["Ngood_flag"] = cc.Ngood_flag;
        cut.params["x2_max"] = cc.x2_max;
        cut.params["stn_max"] = cc.stn_max;
        cut.params["Nclip_max"] = cc.Nclip_max;
        cut.params["Ngood_min"] = cc.Ngood_min;
        list.add(CONTROLS_CUT, cut);
    }

    if (c.averaging.enabled) {
        const auto& av = c.averaging;
        Cut cut;
        cut.flag = av.flag;
        cut.params["ixclip_flag"] = av.ixclip_flag;
        cut.params["smallnum_flag"] = av.smallnum_flag;
        cut.params["nodata_flag"] = av.nodata_flag;
        cut.params["mjd_bin_size"] = av.mjd_bin_size;
        cut.params["x2_max"] = av.x2_max;
        cut.params["Nclip_max"] = av.Nclip_max;
        cut.params["Ngood_min"] = av.Ngood_min;
        list.add(BADDAY_CUT, cut);
    }

    const auto& chain = builtin_chain();
    for (const auto& custom : c.custom) {
        if (is_builtin_cut(custom.name)) {
            throw ConfigError("custom cut '" + custom.name + "' uses a built-in cut name");
        }
        Cut cut;
        cut.column = custom.column;
        cut.min_value = custom.min_value;
        cut.max_value = custom.max_value;
        cut.flag = custom.flag;
        if (!cut.can_apply_directly()) {
            throw ConfigError("custom cut '" + custom.name +
                              "' needs a column, a flag and at least one bound");
        }
        list.add(custom.name, cut);

        auto it = std::find(chain.begin(), chain.end(), custom.precedes);
        if (it == chain.end()) {
            throw ConfigError("custom cut '" + custom.name + "' precedes unknown cut '" +
                              custom.precedes + "'");
        }
        list.add_order(custom.name, *it);
        if (it != chain.begin()) {
            list.add_order(*(it - 1), custom.name);
        }
    }

    for (const auto& edge : c.order) {
        list.add_order(edge[0], edge[1]);
    }

    list.check_for_flag_duplicates();
    return list;
}

} // namespace atclean::cuts
