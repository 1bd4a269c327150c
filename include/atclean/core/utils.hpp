#pragma once

#include "types.hpp"
#include <filesystem>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace atclean::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
double median_of(std::vector<double> v);
double median_of(const VectorXd& data, const IndexList& ix);
double mean_of(const VectorXd& data, const IndexList& ix);
VectorXd linspace(double start, double stop, int n);
double round_to(double value, int decimals);
// Linear interpolation of (x, y) with x ascending; `fill` outside [x.front(), x.back()]
VectorXd interp_linear(const VectorXd& x, const VectorXd& y, const VectorXd& at, double fill);

// Flux in uJy <-> AB magnitude
double mag_to_flux(double mag);
double flux_to_mag(double flux);

// Index set utilities (sorted inputs)
IndexList index_range(size_t n);
IndexList index_and(const IndexList& a, const IndexList& b);
IndexList index_not(const IndexList& a, const IndexList& b);

// Number formatting / parsing
std::optional<double> parse_double(const std::string& s);
std::optional<Mask> parse_mask(const std::string& s);
std::string format_double(double value);
std::string format_fixed(double value, int decimals);
std::string format_hex(Mask value);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::vector<std::string> split_whitespace(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Collects one log line and writes it to `out` under a process-wide lock, so
// lines from worker threads never interleave. The newline is appended on destruction.
class LogLine {
public:
    explicit LogLine(std::ostream& out) : out_(out) {}
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        buf_ << value;
        return *this;
    }

private:
    std::ostream& out_;
    std::ostringstream buf_;
};

} // namespace atclean::core
