#include "atclean/core/utils.hpp"
#include "atclean/core/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <random>
#include <sstream>

#include <openssl/sha.h>

namespace atclean::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_file(const fs::path& path) {
    auto data = read_bytes(path);
    return sha256_bytes(data);
}

double median_of(std::vector<double> v) {
    v.erase(std::remove_if(v.begin(), v.end(), [](double x) { return std::isnan(x); }),
            v.end());
    if (v.empty()) return kNaN;
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double hi = v[mid];
    if ((n % 2) == 1) return hi;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid - 1), v.end());
    const double lo = v[mid - 1];
    return 0.5 * (lo + hi);
}

double median_of(const VectorXd& data, const IndexList& ix) {
    std::vector<double> v;
    v.reserve(ix.size());
    for (size_t i : ix) v.push_back(data[static_cast<Eigen::Index>(i)]);
    return median_of(std::move(v));
}

double mean_of(const VectorXd& data, const IndexList& ix) {
    double sum = 0.0;
    size_t n = 0;
    for (size_t i : ix) {
        const double x = data[static_cast<Eigen::Index>(i)];
        if (std::isnan(x)) continue;
        sum += x;
        ++n;
    }
    return n > 0 ? sum / static_cast<double>(n) : kNaN;
}

VectorXd linspace(double start, double stop, int n) {
    if (n <= 0) return VectorXd();
    if (n == 1) return VectorXd::Constant(1, start);
    return VectorXd::LinSpaced(n, start, stop);
}

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

VectorXd interp_linear(const VectorXd& x, const VectorXd& y, const VectorXd& at, double fill) {
    VectorXd out = VectorXd::Constant(at.size(), fill);
    const Eigen::Index n = x.size();
    if (n == 0) return out;
    const double* xb = x.data();
    const double* xe = x.data() + n;
    for (Eigen::Index i = 0; i < at.size(); ++i) {
        const double t = at[i];
        if (std::isnan(t)) {
            out[i] = kNaN;
            continue;
        }
        if (t < xb[0] || t > xe[-1]) continue;
        auto it = std::upper_bound(xb, xe, t);
        if (it == xe) {
            out[i] = y[n - 1];
            continue;
        }
        const Eigen::Index hi = it - xb;
        const Eigen::Index lo = hi - 1;
        const double dx = x[hi] - x[lo];
        const double f = dx > 0.0 ? (t - x[lo]) / dx : 0.0;
        out[i] = y[lo] + f * (y[hi] - y[lo]);
    }
    return out;
}

double mag_to_flux(double mag) {
    return std::pow(10.0, (mag - kFluxZeroPoint) / -2.5);
}

double flux_to_mag(double flux) {
    if (!(flux > 0.0)) return kNaN;
    return -2.5 * std::log10(flux) + kFluxZeroPoint;
}

IndexList index_range(size_t n) {
    IndexList out(n);
    for (size_t i = 0; i < n; ++i) out[i] = i;
    return out;
}

IndexList index_and(const IndexList& a, const IndexList& b) {
    IndexList out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

IndexList index_not(const IndexList& a, const IndexList& b) {
    IndexList out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

std::optional<double> parse_double(const std::string& s) {
    const std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    const std::string lower = to_lower(t);
    if (lower == "nan" || lower == "null" || lower == "none") return kNaN;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || errno == ERANGE) return std::nullopt;
    return v;
}

std::optional<Mask> parse_mask(const std::string& s) {
    const std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const unsigned long v = std::strtoul(t.c_str(), &end, 0);
    if (end == t.c_str() + t.size() && errno == 0) {
        return static_cast<Mask>(v);
    }
    // Masks written by float-typed tools ("0.0")
    auto d = parse_double(t);
    if (d && std::isfinite(*d) && *d >= 0.0 && std::floor(*d) == *d) {
        return static_cast<Mask>(*d);
    }
    return std::nullopt;
}

std::string format_double(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    char buf[64];
    for (int prec = 1; prec <= 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, value);
        if (std::strtod(buf, nullptr) == value) break;
    }
    return buf;
}

std::string format_fixed(double value, int decimals) {
    if (std::isnan(value)) return "NaN";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

std::string format_hex(Mask value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

LogLine::~LogLine() {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);
    buf_ << '\n';
    out_ << buf_.str();
    out_.flush();
}

} // namespace atclean::core
