#include "runner_shared.hpp"

#include "atclean/core/utils.hpp"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <set>

namespace atclean::runner {

namespace fs = std::filesystem;

std::vector<std::string> resolve_object_names(const std::vector<std::string> &names,
                                              const io::SnInfoTable &sninfo) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  if (!names.empty()) {
    for (const auto &n : names) {
      const std::string name = core::trim(n);
      if (!name.empty() && seen.insert(name).second) {
        out.push_back(name);
      }
    }
    return out;
  }
  for (const auto &row : sninfo.rows()) {
    if (seen.insert(row.tnsname).second) {
      out.push_back(row.tnsname);
    }
  }
  return out;
}

std::string sha256_if_exists(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    return "";
  }
  return core::sha256_file(path);
}

namespace {

std::mutex &tee_mutex() {
  static std::mutex m;
  return m;
}

} // namespace

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF) {
    return EOF;
  }
  std::lock_guard<std::mutex> lock(tee_mutex());
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

std::streamsize TeeBuf::xsputn(const char *s, std::streamsize n) {
  std::lock_guard<std::mutex> lock(tee_mutex());
  const std::streamsize na = a_ ? a_->sputn(s, n) : n;
  const std::streamsize nb = b_ ? b_->sputn(s, n) : n;
  return std::min(na, nb);
}

int TeeBuf::sync() {
  std::lock_guard<std::mutex> lock(tee_mutex());
  const int ra = a_ ? a_->pubsync() : 0;
  const int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace atclean::runner
