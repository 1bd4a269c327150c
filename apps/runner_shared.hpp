#pragma once

#include "atclean/io/sninfo.hpp"

#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace atclean::runner {

// Names given on the command line, or every object of the SN info table
std::vector<std::string> resolve_object_names(const std::vector<std::string> &names,
                                              const io::SnInfoTable &sninfo);

// SHA-256 of a file, empty if it does not exist
std::string sha256_if_exists(const std::filesystem::path &path);

// Writes every character to both buffers. All instances share one lock since
// they usually feed the same terminal buffer from several threads.
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  std::streamsize xsputn(const char *s, std::streamsize n) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace atclean::runner
