#pragma once

#include "atclean/core/types.hpp"

#include <string>
#include <vector>

namespace atclean::io {

// Whitespace separated table with a header line
struct TextTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    // Index of `name` in the header, -1 if absent
    int column_index(const std::string& name) const;
    bool has_column(const std::string& name) const { return column_index(name) >= 0; }

    // Cells of one column; throws IOError if absent
    std::vector<std::string> column(const std::string& name) const;

    // Columns padded to a common width, right aligned
    std::string to_string() const;

    // Lines starting with '#' are skipped; the first other line is the header.
    // Throws IOError on rows with a different number of cells.
    static TextTable parse(const std::string& text, const std::string& source);
};

TextTable read_table(const fs::path& path);
// Refuses to replace an existing file unless `overwrite`
void write_table(const fs::path& path, const TextTable& table, bool overwrite = true);

} // namespace atclean::io
