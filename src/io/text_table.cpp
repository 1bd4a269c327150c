#include "atclean/io/text_table.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"

#include <algorithm>
#include <sstream>

namespace atclean::io {

int TextTable::column_index(const std::string& name) const {
    auto it = std::find(header.begin(), header.end(), name);
    return it == header.end() ? -1 : static_cast<int>(it - header.begin());
}

std::vector<std::string> TextTable::column(const std::string& name) const {
    const int c = column_index(name);
    if (c < 0) {
        throw IOError("table has no column '" + name + "'");
    }
    std::vector<std::string> out;
    out.reserve(rows.size());
    for (const auto& row : rows) out.push_back(row[static_cast<size_t>(c)]);
    return out;
}

std::string TextTable::to_string() const {
    std::vector<size_t> widths(header.size(), 0);
    for (size_t c = 0; c < header.size(); ++c) widths[c] = header[c].size();
    for (const auto& row : rows) {
        for (size_t c = 0; c < row.size() && c < widths.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    std::ostringstream oss;
    auto write_row = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < cells.size(); ++c) {
            if (c > 0) oss << ' ';
            oss << std::string(widths[c] - cells[c].size(), ' ') << cells[c];
        }
        oss << '\n';
    };
    write_row(header);
    for (const auto& row : rows) write_row(row);
    return oss.str();
}

TextTable TextTable::parse(const std::string& text, const std::string& source) {
    TextTable table;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;
    bool have_header = false;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string t = core::trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto cells = core::split_whitespace(t);
        if (!have_header) {
            table.header = std::move(cells);
            have_header = true;
            continue;
        }
        if (cells.size() != table.header.size()) {
            throw IOError(source + " line " + std::to_string(line_no) + ": expected " +
                          std::to_string(table.header.size()) + " cells, found " +
                          std::to_string(cells.size()));
        }
        table.rows.push_back(std::move(cells));
    }
    if (!have_header) {
        throw IOError(source + ": empty table");
    }
    return table;
}

TextTable read_table(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("file not found: " + path.string());
    }
    return TextTable::parse(core::read_text(path), path.string());
}

void write_table(const fs::path& path, const TextTable& table, bool overwrite) {
    if (!overwrite && fs::exists(path)) {
        throw IOError("refusing to overwrite " + path.string());
    }
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("cannot create directory " + path.parent_path().string() + ": " +
                          ec.message());
        }
    }
    core::write_text(path, table.to_string());
}

} // namespace atclean::io
