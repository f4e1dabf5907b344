#include <replsim/io/csv.hpp>
#include <replsim/io/error.hpp>

#include <algorithm>

namespace replsim::io {

namespace {

bool is_blank(const CsvRow& row) {
    return row.size() == 1 && row[0].empty();
}

} // anonymous namespace

std::vector<CsvRow> parse_csv(std::string_view text) {
    if (text.starts_with("\xEF\xBB\xBF")) {
        text.remove_prefix(3);
    }

    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool in_quotes = false;
    bool quoted_field = false;
    std::size_t line = 1;

    auto finish_field = [&]() {
        row.push_back(std::move(field));
        field.clear();
        quoted_field = false;
    };
    auto finish_row = [&]() {
        finish_field();
        if (!is_blank(row)) {
            rows.push_back(std::move(row));
        }
        row.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (field.empty() && !quoted_field) {
                    in_quotes = true;
                    quoted_field = true;
                } else {
                    field.push_back(c);
                }
                break;
            case ',':
                finish_field();
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                finish_row();
                ++line;
                break;
            case '\n':
                finish_row();
                ++line;
                break;
            default:
                field.push_back(c);
        }
    }

    if (in_quotes) {
        throw LoaderError("unterminated quoted field", "line " + std::to_string(line));
    }
    if (!field.empty() || !row.empty() || quoted_field) {
        finish_row();
    }
    return rows;
}

std::string escape_csv_field(std::string_view field) {
    bool needs_quotes = std::any_of(field.begin(), field.end(), [](char c) {
        return c == ',' || c == '"' || c == '\n' || c == '\r';
    });
    if (!needs_quotes) {
        return std::string(field);
    }

    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string format_csv_row(const std::vector<std::string>& fields) {
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            line.push_back(',');
        }
        line += escape_csv_field(fields[i]);
    }
    return line;
}

} // namespace replsim::io
