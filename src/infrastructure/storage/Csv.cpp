#include "infrastructure/storage/Csv.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace netledger::infra {

std::vector<CsvRow> Csv::parse(std::istream& input) {
    std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool inQuotes = false;
    bool rowHasContent = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
        case '"':
            inQuotes = true;
            rowHasContent = true;
            break;
        case ',':
            row.push_back(std::move(field));
            field.clear();
            rowHasContent = true;
            break;
        case '\r':
            break;
        case '\n':
            if (rowHasContent || !field.empty()) {
                row.push_back(std::move(field));
                rows.push_back(std::move(row));
            }
            row.clear();
            field.clear();
            rowHasContent = false;
            break;
        default:
            field += c;
            rowHasContent = true;
            break;
        }
    }

    if (inQuotes) {
        throw std::runtime_error("unterminated quoted field");
    }
    if (rowHasContent || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string Csv::quote(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string Csv::formatRow(const CsvRow& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            line += ',';
        }
        line += quote(row[i]);
    }
    line += '\n';
    return line;
}

std::string Csv::format(const std::vector<CsvRow>& rows) {
    std::string out;
    for (const auto& row : rows) {
        out += formatRow(row);
    }
    return out;
}

std::vector<std::string> splitList(const std::string& text, char separator) {
    std::vector<std::string> items;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, separator)) {
        auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        auto last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

void writeFileAtomically(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("failed to create directory '" +
                                     path.parent_path().string() + "': " + ec.message());
        }
    }

    auto temp = path;
    temp += ".tmp." + std::to_string(getpid());

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("failed to open '" + temp.string() + "' for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            std::filesystem::remove(temp, ec);
            throw std::runtime_error("failed while writing '" + temp.string() + "'");
        }
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        throw std::runtime_error("failed to rename '" + temp.string() + "' to '" + path.string() +
                                 "': " + ec.message());
    }
}

} // namespace netledger::infra
