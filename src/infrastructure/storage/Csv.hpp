#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace netledger::infra {

using CsvRow = std::vector<std::string>;

/**
 * @brief Minimal RFC 4180 reader and writer.
 *
 * Fields containing a comma, quote or line break are quoted on output;
 * quoted fields may span lines on input. CRLF and LF line endings are both
 * accepted.
 */
class Csv {
public:
    /**
     * @brief Parses every record in the stream.
     * @throws std::runtime_error on an unterminated quoted field.
     */
    static std::vector<CsvRow> parse(std::istream& input);

    static std::string quote(const std::string& field);
    static std::string formatRow(const CsvRow& row);
    static std::string format(const std::vector<CsvRow>& rows);
};

/**
 * @brief Splits a ';'-joined list, dropping empty and blank items.
 */
std::vector<std::string> splitList(const std::string& text, char separator = ';');

/**
 * @brief Writes a file through a sibling temp file and a rename.
 *
 * Readers see either the old or the new content, never a partial file.
 * @throws std::runtime_error if the directory cannot be created or the write fails.
 */
void writeFileAtomically(const std::filesystem::path& path, const std::string& content);

} // namespace netledger::infra
