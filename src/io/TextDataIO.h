/**
 * @file TextDataIO.h
 * @brief Plain-text inputs and outputs of the temporal QC metrics
 *
 * Covers the three text formats the library exchanges with the rest of the
 * pipeline: whitespace-delimited numeric tables (motion correction matrix
 * files), one-value-per-line scalar files, and the free-form standard output
 * of AFNI command-line tools.
 */

#ifndef NEUROQAP_TEXT_DATA_IO_H
#define NEUROQAP_TEXT_DATA_IO_H

#include <optional>
#include <string>
#include <vector>

namespace neuroqap {
namespace io {
namespace TextDataIO {

/**
 * @brief Parse one line of text as a finite decimal number
 *
 * Leading and trailing whitespace is ignored. The remaining text must be
 * consumed completely. NaN and infinity spellings yield no value.
 */
std::optional<double> ParseFloat(const std::string &text);

/**
 * @brief Keep every line of a tool's output that parses as a number
 *
 * Headers, warnings and any other non-numeric line are skipped silently.
 */
std::vector<double> PassFloats(const std::string &output_text);

/**
 * @brief Split on the single-byte line boundaries
 *
 * Boundaries are "\r\n" and each of "\n", "\r", "\v", "\f", "\x1c",
 * "\x1d" and "\x1e". Text is handled as bytes, so the multi-byte Unicode
 * separators (NEL, U+2028, U+2029) are not boundaries. A trailing boundary
 * adds no empty line.
 */
std::vector<std::string> SplitLines(const std::string &text);

/// True for the single-byte line boundaries used by SplitLines.
bool IsLineBreak(char c);

/**
 * @brief Read a whitespace-delimited numeric table
 *
 * Blank lines and text after '#' are ignored. Every remaining row must hold
 * exactly @p expected_columns values, or the column count of the first row
 * when @p expected_columns is 0.
 *
 * @throws TextIOException if the file cannot be opened
 * @throws MalformedInputException on a bad token, a row of the wrong width,
 *         or a file without rows
 */
std::vector<std::vector<double>>
ReadNumericTable(const std::string &filename, size_t expected_columns = 0);

/// One value per line; same comment and blank-line rules as ReadNumericTable.
std::vector<double> ReadScalarFile(const std::string &filename);

/// Writes one value per line in "%.18e" notation.
void WriteScalarFile(const std::string &filename,
                     const std::vector<double> &values);

std::string ReadTextFile(const std::string &filename);

} // namespace TextDataIO
} // namespace io
} // namespace neuroqap

#endif // NEUROQAP_TEXT_DATA_IO_H
