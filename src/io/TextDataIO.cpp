/**
 * @file TextDataIO.cpp
 * @brief Implementation of plain-text data reading and writing
 */

#include "TextDataIO.h"
#include "../common/NeuroQAPExceptions.h"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>

namespace neuroqap {
namespace io {
namespace TextDataIO {

std::optional<double> ParseFloat(const std::string &text) {
  std::istringstream iss(text);
  iss.imbue(std::locale::classic());

  double value = 0.0;
  iss >> value;
  if (iss.fail()) {
    return std::nullopt;
  }

  iss >> std::ws;
  if (!iss.eof()) {
    return std::nullopt;
  }

  if (!std::isfinite(value)) {
    return std::nullopt;
  }

  return value;
}

std::vector<double> PassFloats(const std::string &output_text) {
  std::vector<double> values;

  for (const auto &line : SplitLines(output_text)) {
    if (auto value = ParseFloat(line)) {
      values.push_back(*value);
    }
  }

  return values;
}

bool IsLineBreak(char c) {
  switch (c) {
  case '\n':
  case '\r':
  case '\v':
  case '\f':
  case '\x1c':
  case '\x1d':
  case '\x1e':
    return true;
  default:
    return false;
  }
}

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::string current;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (IsLineBreak(c)) {
      lines.push_back(current);
      current.clear();
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
    } else {
      current.push_back(c);
    }
  }

  if (!current.empty()) {
    lines.push_back(current);
  }

  return lines;
}

std::vector<std::vector<double>> ReadNumericTable(const std::string &filename,
                                                  size_t expected_columns) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw TextIOException(filename, "Read", "cannot open file");
  }

  std::vector<std::vector<double>> rows;
  std::string line;
  int line_number = 0;

  while (std::getline(file, line)) {
    ++line_number;

    auto comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }

    std::istringstream tokens(line);
    std::vector<double> row;
    std::string token;

    while (tokens >> token) {
      auto value = ParseFloat(token);
      if (!value) {
        throw MalformedInputException(filename, line_number,
                                      "non-numeric value '" + token + "'");
      }
      row.push_back(*value);
    }

    if (row.empty()) {
      continue;
    }

    if (expected_columns == 0) {
      expected_columns = row.size();
    }

    if (row.size() != expected_columns) {
      throw MalformedInputException(
          filename, line_number,
          "expected " + std::to_string(expected_columns) + " values, found " +
              std::to_string(row.size()));
    }

    rows.push_back(std::move(row));
  }

  if (rows.empty()) {
    throw MalformedInputException(filename, 0, "no numeric rows");
  }

  return rows;
}

std::vector<double> ReadScalarFile(const std::string &filename) {
  auto rows = ReadNumericTable(filename, 1);

  std::vector<double> values;
  values.reserve(rows.size());
  for (const auto &row : rows) {
    values.push_back(row[0]);
  }

  return values;
}

void WriteScalarFile(const std::string &filename,
                     const std::vector<double> &values) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw TextIOException(filename, "Write", "cannot create file");
  }

  file.imbue(std::locale::classic());
  file << std::scientific << std::setprecision(18);
  for (double value : values) {
    file << value << '\n';
  }

  if (!file.good()) {
    throw TextIOException(filename, "Write", "stream error");
  }
}

std::string ReadTextFile(const std::string &filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file.is_open()) {
    throw TextIOException(filename, "Read", "cannot open file");
  }

  std::ostringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

} // namespace TextDataIO
} // namespace io
} // namespace neuroqap
