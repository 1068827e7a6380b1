#ifndef NEUROQAP_EXCEPTIONS_H
#define NEUROQAP_EXCEPTIONS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file NeuroQAPExceptions.h
 * @brief Exception hierarchy for NeuroQAP
 *
 * Every failure raised by the temporal QC library derives from
 * NeuroQAPException. Numeric failures are always fatal to the scan being
 * processed; callers that process batches catch them per scan.
 */

namespace neuroqap {

/**
 * @brief Base exception class for all NeuroQAP errors
 *
 * Carries the failing component and function, a timestamp, optional
 * detailed context and a list of recovery suggestions.
 */
class NeuroQAPException : public std::exception {
public:
  enum class Severity {
    Info,     // Informational, processing can continue
    Warning,  // Warning, might affect results
    Error,    // Error, current scan failed
    Critical, // Critical, batch state compromised
  };

  enum class Category {
    InputOutput,   // File I/O and data access errors
    Numerical,     // Ill-defined statistics and matrix algebra
    MalformedData, // Input that cannot be shaped into the expected structure
    Configuration, // Configuration and parameter errors
    ExternalTool,  // Failures of invoked command-line tools
    System         // System-level errors
  };

protected:
  std::string m_message;
  std::string m_component;
  std::string m_function;
  Severity m_severity;
  Category m_category;
  std::chrono::system_clock::time_point m_timestamp;
  std::vector<std::string> m_recovery_suggestions;
  std::string m_detailed_context;

public:
  explicit NeuroQAPException(const std::string &message,
                             const std::string &component = "Unknown",
                             const std::string &function = "Unknown",
                             Severity severity = Severity::Error,
                             Category category = Category::System)
      : m_message(message), m_component(component), m_function(function),
        m_severity(severity), m_category(category),
        m_timestamp(std::chrono::system_clock::now()) {}

  const char *what() const noexcept override { return m_message.c_str(); }

  const std::string &GetMessage() const { return m_message; }
  const std::string &GetComponent() const { return m_component; }
  const std::string &GetFunction() const { return m_function; }
  Severity GetSeverity() const { return m_severity; }
  Category GetCategory() const { return m_category; }

  std::string GetTimestamp() const {
    auto time_t = std::chrono::system_clock::to_time_t(m_timestamp);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
  }

  void AddRecoverySuggestion(const std::string &suggestion) {
    m_recovery_suggestions.push_back(suggestion);
  }

  const std::vector<std::string> &GetRecoverySuggestions() const {
    return m_recovery_suggestions;
  }

  void SetDetailedContext(const std::string &context) {
    m_detailed_context = context;
  }

  const std::string &GetDetailedContext() const { return m_detailed_context; }

  std::string GetFormattedReport() const {
    std::stringstream ss;
    ss << "=== NeuroQAP Error Report ===" << std::endl;
    ss << "Timestamp: " << GetTimestamp() << std::endl;
    ss << "Severity: " << SeverityToString(m_severity) << std::endl;
    ss << "Category: " << CategoryToString(m_category) << std::endl;
    ss << "Component: " << m_component << std::endl;
    ss << "Function: " << m_function << std::endl;
    ss << "Message: " << m_message << std::endl;

    if (!m_detailed_context.empty()) {
      ss << "Context: " << m_detailed_context << std::endl;
    }

    if (!m_recovery_suggestions.empty()) {
      ss << "Recovery Suggestions:" << std::endl;
      for (size_t i = 0; i < m_recovery_suggestions.size(); ++i) {
        ss << "  " << (i + 1) << ". " << m_recovery_suggestions[i] << std::endl;
      }
    }

    return ss.str();
  }

  static std::string SeverityToString(Severity severity) {
    switch (severity) {
    case Severity::Info:
      return "INFO";
    case Severity::Warning:
      return "WARNING";
    case Severity::Error:
      return "ERROR";
    case Severity::Critical:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }

  static std::string CategoryToString(Category category) {
    switch (category) {
    case Category::InputOutput:
      return "INPUT_OUTPUT";
    case Category::Numerical:
      return "NUMERICAL";
    case Category::MalformedData:
      return "MALFORMED_DATA";
    case Category::Configuration:
      return "CONFIGURATION";
    case Category::ExternalTool:
      return "EXTERNAL_TOOL";
    case Category::System:
      return "SYSTEM";
    default:
      return "UNKNOWN";
    }
  }
};

/**
 * @brief Ill-defined statistic or degenerate matrix algebra
 *
 * Raised instead of returning NaN or a substituted default. The scan
 * identifier is attached by the per-scan processor so a batch summary can
 * attribute the failure.
 */
class NumericException : public NeuroQAPException {
public:
  enum class Reason {
    EmptyInput,
    SingularMatrix,
    DegeneratePercentile,
    ZeroVariance,
    NonFiniteResult,
    LengthMismatch
  };

private:
  Reason m_reason;
  std::string m_scan_identifier;

public:
  NumericException(Reason reason, const std::string &function,
                   const std::string &details = "")
      : NeuroQAPException("Numeric error in " + function + ": " +
                              ReasonToString(reason) +
                              (details.empty() ? "" : " - " + details),
                          "TemporalQC", function, Severity::Error,
                          Category::Numerical),
        m_reason(reason) {
    AddContextualRecoverySuggestions(reason);
  }

  Reason GetReason() const { return m_reason; }

  const std::string &GetScanIdentifier() const { return m_scan_identifier; }

  void SetScanIdentifier(const std::string &scan_identifier) {
    m_scan_identifier = scan_identifier;
    m_message += " [scan: " + scan_identifier + "]";
  }

  static std::string ReasonToString(Reason reason) {
    switch (reason) {
    case Reason::EmptyInput:
      return "Empty input";
    case Reason::SingularMatrix:
      return "Singular matrix";
    case Reason::DegeneratePercentile:
      return "Degenerate percentile index";
    case Reason::ZeroVariance:
      return "Zero temporal variance";
    case Reason::NonFiniteResult:
      return "Non-finite result";
    case Reason::LengthMismatch:
      return "Length mismatch";
    default:
      return "Unknown numeric failure";
    }
  }

private:
  void AddContextualRecoverySuggestions(Reason reason) {
    switch (reason) {
    case Reason::EmptyInput:
      AddRecoverySuggestion("Check that the external tool produced output");
      break;
    case Reason::SingularMatrix:
      AddRecoverySuggestion("Inspect the motion correction matrix file for "
                            "zeroed or truncated rows");
      break;
    case Reason::DegeneratePercentile:
      AddRecoverySuggestion("Verify the brain mask covers enough voxels");
      break;
    case Reason::ZeroVariance:
      AddRecoverySuggestion("Exclude constant voxels from the mask");
      break;
    case Reason::NonFiniteResult:
      AddRecoverySuggestion("Check for NaN or infinite values in the input");
      break;
    case Reason::LengthMismatch:
      AddRecoverySuggestion("Verify both inputs describe the same scans");
      break;
    }
  }
};

/**
 * @brief Input that cannot be reshaped into the expected row/column layout
 */
class MalformedInputException : public NeuroQAPException {
private:
  std::string m_filename;
  int m_line_number;

public:
  MalformedInputException(const std::string &filename, int line_number,
                          const std::string &details)
      : NeuroQAPException("Malformed input in '" + filename + "'" +
                              (line_number > 0
                                   ? " at line " + std::to_string(line_number)
                                   : std::string()) +
                              ": " + details,
                          "TextDataIO", "Parse", Severity::Error,
                          Category::MalformedData),
        m_filename(filename), m_line_number(line_number) {
    AddRecoverySuggestion("Matrix files need 12 values per row (3x4 affine, "
                          "row-major)");
    AddRecoverySuggestion("Scalar files need one value per line");
  }

  const std::string &GetFilename() const { return m_filename; }
  int GetLineNumber() const { return m_line_number; }
};

/**
 * @brief File access failures for text inputs and outputs
 */
class TextIOException : public NeuroQAPException {
public:
  TextIOException(const std::string &filename, const std::string &operation,
                  const std::string &details = "")
      : NeuroQAPException("I/O error during " + operation + " of '" +
                              filename + "'" +
                              (details.empty() ? "" : ": " + details),
                          "TextDataIO", operation, Severity::Error,
                          Category::InputOutput) {
    AddRecoverySuggestion("Check if file exists and has correct permissions");
    AddRecoverySuggestion("Try using absolute file path");
  }
};

/**
 * @brief Configuration and parameter validation exceptions
 */
class ConfigurationException : public NeuroQAPException {
public:
  ConfigurationException(const std::string &parameter_name,
                         const std::string &invalid_value,
                         const std::string &expected_format = "")
      : NeuroQAPException(
            "Invalid configuration parameter '" + parameter_name +
                "' with value '" + invalid_value + "'" +
                (expected_format.empty()
                     ? ""
                     : " (expected: " + expected_format + ")"),
            "Configuration", "Parameter Validation", Severity::Error,
            Category::Configuration) {
    AddRecoverySuggestion("Use GetDefaultParameters() as starting point");
  }
};

/**
 * @brief Failure to run an external command-line tool
 */
class ExternalToolException : public NeuroQAPException {
private:
  int m_exit_code;

public:
  ExternalToolException(const std::string &command_line, int exit_code,
                        const std::string &details = "")
      : NeuroQAPException("External command failed: '" + command_line + "'" +
                              (details.empty() ? "" : " - " + details),
                          "ExternalTool", command_line, Severity::Error,
                          Category::ExternalTool),
        m_exit_code(exit_code) {
    SetDetailedContext("Exit code: " + std::to_string(exit_code));
    AddRecoverySuggestion("Check that AFNI is installed and on the PATH");
    AddRecoverySuggestion("Run the command manually to inspect its output");
  }

  int GetExitCode() const { return m_exit_code; }
};

} // namespace neuroqap

#endif // NEUROQAP_EXCEPTIONS_H
