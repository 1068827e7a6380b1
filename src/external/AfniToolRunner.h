/**
 * @file AfniToolRunner.h
 * @brief Invocation of AFNI per-timepoint command-line tools
 *
 * 3dToutcount and 3dTqual print one value per timepoint on standard output,
 * mixed with headers and warnings; only the numeric lines are returned.
 */

#ifndef NEUROQAP_AFNI_TOOL_RUNNER_H
#define NEUROQAP_AFNI_TOOL_RUNNER_H

#include <string>
#include <vector>

namespace neuroqap {
namespace external {

struct CommandResult {
  int exit_code = 0;
  std::string stdout_text;
};

class AfniToolRunner {
public:
  /**
   * @brief Run a program found on PATH and capture its standard output
   *
   * Standard error is inherited. A program that cannot be started exits
   * with code 127, as in a shell.
   *
   * @throws ExternalToolException on an empty argv or if the process cannot
   *         be created or waited for
   */
  static CommandResult RunCommand(const std::vector<std::string> &argv);

  /// RunCommand, but a non-zero exit status raises ExternalToolException.
  static std::string RunCommandChecked(const std::vector<std::string> &argv);

  /// Fraction (or count) of outlier voxels per timepoint from 3dToutcount.
  static std::vector<double> OutlierTimepoints(const std::string &func_file,
                                               const std::string &mask_file = "",
                                               bool out_fraction = true);

  /// Per-timepoint quality index from 3dTqual.
  static std::vector<double> QualityTimepoints(const std::string &func_file);

  static std::vector<std::string>
  OutlierCommand(const std::string &func_file, const std::string &mask_file,
                 bool out_fraction);
  static std::vector<std::string> QualityCommand(const std::string &func_file);

  static std::string JoinCommandLine(const std::vector<std::string> &argv);

  /**
   * @brief Append everything readable from @p fd to @p output until EOF
   * @return 0 on EOF, otherwise the errno of the failed read
   */
  static int ReadUntilEOF(int fd, std::string &output);
};

} // namespace external
} // namespace neuroqap

#endif // NEUROQAP_AFNI_TOOL_RUNNER_H
