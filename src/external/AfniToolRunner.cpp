/**
 * @file AfniToolRunner.cpp
 * @brief POSIX implementation of the AFNI tool runner
 */

#include "AfniToolRunner.h"
#include "../common/NeuroQAPExceptions.h"
#include "../io/TextDataIO.h"
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace neuroqap {
namespace external {

CommandResult AfniToolRunner::RunCommand(const std::vector<std::string> &argv) {
  if (argv.empty() || argv[0].empty()) {
    throw ExternalToolException("", -1, "empty command");
  }

  const std::string command_line = JoinCommandLine(argv);

  std::vector<std::string> argv_copy = argv;
  std::vector<char *> cargv;
  cargv.reserve(argv_copy.size() + 1);
  for (auto &arg : argv_copy) {
    cargv.push_back(&arg[0]);
  }
  cargv.push_back(nullptr);

  int pipe_fds[2];
  if (pipe(pipe_fds) != 0) {
    throw ExternalToolException(command_line, -1,
                                std::string("pipe failed: ") +
                                    std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int fork_errno = errno;
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    throw ExternalToolException(command_line, -1,
                                std::string("fork failed: ") +
                                    std::strerror(fork_errno));
  }

  if (pid == 0) {
    // Child: stdout goes to the pipe
    close(pipe_fds[0]);
    if (dup2(pipe_fds[1], STDOUT_FILENO) < 0) {
      _exit(127);
    }
    close(pipe_fds[1]);
    execvp(cargv[0], cargv.data());
    _exit(127);
  }

  close(pipe_fds[1]);

  CommandResult result;
  const int read_errno = ReadUntilEOF(pipe_fds[0], result.stdout_text);
  close(pipe_fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw ExternalToolException(command_line, -1,
                                  std::string("waitpid failed: ") +
                                      std::strerror(errno));
    }
  }

  // The child is reaped before a read failure is reported
  if (read_errno != 0) {
    throw ExternalToolException(command_line, -1,
                                std::string("read failed: ") +
                                    std::strerror(read_errno));
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = 1;
  }

  return result;
}

std::string
AfniToolRunner::RunCommandChecked(const std::vector<std::string> &argv) {
  CommandResult result = RunCommand(argv);
  if (result.exit_code != 0) {
    throw ExternalToolException(JoinCommandLine(argv), result.exit_code,
                                result.exit_code == 127
                                    ? "command not found or not executable"
                                    : "non-zero exit status");
  }
  return result.stdout_text;
}

std::vector<double> AfniToolRunner::OutlierTimepoints(
    const std::string &func_file, const std::string &mask_file,
    bool out_fraction) {
  return io::TextDataIO::PassFloats(
      RunCommandChecked(OutlierCommand(func_file, mask_file, out_fraction)));
}

std::vector<double>
AfniToolRunner::QualityTimepoints(const std::string &func_file) {
  return io::TextDataIO::PassFloats(RunCommandChecked(QualityCommand(func_file)));
}

std::vector<std::string>
AfniToolRunner::OutlierCommand(const std::string &func_file,
                               const std::string &mask_file, bool out_fraction) {
  std::vector<std::string> argv = {"3dToutcount"};
  if (out_fraction) {
    argv.push_back("-fraction");
  }
  if (!mask_file.empty()) {
    argv.push_back("-mask");
    argv.push_back(mask_file);
  }
  argv.push_back(func_file);
  return argv;
}

std::vector<std::string>
AfniToolRunner::QualityCommand(const std::string &func_file) {
  return {"3dTqual", func_file};
}

std::string AfniToolRunner::JoinCommandLine(const std::vector<std::string> &argv) {
  std::string command_line;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      command_line += " ";
    }
    command_line += argv[i];
  }
  return command_line;
}

int AfniToolRunner::ReadUntilEOF(int fd, std::string &output) {
  char buffer[4096];
  for (;;) {
    const ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      output.append(buffer, static_cast<size_t>(n));
    } else if (n == 0) {
      return 0;
    } else if (errno != EINTR) {
      return errno;
    }
  }
}

} // namespace external
} // namespace neuroqap
