#pragma once
#include <string>
#include <vector>

namespace autogrow::util {

struct CommandResult {
  int exit_code{-1};  // 127: could not exec, -1: fork/pipe failure or killed by signal
  std::string out;
  std::string err;
  [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// Runs external tools. Swapped for a scripted fake in tests.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;
  [[nodiscard]] virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp with stdout and stderr captured separately. No shell involved.
class ProcessRunner : public ICommandRunner {
public:
  [[nodiscard]] CommandResult run(const std::vector<std::string>& argv) override;
};

// Resolve a program name against $PATH. Empty string if not found.
[[nodiscard]] std::string find_in_path(const std::string& tool);

// Strip trailing whitespace/newlines
[[nodiscard]] std::string rtrim(std::string s);

// Joined argv for log lines
[[nodiscard]] std::string join_argv(const std::vector<std::string>& argv);

} // namespace autogrow::util
