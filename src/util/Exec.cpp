#include "util/Exec.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace autogrow::util {

static void close_fd(int& fd) {
  if (fd >= 0) { ::close(fd); fd = -1; }
}

CommandResult ProcessRunner::run(const std::vector<std::string>& argv) {
  CommandResult r{};
  if (argv.empty()) { r.err = "empty command"; return r; }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
    r.err = std::string("pipe: ") + std::strerror(errno);
    close_fd(out_pipe[0]); close_fd(out_pipe[1]);
    close_fd(err_pipe[0]); close_fd(err_pipe[1]);
    return r;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    r.err = std::string("fork: ") + std::strerror(errno);
    close_fd(out_pipe[0]); close_fd(out_pipe[1]);
    close_fd(err_pipe[0]); close_fd(err_pipe[1]);
    return r;
  }
  if (pid == 0) {
    // child: only async-signal-safe calls from here on
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    const char msg[] = "exec failed\n";
    if (::write(STDERR_FILENO, msg, sizeof(msg) - 1) < 0) { /* nothing left to report to */ }
    ::_exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  struct pollfd fds[2] = {
    {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
    {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
  };
  std::string* sinks[2] = {&r.out, &r.err};
  int open_fds = 2;
  char buf[4096];
  while (open_fds > 0) {
    int rv = ::poll(fds, 2, -1);
    if (rv < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        sinks[i]->append(buf, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
  for (auto& f : fds) if (f.fd >= 0) ::close(f.fd);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      r.err += std::string("waitpid: ") + std::strerror(errno);
      return r;
    }
  }
  if (WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
  else r.exit_code = -1;
  return r;
}

std::string find_in_path(const std::string& tool) {
  if (tool.find('/') != std::string::npos) {
    std::error_code ec;
    return std::filesystem::exists(tool, ec) ? tool : std::string();
  }
  const char* path = std::getenv("PATH");
  if (!path) return {};
  std::string p(path);
  size_t start = 0;
  while (start <= p.size()) {
    size_t end = p.find(':', start);
    std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!dir.empty()) {
      std::string cand = dir + "/" + tool;
      if (::access(cand.c_str(), X_OK) == 0) return cand;
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return {};
}

std::string rtrim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
  return s;
}

std::string join_argv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out += ' ';
    out += a;
  }
  return out;
}

} // namespace autogrow::util
