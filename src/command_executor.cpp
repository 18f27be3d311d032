#include "command_executor.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace gitext {

namespace {

std::shared_ptr<spdlog::logger> executor_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("executor");
  }();
  return logger;
}

constexpr std::chrono::milliseconds kTermGrace{1000};
constexpr std::chrono::milliseconds kReapInterval{20};

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

/// Poll waitpid until the child exits or @p limit passes.
bool reap_within(pid_t pid, std::chrono::milliseconds limit, int &status) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (true) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      return true;
    }
    if (r < 0 && errno != EINTR) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kReapInterval);
  }
}

/// SIGTERM, then SIGKILL once the grace period runs out.
int terminate_child(pid_t pid) {
  int status = 0;
  ::kill(pid, SIGTERM);
  if (!reap_within(pid, kTermGrace, status)) {
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
  return decode_status(status);
}

} // namespace

ProcessOutput PosixCommandRunner::run(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout,
                                      const std::string &cwd) {
  ProcessOutput result;
  if (argv.empty()) {
    result.spawn_failed = true;
    result.exit_code = -1;
    result.output = "empty command";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (::pipe(out_pipe) != 0 || ::pipe(exec_pipe) != 0) {
    result.spawn_failed = true;
    result.exit_code = -1;
    result.output = std::string("pipe: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return result;
  }
  // The exec pipe closes on a successful exec; otherwise the child writes
  // its errno into it.
  ::fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &s : argv)
    cargv.push_back(const_cast<char *>(s.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    result.spawn_failed = true;
    result.exit_code = -1;
    result.output = std::string("fork: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
    return result;
  }

  if (pid == 0) {
    ::close(out_pipe[0]);
    ::close(exec_pipe[0]);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(out_pipe[1], STDERR_FILENO);
    ::close(out_pipe[1]);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      int err = errno;
      (void)!::write(exec_pipe[1], &err, sizeof(err));
      ::_exit(127);
    }
    ::execvp(cargv[0], cargv.data());
    int err = errno;
    (void)!::write(exec_pipe[1], &err, sizeof(err));
    ::_exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_fd(out_pipe[0]);
    result.spawn_failed = true;
    result.exit_code = -1;
    result.output = argv[0] + ": " + std::strerror(child_errno);
    return result;
  }

  const bool limited = timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[4096];
  bool eof = false;
  while (!eof) {
    int wait_ms = -1;
    if (limited) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }
    pollfd pfd{out_pipe[0], POLLIN, 0};
    int rc = ::poll(&pfd, 1, wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (rc == 0)
      continue;
    ssize_t got = ::read(out_pipe[0], buffer, sizeof(buffer));
    if (got > 0) {
      result.output.append(buffer, static_cast<std::size_t>(got));
    } else if (got == 0) {
      eof = true;
    } else if (errno != EINTR && errno != EAGAIN) {
      eof = true;
    }
  }
  close_fd(out_pipe[0]);

  if (result.timed_out) {
    result.exit_code = terminate_child(pid);
    return result;
  }

  int status = 0;
  if (limited) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0 || !reap_within(pid, remaining, status)) {
      result.timed_out = true;
      result.exit_code = terminate_child(pid);
      return result;
    }
  } else {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
  result.exit_code = decode_status(status);
  return result;
}

std::string trim(const std::string &text) {
  const char *ws = " \t\r\n\v\f";
  auto start = text.find_first_not_of(ws);
  if (start == std::string::npos) {
    return "";
  }
  auto end = text.find_last_not_of(ws);
  return text.substr(start, end - start + 1);
}

std::string render_command(const std::vector<std::string> &argv) {
  std::string line;
  for (const auto &arg : argv) {
    if (!line.empty())
      line += ' ';
    if (arg.empty() || arg.find_first_of(" \t\n'\"") != std::string::npos) {
      line += '\'';
      for (char c : arg) {
        if (c == '\'')
          line += "'\\''";
        else
          line += c;
      }
      line += '\'';
    } else {
      line += arg;
    }
  }
  return line;
}

CommandExecutor::CommandExecutor(ExecutorOptions options,
                                 std::shared_ptr<CommandRunner> runner,
                                 std::ostream *echo)
    : options_(std::move(options)), runner_(std::move(runner)),
      echo_(echo ? echo : &std::cout) {
  if (!runner_) {
    runner_ = std::make_shared<PosixCommandRunner>();
  }
}

std::string CommandExecutor::render(const std::vector<std::string> &args) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(options_.git_binary);
  argv.insert(argv.end(), args.begin(), args.end());
  return render_command(argv);
}

CommandResult CommandExecutor::execute(const std::vector<std::string> &args) {
  if (options_.dry_run) {
    auto line = render(args);
    executor_log()->debug("dry-run: skipping '{}'", line);
    *echo_ << "[DRY RUN] " << line << '\n';
    return {};
  }
  std::vector<std::string> argv{options_.git_binary};
  argv.insert(argv.end(), args.begin(), args.end());
  return invoke(argv);
}

CommandResult CommandExecutor::query(const std::vector<std::string> &args) {
  std::vector<std::string> argv{options_.git_binary};
  argv.insert(argv.end(), args.begin(), args.end());
  return invoke(argv);
}

CommandResult
CommandExecutor::run_program(const std::vector<std::string> &argv) {
  return invoke(argv);
}

CommandResult CommandExecutor::invoke(const std::vector<std::string> &argv) {
  const auto line = render_command(argv);
  executor_log()->debug("running '{}' (timeout {}ms)", line,
                        options_.timeout.count());
  ProcessOutput raw =
      runner_->run(argv, options_.timeout, options_.working_directory);

  CommandResult result;
  result.output = trim(raw.output);
  if (options_.verbose) {
    *echo_ << "$ " << line << '\n';
    if (!result.output.empty()) {
      *echo_ << result.output << '\n';
    }
  }

  if (raw.spawn_failed) {
    result.error = ExecutionError{ExecutionErrorKind::SpawnFailure, line,
                                  result.output, -1};
  } else if (raw.timed_out) {
    result.error = ExecutionError{ExecutionErrorKind::Timeout, line,
                                  result.output, raw.exit_code};
  } else if (raw.exit_code != 0) {
    result.error = ExecutionError{ExecutionErrorKind::NonZeroExit, line,
                                  result.output, raw.exit_code};
  }
  if (result.error) {
    executor_log()->debug("'{}' failed ({}, status {})", line,
                          to_string(result.error->kind), raw.exit_code);
  }
  return result;
}

} // namespace gitext
