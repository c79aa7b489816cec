#include "cligate/sandbox/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cligate::sandbox {

namespace {

constexpr int kPollIntervalMs = 20;

common::Error infrastructure_error(std::string message) {
  return common::Error{.code = common::ErrorCode::Infrastructure, .message = std::move(message)};
}

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Drains whatever is available. The descriptor is closed at EOF so poll()
// stops reporting it.
void read_into_buffer(int &fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (fd >= 0) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      return;
    }
    close_fd(fd);
  }
}

// Writes as much pending stdin as the pipe accepts. Closes the pipe when
// everything is written or the child stopped reading.
void feed_stdin(int &fd, const std::string &input, std::size_t &offset) {
  while (fd >= 0 && offset < input.size()) {
    const ssize_t written = write(fd, input.data() + offset, input.size() - offset);
    if (written > 0) {
      offset += static_cast<std::size_t>(written);
      continue;
    }
    if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    if (written < 0 && errno == EINTR) {
      continue;
    }
    // EPIPE or another hard error: the child will not read any more.
    close_fd(fd);
    return;
  }
  close_fd(fd);
}

void kill_process_group(const pid_t pid) {
  if (kill(-pid, SIGKILL) != 0) {
    (void)kill(pid, SIGKILL);
  }
}

struct Pipe {
  int fds[2] = {-1, -1};

  bool open() { return pipe(fds) == 0; }
  int &read_end() { return fds[0]; }
  int &write_end() { return fds[1]; }
  ~Pipe() {
    close_fd(fds[0]);
    close_fd(fds[1]);
  }
};

} // namespace

PosixProcessRunner::PosixProcessRunner() {
  // A child that exits before consuming stdin must surface as EPIPE, not kill us.
  std::signal(SIGPIPE, SIG_IGN);
}

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &argv,
                                                      const ProcessOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<ProcessResult>::failure(common::Error{
        .code = common::ErrorCode::Configuration, .message = "process command is empty"});
  }

  Pipe stdin_pipe;
  Pipe stdout_pipe;
  Pipe stderr_pipe;
  if (!stdin_pipe.open() || !stdout_pipe.open() || !stderr_pipe.open()) {
    return common::Result<ProcessResult>::failure(
        infrastructure_error("failed to create pipes for " + argv.front()));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<ProcessResult>::failure(
        infrastructure_error("failed to fork process for " + argv.front()));
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(stdin_pipe.read_end(), STDIN_FILENO);
    (void)dup2(stdout_pipe.write_end(), STDOUT_FILENO);
    (void)dup2(stderr_pipe.write_end(), STDERR_FILENO);
    close(stdin_pipe.read_end());
    close(stdin_pipe.write_end());
    close(stdout_pipe.read_end());
    close(stdout_pipe.write_end());
    close(stderr_pipe.read_end());
    close(stderr_pipe.write_end());

    std::vector<char *> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      child_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    execvp(child_argv[0], child_argv.data());
    _exit(127);
  }

  close_fd(stdin_pipe.read_end());
  close_fd(stdout_pipe.write_end());
  close_fd(stderr_pipe.write_end());
  set_non_blocking(stdin_pipe.write_end());
  set_non_blocking(stdout_pipe.read_end());
  set_non_blocking(stderr_pipe.read_end());

  const std::string input = options.stdin_text.value_or("");
  std::size_t input_offset = 0;
  int &stdin_fd = stdin_pipe.write_end();

  ProcessResult result;
  int status = 0;

  while (true) {
    feed_stdin(stdin_fd, input, input_offset);
    read_into_buffer(stdout_pipe.read_end(), result.stdout_text);
    read_into_buffer(stderr_pipe.read_end(), result.stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    if (std::chrono::steady_clock::now() >= options.deadline) {
      result.termination = ProcessTermination::TimedOut;
    } else if (options.should_abort && options.should_abort()) {
      result.termination = ProcessTermination::Aborted;
    }
    if (result.termination != ProcessTermination::Exited) {
      kill_process_group(pid);
      (void)waitpid(pid, &status, 0);
      break;
    }

    std::array<pollfd, 3> poll_fds = {
        pollfd{.fd = stdout_pipe.read_end(), .events = POLLIN, .revents = 0},
        pollfd{.fd = stderr_pipe.read_end(), .events = POLLIN, .revents = 0},
        pollfd{.fd = stdin_fd, .events = POLLOUT, .revents = 0},
    };
    (void)poll(poll_fds.data(), poll_fds.size(), kPollIntervalMs);
  }

  read_into_buffer(stdout_pipe.read_end(), result.stdout_text);
  read_into_buffer(stderr_pipe.read_end(), result.stderr_text);

  if (result.termination != ProcessTermination::Exited) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }

  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace cligate::sandbox
