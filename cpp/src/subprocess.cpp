/**
 * @file subprocess.cpp
 * @brief Реализация Subprocess
 */

#include "reprompt/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <utility>

namespace reprompt {

namespace {

using Clock = std::chrono::steady_clock;

void close_fd(int &fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

[[nodiscard]] bool set_nonblocking(int fd) noexcept {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags < 0) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

[[nodiscard]] int remaining_ms(Clock::time_point deadline) noexcept {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - Clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

[[nodiscard]] int decode_wait_status(int status) noexcept {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

Subprocess::Subprocess(std::vector<std::string> argv,
                       std::chrono::milliseconds timeout)
    : argv_{std::move(argv)}, timeout_{timeout} {}

Subprocess::~Subprocess() { cleanup(); }

void Subprocess::cleanup() noexcept {
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);

  if (pid_ > 0) {
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
      if (errno != EINTR) {
        break;
      }
    }
    pid_ = -1;
  }
}

SubprocessResult Subprocess::run(std::string_view input, bool capture_stdout) {
  SubprocessResult result;

  if (argv_.empty()) {
    result.kind = SubprocessResult::Kind::SpawnFailed;
    result.error = "empty command";
    return result;
  }

  // Готовим argv в родителе (в дочернем процессе никаких аллокаций).
  std::vector<char *> argv;
  argv.reserve(argv_.size() + 1);
  for (auto &arg : argv_) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::array<int, 2> in_pipe{-1, -1};
  std::array<int, 2> out_pipe{-1, -1};
  int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);

  auto fail_spawn = [&](const char *what) {
    result.kind = SubprocessResult::Kind::SpawnFailed;
    result.error = std::string{what} + ": " + std::strerror(errno);
    for (int &fd : in_pipe)
      close_fd(fd);
    for (int &fd : out_pipe)
      close_fd(fd);
    close_fd(devnull);
    return result;
  };

  if (devnull < 0) {
    return fail_spawn("open(/dev/null)");
  }
  if (::pipe2(in_pipe.data(), O_CLOEXEC) != 0) {
    return fail_spawn("pipe2");
  }
  if (capture_stdout && ::pipe2(out_pipe.data(), O_CLOEXEC) != 0) {
    return fail_spawn("pipe2");
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    return fail_spawn("fork");
  }

  if (pid == 0) {
    // Дочерний процесс: dup2 снимает O_CLOEXEC с 0/1/2
    (void)::dup2(in_pipe[0], STDIN_FILENO);
    (void)::dup2(capture_stdout ? out_pipe[1] : devnull, STDOUT_FILENO);
    (void)::dup2(devnull, STDERR_FILENO);
    ::signal(SIGPIPE, SIG_DFL);
    ::execvp(argv[0], argv.data());
    _exit(127);
  }

  pid_ = pid;
  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(devnull);
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];

  if (!set_nonblocking(stdin_fd_) ||
      (stdout_fd_ >= 0 && !set_nonblocking(stdout_fd_))) {
    result.kind = SubprocessResult::Kind::IoError;
    result.error = std::string{"fcntl: "} + std::strerror(errno);
    cleanup();
    return result;
  }

  const auto deadline = Clock::now() + timeout_;
  std::size_t written = 0;
  if (input.empty()) {
    close_fd(stdin_fd_);
  }

  std::array<char, 4096> buffer{};
  while (stdin_fd_ >= 0 || stdout_fd_ >= 0) {
    std::array<pollfd, 2> pfds{};
    nfds_t n = 0;
    if (stdin_fd_ >= 0) {
      pfds[n++] = pollfd{stdin_fd_, POLLOUT, 0};
    }
    if (stdout_fd_ >= 0) {
      pfds[n++] = pollfd{stdout_fd_, POLLIN, 0};
    }

    const int wait_ms = remaining_ms(deadline);
    if (wait_ms == 0) {
      result.kind = SubprocessResult::Kind::Timeout;
      result.error = argv_.front() + " timed out";
      cleanup();
      return result;
    }

    int ret = ::poll(pfds.data(), n, wait_ms);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.kind = SubprocessResult::Kind::IoError;
      result.error = std::string{"poll: "} + std::strerror(errno);
      cleanup();
      return result;
    }
    if (ret == 0) {
      continue; // дедлайн проверяется в начале итерации
    }

    for (nfds_t i = 0; i < n; ++i) {
      if (pfds[i].revents == 0) {
        continue;
      }

      if (pfds[i].fd == stdin_fd_) {
        ssize_t w = ::write(stdin_fd_, input.data() + written,
                            input.size() - written);
        if (w < 0) {
          if (errno == EINTR || errno == EAGAIN) {
            continue;
          }
          // EPIPE: процесс закрыл stdin, не дочитав данные
          result.kind = SubprocessResult::Kind::IoError;
          result.error = std::string{"write to "} + argv_.front() + ": " +
                         std::strerror(errno);
          cleanup();
          return result;
        }
        written += static_cast<std::size_t>(w);
        if (written == input.size()) {
          close_fd(stdin_fd_); // EOF для процесса
        }
      } else if (pfds[i].fd == stdout_fd_) {
        ssize_t r = ::read(stdout_fd_, buffer.data(), buffer.size());
        if (r < 0) {
          if (errno == EINTR || errno == EAGAIN) {
            continue;
          }
          result.kind = SubprocessResult::Kind::IoError;
          result.error = std::string{"read from "} + argv_.front() + ": " +
                         std::strerror(errno);
          cleanup();
          return result;
        }
        if (r == 0) {
          close_fd(stdout_fd_);
        } else {
          result.output.append(buffer.data(), static_cast<std::size_t>(r));
        }
      }
    }
  }

  // Ожидание завершения с тем же дедлайном
  while (true) {
    int status = 0;
    pid_t done = ::waitpid(pid_, &status, WNOHANG);
    if (done == pid_) {
      pid_ = -1;
      result.exit_code = decode_wait_status(status);
      break;
    }
    if (done < 0 && errno != EINTR) {
      pid_ = -1;
      result.kind = SubprocessResult::Kind::IoError;
      result.error = std::string{"waitpid: "} + std::strerror(errno);
      return result;
    }
    if (remaining_ms(deadline) == 0) {
      result.kind = SubprocessResult::Kind::Timeout;
      result.error = argv_.front() + " did not exit in time";
      cleanup();
      return result;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }

  if (result.exit_code == 127) {
    result.error = argv_.front() + ": command not found";
  } else if (result.exit_code != 0) {
    result.error =
        argv_.front() + " exited with code " + std::to_string(result.exit_code);
  }

  result.kind = SubprocessResult::Kind::Exited;
  return result;
}

bool find_in_path(std::string_view program) {
  if (program.empty()) {
    return false;
  }

  std::string name{program};
  if (name.find('/') != std::string::npos) {
    return ::access(name.c_str(), X_OK) == 0;
  }

  const char *path = std::getenv("PATH");
  if (!path) {
    return false;
  }

  std::string_view dirs{path};
  while (!dirs.empty()) {
    std::size_t colon = dirs.find(':');
    std::string_view dir = dirs.substr(0, colon);
    if (!dir.empty()) {
      std::string candidate{dir};
      candidate += '/';
      candidate += name;
      if (::access(candidate.c_str(), X_OK) == 0) {
        return true;
      }
    }
    if (colon == std::string_view::npos) {
      break;
    }
    dirs.remove_prefix(colon + 1);
  }

  return false;
}

} // namespace reprompt
