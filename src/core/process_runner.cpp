#include "process_runner.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

void ProcessRunner::append_capped(ProcessResult &result, const char *data,
                                  std::size_t size, std::size_t max_output) {
  result.output.append(data, size);
  if (result.output.size() > max_output) {
    result.output.erase(0, result.output.size() - max_output);
    result.truncated = true;
  }
}

int ProcessRunner::kill_group(int pid) {
  int status = 0;
  ::kill(-pid, SIGTERM);

  // Give it 100ms to terminate gracefully
  for (int i = 0; i < 10; ++i) {
    if (::waitpid(pid, &status, WNOHANG) == pid) {
      return status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  ::kill(-pid, SIGKILL);
  while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
  return status;
}

ProcessResult ProcessRunner::run(const std::string &command,
                                 const std::filesystem::path &working_dir,
                                 std::chrono::milliseconds timeout,
                                 std::size_t max_output,
                                 const std::atomic<bool> *cancel) {
  ProcessResult result;

  int pipefd[2];
  if (::pipe2(pipefd, O_CLOEXEC) == -1) {
    result.spawn_failed = true;
    result.output = std::string("pipe() failed: ") + std::strerror(errno);
    return result;
  }

  // Everything the child touches is prepared before fork.
  const std::string dir = working_dir.string();
  const char *dir_c = dir.empty() ? nullptr : dir.c_str();
  const char *command_c = command.c_str();

  pid_t pid = ::fork();

  if (pid == -1) {
    ::close(pipefd[0]);
    ::close(pipefd[1]);
    result.spawn_failed = true;
    result.output = std::string("fork() failed: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(pipefd[1], STDOUT_FILENO);
    ::dup2(pipefd[1], STDERR_FILENO);

    if (dir_c && ::chdir(dir_c) != 0) {
      static const char msg[] = "cannot enter working directory\n";
      ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
      (void)ignored;
      ::_exit(126);
    }

    ::execl("/bin/sh", "sh", "-c", command_c, static_cast<char *>(nullptr));
    ::_exit(127);
  }

  // Either side may win the race; both set the same group.
  ::setpgid(pid, pid);
  ::close(pipefd[1]);
  int flags = ::fcntl(pipefd[0], F_GETFL, 0);
  ::fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

  auto start = std::chrono::steady_clock::now();
  char buffer[4096];
  bool eof = false;
  int status = 0;
  bool reaped = false;

  while (true) {
    if (!eof) {
      pollfd pfd{pipefd[0], POLLIN, 0};
      int ready = ::poll(&pfd, 1, 20);
      if (ready > 0) {
        ssize_t n = ::read(pipefd[0], buffer, sizeof(buffer));
        if (n > 0) {
          append_capped(result, buffer, static_cast<std::size_t>(n), max_output);
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
          eof = true;
        }
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (::waitpid(pid, &status, WNOHANG) == pid) {
      reaped = true;
      break;
    }

    if (cancel && cancel->load()) {
      status = kill_group(pid);
      reaped = true;
      result.cancelled = true;
      break;
    }

    if (std::chrono::steady_clock::now() - start >= timeout) {
      status = kill_group(pid);
      reaped = true;
      result.timed_out = true;
      break;
    }
  }

  // Whatever the child wrote before exiting is still in the pipe.
  if (!eof) {
    ssize_t n;
    while ((n = ::read(pipefd[0], buffer, sizeof(buffer))) > 0) {
      append_capped(result, buffer, static_cast<std::size_t>(n), max_output);
    }
  }
  ::close(pipefd[0]);

  if (reaped && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (reaped && WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }

  return result;
}
