#include "util.h"
#include <lib/logger/src/logger.h>
#include <absl/strings/str_split.h>
#include <cerrno>
#include <cstdlib>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace pgagent {

static read_result_t read_with_timeout(int fd, int timeout_millis, std::string* output) {
  char buf[4096];
  fd_set input_set;
  timeval timeout;

  std::string result;
  while (true) {
    FD_ZERO(&input_set);
    FD_SET(fd, &input_set);

    timeout.tv_sec = timeout_millis / 1000;
    timeout.tv_usec = (timeout_millis % 1000) * 1000L;
    auto ready = select(fd + 1, &input_set, nullptr, nullptr, &timeout);
    if (ready < 0) {
      return read_result_t::error;
    }
    if (ready == 0) {
      return read_result_t::timeout;
    }

    auto read_bytes = read(fd, buf, sizeof buf);
    if (read_bytes < 0) {
      return read_result_t::error;
    }
    if (read_bytes == 0) {
      // end of file
      *output = std::move(result);
      return read_result_t::success;
    }
    result.append(buf, static_cast<std::string::size_type>(read_bytes));
  }
}

CommandOutput run_command(const char* cmd, int timeout_millis) {
  CommandOutput out{read_result_t::error, -1, {}};

  int pipe_descriptors[2];
  char* argp[] = {const_cast<char*>("sh"), const_cast<char*>("-c"), nullptr, nullptr};
  if (pipe(pipe_descriptors) < 0) {
    Logger()->warn("Unable to create a pipe: {}", strerror(errno));
    return out;
  }

  int pid = fork();
  switch (pid) {
    case -1:  // error
      close(pipe_descriptors[0]);
      close(pipe_descriptors[1]);
      Logger()->warn("Unable to fork when trying to read output for {}: {}", cmd, strerror(errno));
      return out;
    case 0:  // child
      // own process group so a timeout also kills whatever the shell started
      setpgid(0, 0);
      close(pipe_descriptors[0]);
      // ensure stdout for the child is the parent's end of the pipe
      if (pipe_descriptors[1] != STDOUT_FILENO) {
        dup2(pipe_descriptors[1], STDOUT_FILENO);
        close(pipe_descriptors[1]);
      }
      argp[2] = const_cast<char*>(cmd);
      execve("/bin/sh", argp, environ);
      // if we couldn't exec the shell just die
      _exit(255);
  }

  // parent
  setpgid(pid, pid);
  close(pipe_descriptors[1]);
  out.result = read_with_timeout(pipe_descriptors[0], timeout_millis, &out.output);
  auto read_errno = errno;
  close(pipe_descriptors[0]);

  if (out.result != read_result_t::success) {
    std::string err_msg;
    if (out.result == read_result_t::timeout) {
      Logger()->warn("timeout - killing child process group (pid={})", pid);
      kill(-pid, SIGKILL);
      err_msg = fmt::format("timeout after {}ms", timeout_millis);
    } else {
      err_msg = strerror(read_errno);
    }
    Logger()->warn("Unable to read output from {}: {}", cmd, err_msg);
  }

  int wait_pid = 0;
  int pstat = 0;
  do {
    wait_pid = waitpid(pid, &pstat, 0);
  } while (wait_pid == -1 && errno == EINTR);

  if (wait_pid == pid && WIFEXITED(pstat)) {
    out.exit_status = WEXITSTATUS(pstat);
  }
  return out;
}

inline bool can_execute_full_path(const std::string& program) {
  return access(program.c_str(), X_OK) == 0;
}

bool can_execute(const std::string& program) {
  if (program.empty()) {
    return false;
  }
  if (program[0] == '/') {
    return can_execute_full_path(program);
  }

  auto path = std::getenv("PATH");
  // should never happen
  if (path == nullptr) {
    return false;
  }

  std::vector<std::string> dirs = absl::StrSplit(path, ':');
  for (const auto& dir : dirs) {
    auto full_path = fmt::format("{}/{}", dir, program);
    if (can_execute_full_path(full_path)) {
      Logger()->debug("Looking for {} found {}", program, full_path);
      return true;
    }
  }
  Logger()->debug("Could not find {} in {}", program, path);
  return false;
}

std::string shell_quote(const std::string& s) {
  std::string quoted{"'"};
  for (auto c : s) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

std::unordered_map<std::string, std::string> parse_tags(const char* s) {
  std::unordered_map<std::string, std::string> tags{};
  auto fields = absl::StrSplit(s, absl::ByAnyChar(", "));
  for (const auto& f : fields) {
    auto pos = f.find('=');
    if (pos != std::string::npos) {
      std::string key = std::string(f.substr(0, pos));
      std::string value = std::string(f.substr(pos + 1, f.length()));
      if (!key.empty() && !value.empty()) {
        tags[key] = value;
      }
    }
  }
  return tags;
}

bool is_file_present(const char* fileName) try {
  return std::filesystem::exists(fileName);
} catch (const std::exception& e) {
  Logger()->error("Exception thrown in is_file_present: {}", e.what());
  return false;
}

std::optional<std::vector<std::string>> read_file(const std::string& filePath) try {
  if (!is_file_present(filePath.c_str())) {
    return std::nullopt;
  }

  std::ifstream file(filePath);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::vector<std::string> lines{};
  std::string line{};
  while (std::getline(file, line)) {
    lines.push_back(line);
  }
  return lines;
} catch (const std::exception& e) {
  Logger()->error("Exception thrown in read_file: {}", e.what());
  return std::nullopt;
}

}  // namespace pgagent
