#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgagent {

enum class read_result_t { timeout, error, success };

struct CommandOutput {
  read_result_t result;
  // exit status of the child, -1 if it did not exit normally
  int exit_status;
  std::string output;
};

// Execute cmd using the shell, capturing its stdout. The shell and everything it started
// are killed if the output is not complete within timeout_millis
CommandOutput run_command(const char* cmd, int timeout_millis = 1000);

// determine whether the program passed is available
bool can_execute(const std::string& program);

// quote s so the shell passes it through as a single argument
std::string shell_quote(const std::string& s);

// parse a string of the form key=val,key2=val2 into tags
std::unordered_map<std::string, std::string> parse_tags(const char* s);

bool is_file_present(const char* fileName);

std::optional<std::vector<std::string>> read_file(const std::string& filePath);

}  // namespace pgagent
