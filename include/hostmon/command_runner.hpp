#pragma once

#include <string>
#include <vector>
#include <optional>

namespace hostmon {

// Full path of an executable found on $PATH; names containing '/' are checked as given
std::optional<std::string> find_executable(const std::string& name);

inline bool command_exists(const std::string& name) {
    return find_executable(name).has_value();
}

// Runs through /bin/sh and captures stdout. std::nullopt when the command
// could not be started or exited non-zero without output.
std::optional<std::string> run_command(const std::string& command);

// fork/execvp with stdout and stderr discarded. Returns the exit status, -1 on spawn failure.
int spawn_and_wait(const std::vector<std::string>& argv);

// Names from required that are not on $PATH
std::vector<std::string> check_dependencies(const std::vector<std::string>& required);

// Utilities the monitor cannot run without
const std::vector<std::string>& required_utilities();

std::vector<std::string> split_lines(const std::string& text);

} // namespace hostmon
