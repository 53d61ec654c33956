#include "hostmon/command_runner.hpp"
#include "hostmon/metrics_collector.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace hostmon {

static bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        std::string dir = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path(dir) / name;
            if (is_executable_file(candidate)) {
                return candidate.string();
            }
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return std::nullopt;
}

std::optional<std::string> run_command(const std::string& command) {
    FILE* fp = ::popen(command.c_str(), "r");
    if (!fp) {
        DebugLogger::log("popen failed: ", command);
        return std::nullopt;
    }

    std::string output;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) {
        output.append(buf, n);
    }

    int status = ::pclose(fp);
    if (status != 0) {
        DebugLogger::log("'", command, "' exited with status ", status);
        if (output.empty()) {
            return std::nullopt;
        }
    }
    return output;
}

int spawn_and_wait(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return -1;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return -1;
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execvp(args[0], args.data());
        ::_exit(127); // If exec fails
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

std::vector<std::string> check_dependencies(const std::vector<std::string>& required) {
    std::vector<std::string> missing;
    for (const auto& cmd : required) {
        if (!command_exists(cmd)) {
            missing.push_back(cmd);
        }
    }
    return missing;
}

const std::vector<std::string>& required_utilities() {
    static const std::vector<std::string> utilities = {"ps"};
    return utilities;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

} // namespace hostmon
