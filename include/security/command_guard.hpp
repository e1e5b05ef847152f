#pragma once

#include "core/error.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace personaguard {

class SecurityLog;

/**
 * @brief Allow-list gate for external process execution
 *
 * The executable must be a bare name from the allow-list; every argument
 * must match [A-Za-z0-9._/-]+ and must not be an option that lets the
 * tool run another program. run() spawns by argument vector (fork/execvp),
 * never through a shell.
 */
class CommandGuard {
public:
    struct Config {
        std::vector<std::string> allowed_executables = {"git", "npm", "node"};
        size_t max_args = 64;
        size_t max_arg_length = 1024;
        std::chrono::milliseconds timeout{30'000};
        size_t max_output_bytes = 1024 * 1024;
    };

    struct CommandOutput {
        int exit_code = -1;
        std::string stdout_data;
        std::string stderr_data;
        bool timed_out = false;
        bool truncated = false;
    };

    explicit CommandGuard(SecurityLog& log) : CommandGuard(log, Config{}) {}
    CommandGuard(SecurityLog& log, Config config);

    [[nodiscard]] bool is_safe(std::string_view executable,
                               const std::vector<std::string>& args) const;

    [[nodiscard]] Result<CommandOutput> run(const std::string& executable,
                                            const std::vector<std::string>& args,
                                            const std::filesystem::path& working_dir = {}) const;

    [[nodiscard]] static bool is_safe_argument(std::string_view arg);

private:
    bool reject(std::string_view executable, std::string reason) const;

    SecurityLog& log_;
    Config config_;
};

} // namespace personaguard
