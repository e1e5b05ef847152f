#include "security/command_guard.hpp"
#include "audit/security_log.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace personaguard {

namespace {

// Options that make git/npm execute an arbitrary program or rewrite config
constexpr std::array<std::string_view, 6> kDangerousOptions = {
    "--upload-pack", "--receive-pack", "--exec", "-c", "--config", "--node-options",
};

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] bool ok() const { return fds_[0] >= 0; }
    [[nodiscard]] int read_end() const { return fds_[0]; }
    [[nodiscard]] int write_end() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) { ::close(fds_[0]); fds_[0] = -1; }
    }
    void close_write() {
        if (fds_[1] >= 0) { ::close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2] = {-1, -1};
};

} // namespace

CommandGuard::CommandGuard(SecurityLog& log, Config config)
    : log_(log),
      config_(std::move(config)) {}

bool CommandGuard::is_safe_argument(std::string_view arg) {
    if (arg.empty()) return false;
    return std::ranges::all_of(arg, [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '/';
    });
}

bool CommandGuard::reject(std::string_view executable, std::string reason) const {
    log_.record(SecurityEventType::COMMAND_REJECTED, Severity::HIGH, "CommandGuard",
                std::move(reason), {{"executable", std::string(executable.substr(0, 64))}});
    return false;
}

bool CommandGuard::is_safe(std::string_view executable,
                           const std::vector<std::string>& args) const {
    if (std::ranges::find(config_.allowed_executables, executable) ==
        config_.allowed_executables.end()) {
        return reject(executable, "Executable not in allow-list");
    }
    if (args.size() > config_.max_args) {
        return reject(executable, std::format("Too many arguments ({})", args.size()));
    }
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg.size() > config_.max_arg_length || !is_safe_argument(arg)) {
            return reject(executable, std::format("Argument {} has a disallowed shape", i));
        }
        if (std::ranges::find(kDangerousOptions, arg) != kDangerousOptions.end()) {
            return reject(executable, std::format("Argument {} is a disallowed option", i));
        }
    }
    return true;
}

Result<CommandGuard::CommandOutput> CommandGuard::run(const std::string& executable,
                                                      const std::vector<std::string>& args,
                                                      const std::filesystem::path& working_dir) const {
    using R = Result<CommandOutput>;

    if (!is_safe(executable, args)) {
        return R::error(ErrorCategory::COMMAND_REJECTED,
                        std::format("Command '{}' rejected", executable));
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.ok() || !err_pipe.ok()) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
                        std::format("pipe() failed: {}", std::strerror(errno)));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const std::string cwd = working_dir.string();

    const pid_t pid = ::fork();
    if (pid < 0) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
                        std::format("fork() failed: {}", std::strerror(errno)));
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(out_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            ::_exit(126);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    out_pipe.close_write();
    err_pipe.close_write();

    CommandOutput output;
    std::array<pollfd, 2> fds = {{
        {out_pipe.read_end(), POLLIN, 0},
        {err_pipe.read_end(), POLLIN, 0},
    }};
    std::array<std::string*, 2> sinks = {&output.stdout_data, &output.stderr_data};
    size_t open_streams = 2;
    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;

    while (open_streams > 0) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            output.timed_out = true;
            break;
        }

        const int rc = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            char buf[4096];
            const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                const size_t room = config_.max_output_bytes > sinks[i]->size()
                    ? config_.max_output_bytes - sinks[i]->size() : 0;
                const size_t take = std::min(room, static_cast<size_t>(n));
                sinks[i]->append(buf, take);
                if (take < static_cast<size_t>(n)) output.truncated = true;
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    if (output.timed_out) {
        ::kill(pid, SIGKILL);
        utils::log::warn(std::format("Command '{}' exceeded {}ms and was killed",
                                     executable, config_.timeout.count()));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return R::error(ErrorCategory::INTERNAL_ERROR,
                            std::format("waitpid() failed: {}", std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }
    return R::ok(std::move(output));
}

} // namespace personaguard
