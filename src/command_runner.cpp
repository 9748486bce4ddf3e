#include "rebootto/command_runner.hpp"
#include "rebootto/errors.hpp"
#include "rebootto/log.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace rebootto {

namespace {

class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { Close(); }

    int Get() const { return fd_; }
    void Close() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct SpawnActions {
    posix_spawn_file_actions_t actions;
    SpawnActions() { posix_spawn_file_actions_init(&actions); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions); }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;
};

std::string describe(const std::string& name, const std::vector<std::string>& args) {
    std::string cmd = name;
    for (const auto& a : args) cmd += " " + a;
    return cmd;
}

} // namespace

CommandResult ProcessRunner::run(const std::string& name,
                                 const std::vector<std::string>& args,
                                 bool capture_output) {
    const std::string cmd = describe(name, args);
    Logger::verbose("Executing: %s", cmd.c_str());

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(name.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (capture_output && ::pipe2(fds, O_CLOEXEC) != 0) {
        throw LaunchError("pipe failed for '" + cmd + "': " + std::strerror(errno));
    }
    Fd read_end(fds[0]);
    Fd write_end(fds[1]);

    SpawnActions fa;
    if (capture_output) {
        posix_spawn_file_actions_adddup2(&fa.actions, write_end.Get(), STDOUT_FILENO);
    }

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, name.c_str(), &fa.actions, nullptr, argv.data(), environ);
    if (rc != 0) {
        throw LaunchError("failed to execute '" + cmd + "': " + std::strerror(rc));
    }

    CommandResult result;
    if (capture_output) {
        write_end.Close();
        std::array<char, 4096> buffer;
        for (;;) {
            ssize_t n = ::read(read_end.Get(), buffer.data(), buffer.size());
            if (n > 0) {
                result.output.append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw LaunchError("waitpid failed for '" + cmd + "': " + std::strerror(errno));
        }
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    Logger::verbose("'%s' exited with %d", cmd.c_str(), result.exit_code);
    return result;
}

} // namespace rebootto
