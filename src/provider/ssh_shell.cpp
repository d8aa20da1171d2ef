/**
 * @file ssh_shell.cpp
 * @brief SshRemoteShell implementation (fork/exec + poll).
 */

#include "provider/ssh_shell.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace openstack_exporter {

namespace {

constexpr int kPollSliceMs = 100;
constexpr size_t kMaxOutput = 64 * 1024;
constexpr Duration kReapSlice{10};

void reap(pid_t pid, bool kill_first) {
    if (kill_first) ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

}  // anonymous namespace

SshRemoteShell::SshRemoteShell(SshOptions options) : options_(std::move(options)) {}

std::vector<std::string> SshRemoteShell::command_line(const std::string& host,
                                                      const std::string& user,
                                                      const std::string& command) const {
    std::vector<std::string> args{
        options_.binary,
        "-n",
        "-o", "BatchMode=yes",
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "LogLevel=ERROR",
        "-o", "ConnectTimeout=" + std::to_string(options_.connect_timeout_s),
    };
    if (!options_.identity_file.empty()) {
        args.insert(args.end(), {"-i", options_.identity_file});
    }
    args.push_back(user + "@" + host);
    args.push_back(command);
    return args;
}

Result<std::string> SshRemoteShell::run(const std::string& host,
                                        const std::string& user,
                                        const std::string& command,
                                        const Deadline& deadline) {
    if (deadline.expired()) {
        return Error{ErrorKind::Timeout, "ssh " + host + ": deadline exceeded"};
    }

    auto args = command_line(host, user, command);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        return Error{ErrorKind::Internal, "pipe failed: " + std::string(strerror(errno))};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        return Error{ErrorKind::Internal, "fork failed: " + std::string(strerror(errno))};
    }

    if (pid == 0) {
        // The exporter's own stdin is never handed to the remote command.
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            if (null_fd != STDIN_FILENO) ::close(null_fd);
        } else {
            ::close(STDIN_FILENO);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);

    std::string output;
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        if (deadline.expired()) {
            ::close(fds[0]);
            reap(pid, true);
            return Error{ErrorKind::Timeout, "ssh " + host + ": deadline exceeded"};
        }

        auto slice = std::min<Duration::rep>(kPollSliceMs, deadline.remaining().count());
        pollfd pfd{};
        pfd.fd = fds[0];
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(std::max<Duration::rep>(slice, 1)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            ::close(fds[0]);
            reap(pid, true);
            return Error{ErrorKind::Internal, "poll failed: " + std::string(strerror(errno))};
        }
        if (ready == 0) continue;

        auto n = ::read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            if (output.size() < kMaxOutput) output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            eof = true;
        }
    }
    ::close(fds[0]);

    // A child can close its output and keep running; the wait stays bounded.
    int status = 0;
    for (;;) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) break;
        if (waited < 0) {
            if (errno == EINTR) continue;
            return Error{ErrorKind::Internal, "waitpid failed: " + std::string(strerror(errno))};
        }
        if (deadline.expired()) {
            reap(pid, true);
            return Error{ErrorKind::Timeout, "ssh " + host + ": deadline exceeded"};
        }
        deadline.sleep_for(kReapSlice);
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return output;
    }

    std::string reason = WIFEXITED(status)
        ? "exit status " + std::to_string(WEXITSTATUS(status))
        : "killed by signal " + std::to_string(WTERMSIG(status));
    auto last = output.find_last_not_of("\r\n");
    std::string detail = last == std::string::npos ? std::string{} : ": " + output.substr(0, last + 1);
    return Error{ErrorKind::RemoteShell, "ssh " + user + "@" + host + " " + reason + detail};
}

}  // namespace openstack_exporter
