#include "citadel/transport/process_transport.hpp"
#include "citadel/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

extern char** environ;

namespace citadel {

namespace {

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [k, v] : extra) env[k] = v;

    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [k, v] : env) out.push_back(k + "=" + v);
    return out;
}

} // anonymous namespace

std::unique_ptr<ProcessTransport> ProcessTransport::spawn(const ServerDefinition& def) {
    int in_pipe[2], out_pipe[2], exec_pipe[2];
    // CLOEXEC keeps one backend's pipe ends out of every backend spawned later.
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) {
        throw TransportError(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        throw TransportError(std::string("pipe failed: ") + std::strerror(errno));
    }
    // Reports an exec failure from the child; closes itself on a successful exec.
    if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        throw TransportError(std::string("pipe failed: ") + std::strerror(errno));
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> args;
    args.push_back(def.command);
    args.insert(args.end(), def.args.begin(), def.args.end());
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    auto env_strings = merged_environment(def.env);
    std::vector<char*> envp;
    for (auto& e : env_strings) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            ::close(fd);
        }
        throw TransportError(std::string("fork failed: ") + std::strerror(err));
    }
    if (pid == 0) {
        // The gateway ignores SIGPIPE; a backend gets the default back.
        ::signal(SIGPIPE, SIG_DFL);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(exec_pipe[0]);
        // dup2 clears FD_CLOEXEC on the target, except when source and target
        // are the same descriptor.
        if (in_pipe[0] == STDIN_FILENO) {
            ::fcntl(STDIN_FILENO, F_SETFD, 0);
        } else {
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::close(in_pipe[0]);
        }
        if (out_pipe[1] == STDOUT_FILENO) {
            ::fcntl(STDOUT_FILENO, F_SETFD, 0);
        } else {
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::close(out_pipe[1]);
        }
        ::execvpe(def.command.c_str(), argv.data(), envp.data());
        int err = errno;
        ssize_t n = ::write(exec_pipe[1], &err, sizeof(err));
        (void)n;
        ::_exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n > 0) {
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::waitpid(pid, nullptr, 0);
        throw TransportError("Cannot execute '" + def.command + "': " + std::strerror(child_errno));
    }

    spdlog::info("started backend '{}' (pid {}): {}", def.name, pid, def.command);
    // read from the child's stdout, write to its stdin
    return std::unique_ptr<ProcessTransport>(new ProcessTransport(pid, out_pipe[0], in_pipe[1]));
}

ProcessTransport::ProcessTransport(pid_t pid, int read_fd, int write_fd)
    : pid_(pid), stdio_(read_fd, write_fd) {
}

ProcessTransport::~ProcessTransport() {
    stdio_.shutdown();
    terminate();
}

void ProcessTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    stdio_.start(std::move(on_message), std::move(on_error));
}

void ProcessTransport::send(const Envelope& env) {
    stdio_.send(env);
}

void ProcessTransport::shutdown() {
    stdio_.shutdown();
    terminate();
}

bool ProcessTransport::is_connected() const {
    return stdio_.is_connected();
}

void ProcessTransport::terminate() {
    std::call_once(reaped_, [this]() {
        if (::waitpid(pid_, nullptr, WNOHANG) == pid_) return;
        ::kill(pid_, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            if (::waitpid(pid_, nullptr, WNOHANG) == pid_) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        spdlog::warn("backend pid {} ignored SIGTERM; killing", pid_);
        ::kill(pid_, SIGKILL);
        ::waitpid(pid_, nullptr, 0);
    });
}

} // namespace citadel
