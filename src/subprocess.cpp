#include "subprocess.h"
#include <chrono>
#include <thread>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

namespace netlaunch {

Subprocess::Subprocess(std::vector<std::string> argv)
    : argv_(std::move(argv)),
      stdout_fd_(-1),
      pid_(-1),
      reaped_(false),
      exit_status_(-1) {
    for (size_t i = 0; i < argv_.size(); ++i) {
        if (i > 0) command_ += " ";
        command_ += argv_[i];
    }
}

Subprocess::~Subprocess() {
    kill();
    wait();
    close_stdout();
}

bool Subprocess::start() {
    if (argv_.empty()) {
        LOG_PROCESS_ERROR("Cannot start an empty command");
        return false;
    }

    int out_pipe[2];
    int exec_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        LOG_PROCESS_ERROR("pipe2 failed for '" << command_ << "': " << strerror(errno));
        return false;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        LOG_PROCESS_ERROR("pipe2 failed for '" << command_ << "': " << strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        return false;
    }

    // Build the exec arguments before forking
    std::vector<char*> exec_argv;
    exec_argv.reserve(argv_.size() + 1);
    for (auto& arg : argv_) {
        exec_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_argv.push_back(nullptr);

    pid_t child = fork();
    if (child < 0) {
        LOG_PROCESS_ERROR("fork failed for '" << command_ << "': " << strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return false;
    }

    if (child == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        execvp(exec_argv[0], exec_argv.data());

        int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(exec_pipe[1]);

    // exec_pipe is close-on-exec: EOF means exec succeeded, data means it failed
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    {
        std::lock_guard<std::mutex> lock(pid_mutex_);
        pid_ = child;
        reaped_ = false;
    }

    if (n > 0) {
        LOG_PROCESS_WARN("Failed to execute '" << command_ << "': " << strerror(exec_errno));
        close(out_pipe[0]);
        wait();
        return false;
    }

    stdout_fd_ = out_pipe[0];
    LOG_PROCESS_DEBUG("Started '" << command_ << "' (pid " << child << ")");
    return true;
}

ReadStatus Subprocess::read_line(std::string& line, int timeout_ms) {
    if (take_buffered_line(line)) {
        return ReadStatus::LINE;
    }

    if (stdout_fd_ < 0) {
        return ReadStatus::END;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                return ReadStatus::TIMEOUT;
            }
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_PROCESS_ERROR("poll failed on '" << command_ << "': " << strerror(errno));
            return ReadStatus::ERROR;
        }
        if (rc == 0) {
            return ReadStatus::TIMEOUT;
        }

        char chunk[4096];
        ssize_t n = read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_PROCESS_ERROR("read failed on '" << command_ << "': " << strerror(errno));
            return ReadStatus::ERROR;
        }

        if (n == 0) {
            close_stdout();
            // Final line without a trailing newline
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                return ReadStatus::LINE;
            }
            return ReadStatus::END;
        }

        buffer_.append(chunk, static_cast<size_t>(n));
        if (take_buffered_line(line)) {
            return ReadStatus::LINE;
        }
    }
}

bool Subprocess::take_buffered_line(std::string& line) {
    size_t newline = buffer_.find('\n');
    if (newline == std::string::npos) {
        return false;
    }

    line = buffer_.substr(0, newline);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    buffer_.erase(0, newline + 1);
    return true;
}

void Subprocess::kill() {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, SIGKILL);
    }
}

int Subprocess::wait() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(pid_mutex_);
            if (pid_ <= 0 || reaped_) {
                return exit_status_;
            }

            int status = 0;
            pid_t rc = waitpid(pid_, &status, WNOHANG);
            if (rc == pid_) {
                reaped_ = true;
                exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
                LOG_PROCESS_DEBUG("'" << command_ << "' exited with status " << exit_status_);
                return exit_status_;
            }
            if (rc < 0 && errno != EINTR) {
                reaped_ = true;
                return exit_status_;
            }
        }

        // Poll rather than block so kill() is never locked out
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

bool Subprocess::is_started() const {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    return pid_ > 0;
}

pid_t Subprocess::pid() const {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    return pid_;
}

void Subprocess::close_stdout() {
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

void ProcessTracker::track(const std::shared_ptr<Subprocess>& process) {
    std::lock_guard<std::mutex> lock(mutex_);
    processes_.insert(process);
}

void ProcessTracker::untrack(const std::shared_ptr<Subprocess>& process) {
    std::lock_guard<std::mutex> lock(mutex_);
    processes_.erase(process);
}

void ProcessTracker::kill_all() {
    std::unordered_set<std::shared_ptr<Subprocess>> to_kill;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_kill.swap(processes_);
    }

    for (const auto& process : to_kill) {
        LOG_PROCESS_DEBUG("Killing '" << process->command() << "'");
        process->kill();
    }
}

size_t ProcessTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

bool run_command(const std::vector<std::string>& argv, int timeout_ms, std::string& output) {
    output.clear();

    Subprocess process(argv);
    if (!process.start()) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string line;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            LOG_PROCESS_WARN("'" << process.command() << "' timed out after " << timeout_ms << "ms");
            break;
        }

        ReadStatus status = process.read_line(line, static_cast<int>(remaining));
        if (status == ReadStatus::LINE) {
            output += line;
            output += '\n';
            continue;
        }
        if (status == ReadStatus::TIMEOUT) {
            LOG_PROCESS_WARN("'" << process.command() << "' timed out after " << timeout_ms << "ms");
        }
        break;
    }

    process.kill();
    process.wait();
    return true;
}

} // namespace netlaunch
