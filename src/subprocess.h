#pragma once

#include "logger.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <sys/types.h>

namespace netlaunch {

#define LOG_PROCESS_DEBUG(message) LOG_DEBUG("process", message)
#define LOG_PROCESS_INFO(message)  LOG_INFO("process", message)
#define LOG_PROCESS_WARN(message)  LOG_WARN("process", message)
#define LOG_PROCESS_ERROR(message) LOG_ERROR("process", message)

enum class ReadStatus {
    LINE,     // a complete line was read
    TIMEOUT,  // nothing arrived before the deadline
    END,      // stdout was closed (process exited or was killed)
    ERROR
};

/**
 * Child process with its stdout exposed as a line stream.
 *
 * The child is killed and reaped when the object is destroyed, so a
 * Subprocess never outlives its owner. kill() may be called from any thread
 * while another thread is blocked in read_line(); the reader then sees END.
 */
class Subprocess {
public:
    explicit Subprocess(std::vector<std::string> argv);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /**
     * Fork and exec the command. stdin and stderr are redirected to /dev/null.
     * @return false if the pipe could not be created or exec failed
     */
    bool start();

    /**
     * Read the next line of output (without the trailing newline)
     * @param line Output parameter receiving the line
     * @param timeout_ms Maximum time to wait, -1 to wait indefinitely
     */
    ReadStatus read_line(std::string& line, int timeout_ms);

    // Sends SIGKILL if the child is still running
    void kill();

    /**
     * Wait for the child to exit and reap it
     * @return exit status, or -1 if the child was killed or never started
     */
    int wait();

    bool is_started() const;
    pid_t pid() const;
    const std::string& command() const { return command_; }

private:
    bool take_buffered_line(std::string& line);
    void close_stdout();

    std::vector<std::string> argv_;
    std::string command_;
    std::string buffer_;
    int stdout_fd_;

    mutable std::mutex pid_mutex_;
    pid_t pid_;
    bool reaped_;
    int exit_status_;
};

/**
 * Set of running subprocesses that can be killed together.
 * Used as the cancellation set of a discovery session.
 */
class ProcessTracker {
public:
    void track(const std::shared_ptr<Subprocess>& process);
    void untrack(const std::shared_ptr<Subprocess>& process);

    // Kills every tracked process and forgets them
    void kill_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::shared_ptr<Subprocess>> processes_;
};

/**
 * Run a command to completion and capture its stdout.
 * The child is killed if it is still running when the deadline passes.
 * @param argv Command and arguments
 * @param timeout_ms Overall deadline
 * @param output Output parameter receiving stdout, lines joined with '\n'
 * @return false if the command could not be started
 */
bool run_command(const std::vector<std::string>& argv, int timeout_ms, std::string& output);

} // namespace netlaunch
