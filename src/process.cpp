/**
 * Mark2Docx — Subprocess execution implementation
 */

#include "process.h"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// ─── Internal helpers ───────────────────────────────────────────────────────

// Owns one file descriptor and closes it on scope exit.
struct PipeFd {
    int fd = -1;
    PipeFd() = default;
    PipeFd(const PipeFd&) = delete;
    PipeFd& operator=(const PipeFd&) = delete;
    ~PipeFd() { reset(); }

    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

static void make_pipe(PipeFd& read_end, PipeFd& write_end) {
    int fds[2];

    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }

    read_end.fd = fds[0];
    write_end.fd = fds[1];
}

// Only async-signal-safe calls between fork and exec. exec_error is built
// before forking; the child appends the errno value in decimal.
[[noreturn]] static void exec_child(char* const* argv, const string& exec_error, int out_fd, int err_fd) {
    ::setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    ::execvp(argv[0], argv);

    int err = errno;
    char digits[16];
    size_t pos = sizeof(digits);
    digits[--pos] = '\n';

    do {
        digits[--pos] = static_cast<char>('0' + err % 10);
        err /= 10;
    } while (err > 0 && pos > 0);

    (void)!::write(STDERR_FILENO, exec_error.data(), exec_error.size());
    (void)!::write(STDERR_FILENO, digits + pos, sizeof(digits) - pos);
    ::_exit(127);
}

// Appends whatever is readable. Returns false on EOF or a hard error.
static bool drain(int fd, string& sink) {
    array<char, 4096> buffer;

    for (;;) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());

        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
            if (static_cast<size_t>(n) < buffer.size()) return true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

static int wait_for(pid_t pid) {
    int status = 0;

    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }

    return decode_status(status);
}

// Reaps pid if it exits before deadline. Returns false when the deadline passed first.
static bool wait_until(pid_t pid, std::chrono::steady_clock::time_point deadline, int& exit_code) {
    for (;;) {
        int status = 0;
        pid_t rc = ::waitpid(pid, &status, WNOHANG);

        if (rc == pid) {
            exit_code = decode_status(status);
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            exit_code = -1;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

static void kill_group(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

// ─── Public API ─────────────────────────────────────────────────────────────

ProcessResult run_process(const vector<string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) throw std::invalid_argument("run_process: empty argv");

    vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);

    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    string exec_error = "failed to execute " + argv[0] + ": errno ";

    PipeFd out_r, out_w, err_r, err_w;
    make_pipe(out_r, out_w);
    make_pipe(err_r, err_w);

    pid_t pid = ::fork();

    if (pid < 0) throw std::system_error(errno, std::generic_category(), "fork");
    if (pid == 0) exec_child(c_argv.data(), exec_error, out_w.fd, err_w.fd);

    // Parent keeps only the read ends so EOF arrives when the child exits.
    ::setpgid(pid, pid);
    out_w.reset();
    err_w.reset();
    ::fcntl(out_r.fd, F_SETFL, ::fcntl(out_r.fd, F_GETFL) | O_NONBLOCK);
    ::fcntl(err_r.fd, F_SETFL, ::fcntl(err_r.fd, F_GETFL) | O_NONBLOCK);

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());

        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        array<pollfd, 2> fds{};
        nfds_t count = 0;

        if (out_open) fds[count++] = {out_r.fd, POLLIN, 0};
        if (err_open) fds[count++] = {err_r.fd, POLLIN, 0};

        int rc = ::poll(fds.data(), count, static_cast<int>(remaining.count()));

        if (rc < 0) {
            int err = errno;

            if (err == EINTR) continue;
            kill_group(pid);
            wait_for(pid);
            throw std::system_error(err, std::generic_category(), "poll");
        }
        if (rc == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            if (fds[i].fd == out_r.fd) out_open = drain(out_r.fd, result.stdout_text);
            else err_open = drain(err_r.fd, result.stderr_text);
        }
    }

    out_r.reset();
    err_r.reset();

    // Both streams can close long before the child exits.
    if (!result.timed_out && wait_until(pid, deadline, result.exit_code)) return result;

    result.timed_out = true;
    kill_group(pid);
    result.exit_code = wait_for(pid);
    return result;
}
