#include "process/PosixProcess.hpp"

#include <fcntl.h>
#include <linux/close_range.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

using namespace onionsite;

namespace {

struct Pipe {
    int rd = -1;
    int wr = -1;

    Pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw LaunchError(std::string("pipe failed: ") + std::strerror(errno));
        }
        rd = fds[0];
        wr = fds[1];
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    void close_read()  { if (rd >= 0) { ::close(rd); rd = -1; } }
    void close_write() { if (wr >= 0) { ::close(wr); wr = -1; } }
};

ssize_t read_retry(int fd, void* buf, size_t len) {
    ssize_t n;
    do {
        n = ::read(fd, buf, len);
    } while (n < 0 && errno == EINTR);
    return n;
}

pid_t waitpid_retry(pid_t pid, int* status, int options) {
    pid_t r;
    do {
        r = ::waitpid(pid, status, options);
    } while (r < 0 && errno == EINTR);
    return r;
}

// ---------------------------------------------------------------------------
// fork + execvp. Exec failure is reported back through a close-on-exec pipe:
// a successful exec closes the write end (EOF, zero bytes), a failed one
// writes errno before _exit(127). That turns "binary missing" into a
// LaunchError here instead of an indistinguishable exit status later.
//
// stdout_fd >= 0 is dup'ed onto the child's stdout. Nothing else above
// stderr survives the exec, in particular not the listening sockets, which
// Asio opens without SOCK_CLOEXEC.
// ---------------------------------------------------------------------------
pid_t spawn(const Command& cmd, int stdout_fd) {
    // Everything the child touches is built before fork().
    std::vector<std::string> words;
    words.reserve(cmd.args.size() + 1);
    words.push_back(cmd.program);
    words.insert(words.end(), cmd.args.begin(), cmd.args.end());

    std::vector<char*> argv;
    argv.reserve(words.size() + 1);
    for (auto& w : words) argv.push_back(&w[0]);
    argv.push_back(nullptr);

    long open_max = ::sysconf(_SC_OPEN_MAX);
    const int fd_limit = open_max > 0 && open_max < 65536 ? static_cast<int>(open_max) : 65536;

    Pipe err;
    pid_t pid = ::fork();
    if (pid < 0) {
        throw LaunchError(cmd.program + ": fork failed: " + std::strerror(errno));
    }

    if (pid == 0) {
        ::close(err.rd);
        if (stdout_fd >= 0 && stdout_fd != STDOUT_FILENO) {
            ::dup2(stdout_fd, STDOUT_FILENO);
        }
        // The new program starts with an empty signal mask.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        // close_range(CLOEXEC) needs Linux 5.11; older kernels get the loop.
        if (::close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) != 0) {
            for (int fd = 3; fd < fd_limit; ++fd) ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        }

        ::execvp(argv[0], argv.data());

        int e = errno;
        ssize_t ignored = ::write(err.wr, &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    err.close_write();
    int child_errno = 0;
    ssize_t n = read_retry(err.rd, &child_errno, sizeof(child_errno));
    if (n > 0) {
        int status = 0;
        waitpid_retry(pid, &status, 0);
        throw LaunchError(cmd.program + ": " + std::strerror(child_errno));
    }
    return pid;
}

} // namespace

PosixProcessHandle::~PosixProcessHandle() {
    if (status_) return;
    kill();
    try {
        wait();
    } catch (const std::system_error&) {
        // Already reaped elsewhere; nothing left to release.
    }
}

std::optional<ExitStatus> PosixProcessHandle::try_wait() {
    if (status_) return status_;

    int status = 0;
    pid_t r = waitpid_retry(pid_, &status, WNOHANG);
    if (r < 0) throw std::system_error(errno, std::generic_category(), "waitpid");
    if (r == 0) return std::nullopt;

    status_ = ExitStatus::from_wait_status(status);
    return status_;
}

ExitStatus PosixProcessHandle::wait() {
    if (status_) return *status_;

    int status = 0;
    if (waitpid_retry(pid_, &status, 0) < 0) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    status_ = ExitStatus::from_wait_status(status);
    return *status_;
}

void PosixProcessHandle::kill() {
    if (status_) return;
    ::kill(pid_, SIGKILL);
}

std::unique_ptr<ProcessHandle> PosixProcessLauncher::launch(const Command& cmd) {
    return std::make_unique<PosixProcessHandle>(spawn(cmd, -1));
}

CommandResult PosixCommandRunner::run(const Command& cmd) {
    Pipe out;
    PosixProcessHandle child(spawn(cmd, out.wr));
    out.close_write();

    std::string output;
    char buf[4096];
    for (;;) {
        ssize_t n = read_retry(out.rd, buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) throw std::system_error(errno, std::generic_category(), "read " + cmd.program);
        output.append(buf, static_cast<size_t>(n));
    }

    return CommandResult{child.wait(), std::move(output)};
}
