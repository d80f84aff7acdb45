#include "process/ProcessHandle.h"
#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <poll.h>

namespace {
void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void closePipe(int fds[2]) {
    closeFd(fds[0]);
    closeFd(fds[1]);
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Splits complete lines out of buffer; keeps the trailing partial line.
template <typename Emit>
void emitLines(std::string& buffer, Emit emit) {
    std::size_t start = 0;
    while (true) {
        std::size_t nl = buffer.find('\n', start);
        if (nl == std::string::npos) break;
        std::string line = buffer.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        emit(line);
        start = nl + 1;
    }
    buffer.erase(0, start);
}
} // namespace

ProcessHandle::ProcessHandle(const std::string& program, const std::vector<std::string>& args)
    : program(program), args(args) {}

ProcessHandle::~ProcessHandle() {
    bool alive = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        alive = running;
    }
    if (alive) {
        signalGroup(SIGKILL);
    }
    if (monitorThread.joinable()) {
        if (monitorThread.get_id() == std::this_thread::get_id()) {
            // Released from inside its own onExited callback; the loop has finished with *this.
            monitorThread.detach();
        } else {
            monitorThread.join();
        }
    }
    closeFd(outFd);
    closeFd(errFd);
}

void ProcessHandle::fail(const std::string& message) {
    if (callbacks.onFailed) {
        callbacks.onFailed(message);
    }
}

void ProcessHandle::start(ProcessCallbacks cb) {
    callbacks = std::move(cb);
    bool alreadyStarted = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        alreadyStarted = pid > 0;
    }
    if (alreadyStarted) {
        fail("process already started");
        return;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(statusPipe, O_CLOEXEC) != 0) {
        std::string reason = std::strerror(errno);
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(statusPipe);
        fail("pipe: " + reason);
        return;
    }

    // argv is built before fork so the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t child = fork();
    if (child == -1) {
        std::string reason = std::strerror(errno);
        closePipe(outPipe);
        closePipe(errPipe);
        closePipe(statusPipe);
        fail("fork: " + reason);
        return;
    }

    if (child == 0) { // Child
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close(outPipe[1]);
    close(errPipe[1]);
    close(statusPipe[1]);

    // EOF on the status pipe means exec succeeded (the write end was close-on-exec)
    int childErrno = 0;
    ssize_t n;
    do {
        n = read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    close(statusPipe[0]);

    if (n > 0) {
        int status = 0;
        waitpid(child, &status, 0);
        close(outPipe[0]);
        close(errPipe[0]);
        fail(program + ": " + std::strerror(childErrno));
        return;
    }

    fcntl(outPipe[0], F_SETFL, fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(errPipe[0], F_SETFL, fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    {
        std::lock_guard<std::mutex> lock(mtx);
        pid = child;
        outFd = outPipe[0];
        errFd = errPipe[0];
        running = true;
        exited = false;
    }

    if (callbacks.onStarted) {
        callbacks.onStarted(static_cast<int>(child));
    }
    monitorThread = std::thread(&ProcessHandle::monitorLoop, this);
}

void ProcessHandle::monitorLoop() {
    std::string outBuf;
    std::string errBuf;
    bool outOpen = true;
    bool errOpen = true;
    bool reaped = false;
    int status = 0;
    char temp[4096];

    auto deliver = [this](OutputStream stream, const std::string& line) {
        if (callbacks.onOutput) callbacks.onOutput(stream, line);
    };

    // Reads whatever is available; returns false once the fd reached EOF or errored.
    auto pump = [&](int fd, std::string& buffer, OutputStream stream) {
        while (true) {
            ssize_t n = read(fd, temp, sizeof(temp));
            if (n > 0) {
                buffer.append(temp, temp + n);
                emitLines(buffer, [&](const std::string& line) { deliver(stream, line); });
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
            return false;
        }
    };

    while (true) {
        if (outOpen || errOpen) {
            pollfd fds[2];
            int count = 0;
            if (outOpen) fds[count++] = {outFd, POLLIN, 0};
            if (errOpen) fds[count++] = {errFd, POLLIN, 0};
            poll(fds, count, 100);
            if (outOpen) outOpen = pump(outFd, outBuf, OutputStream::Stdout);
            if (errOpen) errOpen = pump(errFd, errBuf, OutputStream::Stderr);
        }

        if (!reaped) {
            pid_t r;
            if (outOpen || errOpen) {
                r = waitpid(pid, &status, WNOHANG);
            } else {
                // Both pipes closed: nothing more to read, block until the child is gone
                do {
                    r = waitpid(pid, &status, 0);
                } while (r < 0 && errno == EINTR);
            }
            if (r == pid || (r < 0 && errno == ECHILD)) {
                reaped = true;
            }
        }

        if (reaped) {
            // A grandchild may still hold the pipes; take what is buffered and stop.
            if (outOpen) pump(outFd, outBuf, OutputStream::Stdout);
            if (errOpen) pump(errFd, errBuf, OutputStream::Stderr);
            break;
        }
    }

    if (!outBuf.empty()) deliver(OutputStream::Stdout, outBuf);
    if (!errBuf.empty()) deliver(OutputStream::Stderr, errBuf);

    int code = decodeStatus(status);
    auto onExited = callbacks.onExited;
    {
        std::lock_guard<std::mutex> lock(mtx);
        closeFd(outFd);
        closeFd(errFd);
        running = false;
        exited = true;
        exitCode = code;
    }
    cv.notify_all();

    if (onExited) {
        onExited(code);
    }
}

bool ProcessHandle::signalGroup(int sig) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!running || pid <= 0) return false;
    if (::kill(-pid, sig) == 0) return true;
    return ::kill(pid, sig) == 0;
}

bool ProcessHandle::terminate() {
    return signalGroup(SIGTERM);
}

bool ProcessHandle::kill() {
    return signalGroup(SIGKILL);
}

bool ProcessHandle::isRunning() const {
    std::lock_guard<std::mutex> lock(mtx);
    return running;
}

int ProcessHandle::getPid() const {
    std::lock_guard<std::mutex> lock(mtx);
    return static_cast<int>(pid);
}

int ProcessHandle::getExitCode() const {
    std::lock_guard<std::mutex> lock(mtx);
    return exitCode;
}

bool ProcessHandle::waitForExit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, timeout, [this] { return exited; });
}
