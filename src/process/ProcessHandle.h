#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <sys/types.h>

enum class OutputStream {
    Stdout,
    Stderr
};

/**
 * @brief 子进程生命周期信号
 *
 * onStarted / onFailed 在 start() 的调用线程中触发,
 * onOutput / onExited 在监视线程中触发。
 * onExited 保证只触发一次,且在所有输出行之后。
 */
struct ProcessCallbacks {
    std::function<void(int pid)> onStarted;
    std::function<void(OutputStream stream, const std::string& line)> onOutput;
    std::function<void(int exitCode)> onExited;
    std::function<void(const std::string& message)> onFailed;
};

/**
 * @brief 独占一个外部长驻进程
 */
class IProcessHandle {
public:
    virtual ~IProcessHandle() = default;

    virtual void start(ProcessCallbacks callbacks) = 0;

    // SIGTERM to the process group; false when nothing is running
    virtual bool terminate() = 0;

    // SIGKILL to the process group; false when nothing is running
    virtual bool kill() = 0;

    virtual bool isRunning() const = 0;
    virtual int getPid() const = 0;
};

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;
    virtual std::unique_ptr<IProcessHandle> create(const std::string& program,
                                                   const std::vector<std::string>& args) = 0;
};

class ProcessHandle : public IProcessHandle {
public:
    ProcessHandle(const std::string& program, const std::vector<std::string>& args);
    ~ProcessHandle() override;

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    void start(ProcessCallbacks callbacks) override;
    bool terminate() override;
    bool kill() override;
    bool isRunning() const override;
    int getPid() const override;

    /**
     * @brief 等待进程退出
     * @return 超时返回 false
     */
    bool waitForExit(std::chrono::milliseconds timeout);

    int getExitCode() const;

private:
    std::string program;
    std::vector<std::string> args;
    ProcessCallbacks callbacks;

    pid_t pid = -1;
    int outFd = -1;
    int errFd = -1;
    bool running = false;
    bool exited = false;
    int exitCode = -1;

    std::thread monitorThread;
    mutable std::mutex mtx;
    std::condition_variable cv;

    bool signalGroup(int sig);
    void monitorLoop();
    void fail(const std::string& message);
};

class ProcessLauncher : public IProcessLauncher {
public:
    std::unique_ptr<IProcessHandle> create(const std::string& program,
                                           const std::vector<std::string>& args) override {
        return std::make_unique<ProcessHandle>(program, args);
    }
};
