#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <future>
#include <chrono>
#include "process/ProcessHandle.h"
#include "proxy/CapabilityProbe.h"

enum class ProxyState {
    Idle,
    Starting,
    Running,
    Stopping
};

struct ProxyTarget {
    std::string project;
    std::string region;
    std::string service;
    int port = 0;
};

struct ProxyStatus {
    ProxyState state = ProxyState::Idle;
    ProxyTarget target;
    int pid = -1;
};

/**
 * @brief 本地代理进程管理器
 *
 * 监督一个把本地端口转发到 Cloud Run 服务的 `gcloud run services proxy` 子进程。
 * 同一时刻最多只有一个会话处于 Starting/Running/Stopping。
 *
 * 状态机:
 *   Idle -(start, 组件已安装)-> Starting -(就绪标记)-> Running
 *   Running -(stop)-> Stopping -(进程退出)-> Idle
 *   Starting -(stop)-> Stopping -(进程退出)-> Idle,阻塞中的 start 抛出 ProxyStartFailedError
 *   Starting -(启动失败 / 就绪前退出)-> Idle
 *
 * 实例由服务器上下文持有,通过引用传给工具层,不存在全局状态。
 */
class ProxyManager {
public:
    struct Options {
        std::string gcloudPath = "gcloud";
        std::string componentId = "cloud-run-proxy";
        std::string readyMarker = "Proxying to Cloud Run service";
        std::chrono::milliseconds stopTimeout = std::chrono::seconds(10);
    };

    ProxyManager(IProcessLauncher& launcher, ICapabilityProbe& probe, Options options);
    ~ProxyManager();

    ProxyManager(const ProxyManager&) = delete;
    ProxyManager& operator=(const ProxyManager&) = delete;

    /**
     * @brief 启动代理,阻塞直到 stdout 中出现就绪标记
     * @return 确认文本
     * @throws AlreadySessionActiveError 已有活动会话,不会启动新进程
     * @throws MissingDependencyError 代理组件未安装,不会启动新进程
     * @throws ProxyStartFailedError 进程启动失败或在就绪前退出,状态回到 Idle
     */
    std::string startProxy(const std::string& project, const std::string& region,
                           const std::string& service, int port);

    /**
     * @brief 停止代理,等待进程真正退出后返回
     *
     * 没有活动会话时直接返回提示文本,从不抛出。
     * 仍在启动中的会话同样会被终止,对应的 startProxy 以 ProxyStartFailedError 结束。
     * 优雅退出超过 stopTimeout 后升级为 SIGKILL。
     */
    std::string stopProxy();

    ProxyStatus status() const;

    static std::string stateName(ProxyState state);

private:
    struct Session {
        ProxyTarget target;
        std::unique_ptr<IProcessHandle> process;
        std::promise<void> ready;
        bool readySettled = false;
        bool stopRequested = false;
        bool launched = false; // process->start() has returned
        bool exited = false;
        bool released = false;
        int exitCode = -1;
    };

    IProcessLauncher& launcher;
    ICapabilityProbe& probe;
    Options options;

    mutable std::mutex mtx;
    std::condition_variable exitCv;
    ProxyState state = ProxyState::Idle;
    std::shared_ptr<Session> session;
    // Sessions whose process died on its own; released on the next caller thread
    std::vector<std::shared_ptr<Session>> retired;

    std::vector<std::string> buildArgs(const ProxyTarget& target) const;
    ProcessCallbacks makeCallbacks(const std::shared_ptr<Session>& s);
    void onOutput(const std::shared_ptr<Session>& s, OutputStream stream, const std::string& line);
    void onExited(const std::shared_ptr<Session>& s, int exitCode);
    void onFailed(const std::shared_ptr<Session>& s, const std::string& message);
    void settleFailure(Session& s, const std::string& cause);
    std::unique_ptr<IProcessHandle> releaseSession(const std::shared_ptr<Session>& s);
    std::unique_ptr<IProcessHandle> detachLocked(const std::shared_ptr<Session>& s); // mtx held
    void waitForExit(const std::shared_ptr<Session>& s);
    std::vector<std::shared_ptr<Session>> takeRetired();
};
