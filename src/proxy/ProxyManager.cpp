#include "proxy/ProxyManager.h"
#include "core/Errors.h"
#include "utils/Logger.h"

ProxyManager::ProxyManager(IProcessLauncher& launcher, ICapabilityProbe& probe, Options options)
    : launcher(launcher), probe(probe), options(std::move(options)) {}

ProxyManager::~ProxyManager() {
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lock(mtx);
        s = session;
    }
    if (s && s->process) {
        Logger::getInstance().info("Shutting down proxy for service " + s->target.service);
        s->process->terminate();
        waitForExit(s);
    }
    std::unique_ptr<IProcessHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (s) handle = std::move(s->process);
        session.reset();
        state = ProxyState::Idle;
    }
    handle.reset();
    takeRetired();
}

std::string ProxyManager::stateName(ProxyState state) {
    switch (state) {
        case ProxyState::Idle: return "idle";
        case ProxyState::Starting: return "starting";
        case ProxyState::Running: return "running";
        case ProxyState::Stopping: return "stopping";
    }
    return "unknown";
}

ProxyStatus ProxyManager::status() const {
    std::lock_guard<std::mutex> lock(mtx);
    ProxyStatus st;
    st.state = state;
    if (session) {
        st.target = session->target;
        if (session->process) st.pid = session->process->getPid();
    }
    return st;
}

std::vector<std::string> ProxyManager::buildArgs(const ProxyTarget& target) const {
    return {
        "run",
        "services",
        "proxy",
        target.service,
        "--project=" + target.project,
        "--region=" + target.region,
        "--port=" + std::to_string(target.port),
    };
}

std::vector<std::shared_ptr<ProxyManager::Session>> ProxyManager::takeRetired() {
    std::vector<std::shared_ptr<Session>> out;
    {
        std::lock_guard<std::mutex> lock(mtx);
        out.swap(retired);
    }
    for (auto& s : out) {
        s->process.reset();
    }
    return out;
}

std::string ProxyManager::startProxy(const std::string& project, const std::string& region,
                                     const std::string& service, int port) {
    takeRetired();

    auto s = std::make_shared<Session>();
    s->target = {project, region, service, port};
    {
        // Idle -> Starting happens under the lock so a concurrent start cannot also see Idle
        std::lock_guard<std::mutex> lock(mtx);
        if (state != ProxyState::Idle) {
            throw AlreadySessionActiveError();
        }
        state = ProxyState::Starting;
        session = s;
    }

    bool installed = false;
    try {
        installed = probe.isInstalled(options.componentId);
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Component check failed: ") + e.what());
    }
    if (!installed) {
        releaseSession(s);
        throw MissingDependencyError(options.componentId, "gcloud components install " + options.componentId);
    }

    std::future<void> ready = s->ready.get_future();
    IProcessHandle* process = nullptr;
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (s->stopRequested) {
            cancelled = true;
        } else {
            s->process = launcher.create(options.gcloudPath, buildArgs(s->target));
            process = s->process.get();
        }
    }
    if (cancelled) {
        Logger::getInstance().info("Proxy start for service " + service + " cancelled before spawn");
        releaseSession(s);
        throw ProxyStartFailedError("proxy was stopped before it was ready");
    }

    Logger::getInstance().info("Starting proxy for service " + service + " (project " + project +
                               ", region " + region + ") on port " + std::to_string(port));
    process->start(makeCallbacks(s));

    // A stop that arrived before launch left the signal to us
    bool signalNow = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        s->launched = true;
        signalNow = s->stopRequested;
    }
    if (signalNow) {
        process->terminate();
    }

    try {
        ready.get();
    } catch (const ProxyStartFailedError& e) {
        Logger::getInstance().error(e.what());
        std::unique_ptr<IProcessHandle> handle;
        {
            // When a stop is in progress it owns the handle and the release
            std::lock_guard<std::mutex> lock(mtx);
            if (!s->stopRequested) handle = detachLocked(s);
        }
        exitCv.notify_all();
        handle.reset();
        throw;
    }

    Logger::getInstance().success("Proxy for service " + service + " is ready on port " + std::to_string(port));
    return "Proxy for service " + service + " started on port " + std::to_string(port) + ".";
}

std::string ProxyManager::stopProxy() {
    takeRetired();

    std::shared_ptr<Session> s;
    bool signal = false;
    {
        std::unique_lock<std::mutex> lock(mtx);
        switch (state) {
            case ProxyState::Idle:
                return "No proxy is currently running.";
            case ProxyState::Starting:
                // The blocked start fails once the process is gone
                state = ProxyState::Stopping;
                s = session;
                s->stopRequested = true;
                signal = s->launched;
                break;
            case ProxyState::Stopping:
                // Another caller owns the teardown; wait until it has released the session
                s = session;
                exitCv.wait(lock, [&] { return s->released; });
                return "Proxy stopped.";
            case ProxyState::Running:
                state = ProxyState::Stopping;
                s = session;
                s->stopRequested = true;
                signal = true;
                break;
        }
    }

    if (signal) {
        Logger::getInstance().info("Stopping proxy for service " + s->target.service);
        s->process->terminate();
    }

    waitForExit(s);
    auto handle = releaseSession(s);
    handle.reset();
    Logger::getInstance().info("Proxy stopped");
    return "Proxy stopped.";
}

void ProxyManager::waitForExit(const std::shared_ptr<Session>& s) {
    // released covers a start cancelled before it spawned anything
    auto done = [&] { return s->exited || s->released; };
    IProcessHandle* process = nullptr;
    {
        std::unique_lock<std::mutex> lock(mtx);
        if (exitCv.wait_for(lock, options.stopTimeout, done)) {
            return;
        }
        process = s->process.get();
    }

    if (process) {
        Logger::getInstance().warn("Proxy did not exit within " + std::to_string(options.stopTimeout.count()) +
                                   " ms, sending SIGKILL");
        process->kill();
    }

    std::unique_lock<std::mutex> lock(mtx);
    exitCv.wait(lock, done);
}

std::unique_ptr<IProcessHandle> ProxyManager::detachLocked(const std::shared_ptr<Session>& s) {
    std::unique_ptr<IProcessHandle> handle = std::move(s->process);
    s->released = true;
    if (session == s) {
        session.reset();
        state = ProxyState::Idle;
    }
    return handle;
}

std::unique_ptr<IProcessHandle> ProxyManager::releaseSession(const std::shared_ptr<Session>& s) {
    std::unique_ptr<IProcessHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mtx);
        handle = detachLocked(s);
    }
    exitCv.notify_all();
    return handle;
}

ProcessCallbacks ProxyManager::makeCallbacks(const std::shared_ptr<Session>& s) {
    std::weak_ptr<Session> weak = s;
    ProcessCallbacks cb;
    cb.onStarted = [weak](int pid) {
        if (auto s = weak.lock()) {
            Logger::getInstance().debug("Proxy process " + std::to_string(pid) + " spawned for " + s->target.service);
        }
    };
    cb.onOutput = [this, weak](OutputStream stream, const std::string& line) {
        if (auto s = weak.lock()) onOutput(s, stream, line);
    };
    cb.onExited = [this, weak](int exitCode) {
        if (auto s = weak.lock()) onExited(s, exitCode);
    };
    cb.onFailed = [this, weak](const std::string& message) {
        if (auto s = weak.lock()) onFailed(s, message);
    };
    return cb;
}

void ProxyManager::onOutput(const std::shared_ptr<Session>& s, OutputStream stream, const std::string& line) {
    if (stream == OutputStream::Stderr) {
        Logger::getInstance().info("Proxy stderr: " + line);
        return;
    }
    Logger::getInstance().info("Proxy stdout: " + line);

    if (line.find(options.readyMarker) == std::string::npos) return;

    std::lock_guard<std::mutex> lock(mtx);
    // After a stop request only the exit settles the start
    if (s->readySettled || s->stopRequested) return;
    s->readySettled = true;
    if (session == s && state == ProxyState::Starting) {
        state = ProxyState::Running;
    }
    s->ready.set_value();
}

void ProxyManager::settleFailure(Session& s, const std::string& cause) {
    if (s.readySettled) return;
    s.readySettled = true;
    s.ready.set_exception(std::make_exception_ptr(ProxyStartFailedError(cause)));
}

void ProxyManager::onFailed(const std::shared_ptr<Session>& s, const std::string& message) {
    Logger::getInstance().error("Proxy process error: " + message);
    {
        std::lock_guard<std::mutex> lock(mtx);
        s->exited = true;
        settleFailure(*s, message);
    }
    exitCv.notify_all();
}

void ProxyManager::onExited(const std::shared_ptr<Session>& s, int exitCode) {
    Logger::getInstance().info("Proxy process exited with code " + std::to_string(exitCode));
    {
        std::lock_guard<std::mutex> lock(mtx);
        s->exited = true;
        s->exitCode = exitCode;
        if (!s->readySettled) {
            settleFailure(*s, s->stopRequested
                                  ? "proxy was stopped before it was ready"
                                  : "proxy process exited with code " + std::to_string(exitCode) +
                                        " before it was ready");
        } else if (session == s && state == ProxyState::Running) {
            Logger::getInstance().warn("Proxy for service " + s->target.service + " exited unexpectedly");
            retired.push_back(session);
            session.reset();
            state = ProxyState::Idle;
        }
    }
    exitCv.notify_all();
}
