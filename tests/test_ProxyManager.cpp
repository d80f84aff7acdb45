#include <gtest/gtest.h>
#include "proxy/ProxyManager.h"
#include "core/Errors.h"
#include "TestDoubles.h"
#include <filesystem>
#include <fstream>
#include <chrono>
#include <thread>
#include <future>
#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
const std::string MARKER = "Proxying to Cloud Run service";

FakeProcess::Script readyImmediately() {
    return [](FakeProcess& p) {
        p.emit(OutputStream::Stderr, "Checking authentication...");
        p.emit(OutputStream::Stdout, MARKER + " [svc] in project [p] region [r]");
    };
}
} // namespace

class ProxyManagerTest : public ::testing::Test {
protected:
    ProxyManager::Options options() {
        ProxyManager::Options o;
        o.gcloudPath = "gcloud";
        o.readyMarker = MARKER;
        o.stopTimeout = 200ms;
        return o;
    }

    FakeLauncher launcher;
    FakeProbe probe;
};

TEST_F(ProxyManagerTest, StartReturnsConfirmationOnceReady) {
    launcher.script = readyImmediately();
    ProxyManager proxy(launcher, probe, options());

    std::string text = proxy.startProxy("p", "europe-west1", "svc", 8080);

    EXPECT_EQ(text, "Proxy for service svc started on port 8080.");
    EXPECT_EQ(proxy.status().state, ProxyState::Running);
    EXPECT_EQ(proxy.status().target.service, "svc");
    EXPECT_EQ(probe.lastComponent, "cloud-run-proxy");
}

TEST_F(ProxyManagerTest, SpawnsGcloudWithTargetArguments) {
    launcher.script = readyImmediately();
    ProxyManager proxy(launcher, probe, options());

    proxy.startProxy("my-proj", "us-central1", "api", 9000);

    EXPECT_EQ(launcher.lastProgram, "gcloud");
    std::vector<std::string> expected = {
        "run", "services", "proxy", "api", "--project=my-proj", "--region=us-central1", "--port=9000"
    };
    EXPECT_EQ(launcher.lastArgs, expected);
}

TEST_F(ProxyManagerTest, SecondStartIsRejectedWithoutSpawning) {
    launcher.script = readyImmediately();
    ProxyManager proxy(launcher, probe, options());
    proxy.startProxy("p", "r", "svc", 8080);

    EXPECT_THROW(proxy.startProxy("p", "r", "other", 8081), AlreadySessionActiveError);
    EXPECT_EQ(launcher.createCount, 1);
    EXPECT_EQ(proxy.status().target.service, "svc");
}

TEST_F(ProxyManagerTest, SecondStartWhileFirstAwaitsReadinessIsRejected) {
    std::promise<void> spawned;
    launcher.script = [&spawned](FakeProcess&) { spawned.set_value(); };
    ProxyManager proxy(launcher, probe, options());

    bool firstFailed = false;
    std::thread starter([&] {
        try {
            proxy.startProxy("p", "r", "svc", 8080);
        } catch (const ProxyStartFailedError&) {
            firstFailed = true;
        }
    });
    spawned.get_future().wait();

    EXPECT_THROW(proxy.startProxy("p", "r", "other", 8081), AlreadySessionActiveError);
    EXPECT_EQ(launcher.createCount, 1);
    EXPECT_EQ(proxy.status().target.service, "svc");

    EXPECT_EQ(proxy.stopProxy(), "Proxy stopped.");
    starter.join();
    EXPECT_TRUE(firstFailed);
}

TEST_F(ProxyManagerTest, SecondStartDuringCapabilityCheckIsRejected) {
    std::promise<void> checking;
    std::promise<void> proceed;
    std::shared_future<void> go = proceed.get_future().share();
    probe.onCheck = [&checking, go] {
        checking.set_value();
        go.wait();
    };
    launcher.script = readyImmediately();
    ProxyManager proxy(launcher, probe, options());

    std::string firstResult;
    std::thread starter([&] { firstResult = proxy.startProxy("p", "r", "svc", 8080); });
    checking.get_future().wait();

    EXPECT_EQ(proxy.status().state, ProxyState::Starting);
    EXPECT_THROW(proxy.startProxy("p", "r", "other", 8081), AlreadySessionActiveError);

    proceed.set_value();
    starter.join();
    EXPECT_EQ(firstResult, "Proxy for service svc started on port 8080.");
    EXPECT_EQ(probe.callCount, 1);
    EXPECT_EQ(launcher.createCount, 1);
}

TEST_F(ProxyManagerTest, StopWhileStartingTerminatesAndFailsTheStart) {
    std::promise<void> spawned;
    launcher.script = [&spawned](FakeProcess&) { spawned.set_value(); };
    ProxyManager proxy(launcher, probe, options());

    std::string startError;
    std::thread starter([&] {
        try {
            proxy.startProxy("p", "r", "svc", 8080);
        } catch (const ProxyStartFailedError& e) {
            startError = e.what();
        }
    });
    spawned.get_future().wait();
    EXPECT_EQ(proxy.status().state, ProxyState::Starting);

    EXPECT_EQ(proxy.stopProxy(), "Proxy stopped.");
    starter.join();

    EXPECT_EQ(launcher.terminateTotal.load(), 1);
    EXPECT_EQ(startError, "Failed to start proxy: proxy was stopped before it was ready");
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);

    launcher.script = readyImmediately();
    EXPECT_EQ(proxy.startProxy("p", "r", "svc", 8080), "Proxy for service svc started on port 8080.");
}

TEST_F(ProxyManagerTest, StopDuringCapabilityCheckCancelsBeforeSpawn) {
    std::promise<void> checking;
    std::promise<void> proceed;
    std::shared_future<void> go = proceed.get_future().share();
    probe.onCheck = [&checking, go] {
        checking.set_value();
        go.wait();
    };
    launcher.script = readyImmediately();
    ProxyManager proxy(launcher, probe, options());

    std::string startError;
    std::thread starter([&] {
        try {
            proxy.startProxy("p", "r", "svc", 8080);
        } catch (const ProxyStartFailedError& e) {
            startError = e.what();
        }
    });
    checking.get_future().wait();

    std::string stopText;
    std::thread stopper([&] { stopText = proxy.stopProxy(); });
    while (proxy.status().state != ProxyState::Stopping) {
        std::this_thread::sleep_for(1ms);
    }
    proceed.set_value();
    starter.join();
    stopper.join();

    EXPECT_EQ(stopText, "Proxy stopped.");
    EXPECT_EQ(startError, "Failed to start proxy: proxy was stopped before it was ready");
    EXPECT_EQ(launcher.createCount, 0);
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
}

TEST_F(ProxyManagerTest, StopWhenIdleIsInformational) {
    ProxyManager proxy(launcher, probe, options());

    EXPECT_EQ(proxy.stopProxy(), "No proxy is currently running.");
    EXPECT_EQ(proxy.stopProxy(), "No proxy is currently running.");
    EXPECT_EQ(launcher.createCount, 0);
}

TEST_F(ProxyManagerTest, StopTerminatesAndReturnsToIdle) {
    launcher.script = readyImmediately();
    ProxyManager proxy(launcher, probe, options());
    proxy.startProxy("p", "r", "svc", 8080);
    FakeProcess* process = launcher.last;
    ASSERT_NE(process, nullptr);
    EXPECT_EQ(process->terminateCount, 0);

    EXPECT_EQ(proxy.stopProxy(), "Proxy stopped.");
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);

    // Starting again after a stop works
    EXPECT_EQ(proxy.startProxy("p", "r", "svc", 8080), "Proxy for service svc started on port 8080.");
    EXPECT_EQ(launcher.createCount, 2);
}

TEST_F(ProxyManagerTest, StopEscalatesToKillWhenTerminateIsIgnored) {
    launcher.script = readyImmediately();
    launcher.exitOnTerminate = false;
    ProxyManager proxy(launcher, probe, options());
    proxy.startProxy("p", "r", "svc", 8080);

    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(proxy.stopProxy(), "Proxy stopped.");
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(elapsed, 200ms);
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
}

TEST_F(ProxyManagerTest, ReadinessWaitsForMarkerOnStdout) {
    launcher.script = [](FakeProcess& p) {
        // Marker text on stderr does not count
        p.emit(OutputStream::Stderr, MARKER);
        p.later([&p] {
            std::this_thread::sleep_for(100ms);
            p.emit(OutputStream::Stdout, "Starting...");
            p.emit(OutputStream::Stdout, MARKER + " [svc]");
        });
    };
    ProxyManager proxy(launcher, probe, options());

    auto begin = std::chrono::steady_clock::now();
    proxy.startProxy("p", "r", "svc", 8080);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(elapsed, 100ms);
    EXPECT_EQ(proxy.status().state, ProxyState::Running);
}

TEST_F(ProxyManagerTest, MarkerOnlyOnStderrFailsWhenProcessExits) {
    launcher.script = [](FakeProcess& p) {
        p.emit(OutputStream::Stderr, MARKER);
        p.exit(1);
    };
    ProxyManager proxy(launcher, probe, options());

    try {
        proxy.startProxy("p", "r", "svc", 8080);
        FAIL() << "expected ProxyStartFailedError";
    } catch (const ProxyStartFailedError& e) {
        EXPECT_NE(std::string(e.what()).find("exited with code 1"), std::string::npos);
    }
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
}

TEST_F(ProxyManagerTest, SpawnFailureRollsBackToIdle) {
    launcher.script = [](FakeProcess& p) { p.fail("gcloud: No such file or directory"); };
    ProxyManager proxy(launcher, probe, options());

    try {
        proxy.startProxy("p", "r", "svc", 8080);
        FAIL() << "expected ProxyStartFailedError";
    } catch (const ProxyStartFailedError& e) {
        EXPECT_EQ(std::string(e.what()), "Failed to start proxy: gcloud: No such file or directory");
    }
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
    EXPECT_EQ(proxy.stopProxy(), "No proxy is currently running.");

    launcher.script = readyImmediately();
    EXPECT_NO_THROW(proxy.startProxy("p", "r", "svc", 8080));
}

TEST_F(ProxyManagerTest, MissingComponentNeverSpawns) {
    probe.installed = false;
    ProxyManager proxy(launcher, probe, options());

    try {
        proxy.startProxy("p", "r", "svc", 8080);
        FAIL() << "expected MissingDependencyError";
    } catch (const MissingDependencyError& e) {
        EXPECT_NE(std::string(e.what()).find("gcloud components install cloud-run-proxy"), std::string::npos);
    }
    EXPECT_EQ(launcher.createCount, 0);
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
}

TEST_F(ProxyManagerTest, UnexpectedExitWhileRunningFreesTheSlot) {
    launcher.script = readyImmediately();
    ProxyManager proxy(launcher, probe, options());
    proxy.startProxy("p", "r", "svc", 8080);

    launcher.last->exit(1);

    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
    EXPECT_EQ(proxy.stopProxy(), "No proxy is currently running.");
    EXPECT_NO_THROW(proxy.startProxy("p", "r", "svc", 8080));
}

TEST_F(ProxyManagerTest, DestructorStopsRunningProxy) {
    launcher.script = readyImmediately();
    int terminated = 0;
    {
        ProxyManager proxy(launcher, probe, options());
        proxy.startProxy("p", "r", "svc", 8080);
        FakeProcess* process = launcher.last;
        process->callbacks.onExited = [&terminated, inner = process->callbacks.onExited](int code) {
            ++terminated;
            inner(code);
        };
    }
    EXPECT_EQ(terminated, 1);
}

// A shell script stands in for gcloud so the real process path is exercised
class ProxyManagerProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("cirrus_proxy_test_" + std::to_string(stamp));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string writeScript(const std::string& body) {
        fs::path path = dir / "fake-gcloud";
        std::ofstream f(path);
        f << "#!/bin/sh\n" << body << "\n";
        f.close();
        chmod(path.c_str(), 0755);
        return path.string();
    }

    fs::path dir;
    FakeProbe probe;
    ProcessLauncher launcher;
};

TEST_F(ProxyManagerProcessTest, StartsAndStopsRealProcess) {
    ProxyManager::Options o;
    o.gcloudPath = writeScript("echo \"Proxying to Cloud Run service [$4]\"\nexec sleep 30");
    o.stopTimeout = 5s;
    ProxyManager proxy(launcher, probe, o);

    EXPECT_EQ(proxy.startProxy("p", "r", "svc", 18080), "Proxy for service svc started on port 18080.");
    EXPECT_GT(proxy.status().pid, 0);

    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(proxy.stopProxy(), "Proxy stopped.");
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
}

TEST_F(ProxyManagerProcessTest, ExitBeforeReadyIsReported) {
    ProxyManager::Options o;
    o.gcloudPath = writeScript("echo 'ERROR: (gcloud) permission denied' >&2\nexit 2");
    ProxyManager proxy(launcher, probe, o);

    try {
        proxy.startProxy("p", "r", "svc", 18081);
        FAIL() << "expected ProxyStartFailedError";
    } catch (const ProxyStartFailedError& e) {
        EXPECT_NE(std::string(e.what()).find("exited with code 2"), std::string::npos);
    }
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
}

TEST_F(ProxyManagerProcessTest, MissingExecutableIsReported) {
    ProxyManager::Options o;
    o.gcloudPath = (dir / "does-not-exist").string();
    ProxyManager proxy(launcher, probe, o);

    EXPECT_THROW(proxy.startProxy("p", "r", "svc", 18082), ProxyStartFailedError);
    EXPECT_EQ(proxy.status().state, ProxyState::Idle);
}
