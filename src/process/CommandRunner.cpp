#include "process/CommandRunner.h"
#include "process/ProcessHandle.h"
#include "utils/Logger.h"
#include <mutex>

CommandResult CommandRunner::run(const std::string& program, const std::vector<std::string>& args) {
    CommandResult result;
    std::mutex outMtx;
    bool spawnFailed = false;

    ProcessHandle process(program, args);
    ProcessCallbacks callbacks;
    callbacks.onOutput = [&](OutputStream stream, const std::string& line) {
        std::lock_guard<std::mutex> lock(outMtx);
        std::string& target = stream == OutputStream::Stdout ? result.out : result.err;
        target += line;
        target += "\n";
    };
    callbacks.onFailed = [&](const std::string& message) {
        spawnFailed = true;
        result.err = message;
    };

    Logger::getInstance().debug("Running: " + program + (args.empty() ? "" : " " + args.front() + " ..."));
    process.start(callbacks);
    if (spawnFailed) {
        result.exitCode = -1;
        return result;
    }

    if (!process.waitForExit(timeout)) {
        Logger::getInstance().warn("Command timed out, killing: " + program);
        process.kill();
        process.waitForExit(std::chrono::seconds(5));
        std::lock_guard<std::mutex> lock(outMtx);
        result.exitCode = -1;
        result.err += program + " timed out\n";
        return result;
    }

    std::lock_guard<std::mutex> lock(outMtx);
    result.exitCode = process.getExitCode();
    return result;
}
