#pragma once
#include <string>
#include <vector>
#include <chrono>

struct CommandResult {
    int exitCode = -1;
    std::string out;
    std::string err;

    bool ok() const { return exitCode == 0; }
};

/**
 * @brief 运行一条命令直到结束,收集输出
 *
 * 启动失败时 exitCode 为 -1,原因写入 err。
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual CommandResult run(const std::string& program, const std::vector<std::string>& args) = 0;
};

class CommandRunner : public ICommandRunner {
public:
    explicit CommandRunner(std::chrono::seconds timeout = std::chrono::seconds(600))
        : timeout(timeout) {}

    CommandResult run(const std::string& program, const std::vector<std::string>& args) override;

private:
    std::chrono::seconds timeout;
};
