#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <thread>

namespace httplib {
class Server;
}
class McpServer;

/**
 * @brief MCP 的 HTTP 传输 (远程模式)
 *
 * POST /mcp 的请求体是一条 JSON-RPC 消息,响应体是对应的 JSON-RPC 响应;
 * 通知没有响应体,返回 202。消息按到达顺序串行交给 McpServer。
 */
class McpHttpServer {
public:
    static constexpr const char* ENDPOINT = "/mcp";

    McpHttpServer(McpServer& server, std::string host, int port);
    ~McpHttpServer();

    McpHttpServer(const McpHttpServer&) = delete;
    McpHttpServer& operator=(const McpHttpServer&) = delete;

    /**
     * @brief 绑定端口并在后台线程开始监听
     * @return 实际端口 (port 为 0 时由系统分配)
     * @throws std::runtime_error 绑定或监听失败
     */
    int start();

    /**
     * @brief 阻塞直到监听线程结束 (stop() 或监听出错)
     */
    void wait();

    void stop();

    int getPort() const { return boundPort; }

private:
    void configureRoutes();

    McpServer& server;
    std::string host;
    int port;
    int boundPort = 0;

    std::unique_ptr<httplib::Server> http;
    std::thread listener;
    std::mutex dispatchMutex;
};
