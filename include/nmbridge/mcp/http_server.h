#pragma once

#include <nmbridge/core/types.h>
#include <nmbridge/mcp/mcp_server.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace nmbridge::mcp {

namespace http = boost::beast::http;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

// Server-sent event stream for one session
class SSEChannel : public std::enable_shared_from_this<SSEChannel> {
public:
    SSEChannel(std::shared_ptr<tcp::socket> socket, std::chrono::milliseconds keepAlive);
    // Sends headers, then runs the writer loop on the calling thread until closed
    void run();
    void send(const std::string& event, const std::string& data);
    void close();
    bool isOpen() const { return open_.load(); }

private:
    void writerLoop();

    std::shared_ptr<tcp::socket> socket_;
    std::chrono::milliseconds keepAlive_;
    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closeRequested_{false};
};

// Registry mapping session id -> session state and its optional SSE channel
class SessionRegistry {
public:
    std::shared_ptr<InFlightSession> create(const std::string& idPrefix = "sess");
    std::shared_ptr<InFlightSession> find(const std::string& sessionId) const;
    void bind(const std::string& sessionId, std::shared_ptr<SSEChannel> ch);
    void remove(const std::string& sessionId);
    bool publish(const std::string& sessionId, const nlohmann::json& message);
    size_t broadcast(const nlohmann::json& message);
    void closeAll();
    size_t size() const;

private:
    struct Entry {
        std::shared_ptr<InFlightSession> session;
        std::weak_ptr<SSEChannel> channel;
    };

    mutable std::mutex mu_;
    std::unordered_map<std::string, Entry> map_;
};

/**
 * Streaming MCP endpoint.
 *
 *   GET  /sse                      event stream; first event names the POST endpoint
 *   POST /message?sessionId=<id>   202 Accepted, response delivered on the event stream
 *   POST /mcp, /mcp/jsonrpc        synchronous JSON-RPC, session in Mcp-Session-Id
 *   DELETE /mcp                    end the session named by Mcp-Session-Id
 *
 * Accepting runs on an io_context thread; every connection gets its own thread so a slow
 * companion round trip never blocks another client.
 */
class HttpMcpServer {
public:
    struct Config {
        std::string bindAddress = "127.0.0.1";
        uint16_t bindPort = 9333;
        std::chrono::milliseconds keepAlive{15000};
        std::chrono::milliseconds connectionJoinTimeout{5000};
    };

    HttpMcpServer(std::shared_ptr<MCPServer> mcp, Config cfg);
    ~HttpMcpServer();

    HttpMcpServer(const HttpMcpServer&) = delete;
    HttpMcpServer& operator=(const HttpMcpServer&) = delete;

    // Bind and start accepting. Bind failure is returned, never thrown.
    Result<void> start();

    // Close the acceptor; connections already established keep running
    void stopAccepting();

    // Drain in-flight calls up to drainTimeout, close event streams, release the io_context,
    // then join every connection thread. Implies stopAccepting().
    void shutdown(std::chrono::milliseconds drainTimeout);

    // Publish a JSON-RPC notification to every live event stream
    size_t broadcast(const nlohmann::json& notification);

    uint16_t port() const noexcept { return boundPort_.load(); }
    bool isAccepting() const noexcept { return accepting_.load(); }
    size_t sessionCount() const { return sessions_.size(); }
    size_t activeConnections() const;

private:
    void doAccept();
    void handleConnection(const std::shared_ptr<tcp::socket>& socket);
    void handleSse(const std::shared_ptr<tcp::socket>& socket);
    http::response<http::string_body> handleJsonRpc(const http::request<http::string_body>& req,
                                                    std::shared_ptr<InFlightSession>& session);
    void handleSessionMessage(tcp::socket& socket, const http::request<http::string_body>& req,
                              const std::string& sessionId);
    void connectionFinished(const std::shared_ptr<tcp::socket>& socket, uint64_t connectionId);
    // Join connection threads that have already finished; connMutex_ must be held
    void reapFinishedLocked();
    void joinConnectionThreads();

    std::shared_ptr<MCPServer> mcp_;
    Config cfg_;
    SessionRegistry sessions_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread ioThread_;
    std::atomic<bool> accepting_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<uint16_t> boundPort_{0};

    mutable std::mutex connMutex_;
    std::condition_variable connCv_;
    size_t activeConnections_{0};
    std::unordered_set<std::shared_ptr<tcp::socket>> liveSockets_;
    uint64_t nextConnectionId_{0};
    std::unordered_map<uint64_t, std::thread> connThreads_;
    std::vector<uint64_t> finishedThreads_;
};

} // namespace nmbridge::mcp
