#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include "api/api_router.hpp"
#include "config/config.hpp"

namespace settle {
namespace api {

/**
 * Boost.Beast HTTP/1.1 front end for ApiRouter. One acceptor, an io_context
 * run on server.threads worker threads, keep-alive sessions.
 */
class HttpServer {
public:
    HttpServer(ApiRouter& router, const ServerConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts the worker threads. Throws std::runtime_error if the
    // address cannot be bound.
    void start();
    void stop();

    unsigned short port() const;
    bool is_running() const { return running_.load(); }

private:
    ApiRouter& router_;
    ServerConfig config_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};

    void do_accept();
};

} // namespace api
} // namespace settle
