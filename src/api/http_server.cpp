#include "api/http_server.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <boost/beast.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace settle {
namespace api {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

// ============================================================================
// HTTP Session
// ============================================================================

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, ApiRouter& router)
        : socket_(std::move(socket)), router_(router) {}

    void run() {
        do_read();
    }

private:
    tcp::socket socket_;
    ApiRouter& router_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;

    void do_read() {
        req_ = {};
        http::async_read(socket_, buffer_, req_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec == http::error::end_of_stream) {
                    self->close();
                    return;
                }
                if (ec) {
                    spdlog::debug("HTTP read failed: {}", ec.message());
                    return;
                }
                self->handle_request();
            });
    }

    void handle_request() {
        ApiRequest request;
        request.method = std::string(req_.method_string());
        request.target = std::string(req_.target());
        request.body = req_.body();
        for (const auto& field : req_) {
            std::string name(field.name_string());
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            request.headers[name] = std::string(field.value());
        }

        ApiResponse response = router_.handle(request);

        res_ = {};
        res_.version(req_.version());
        res_.keep_alive(req_.keep_alive());
        res_.result(static_cast<http::status>(response.status));
        res_.set(http::field::server, "settled");
        res_.set(http::field::content_type, response.content_type);
        res_.body() = std::move(response.body);
        res_.prepare_payload();
        do_write();
    }

    void do_write() {
        http::async_write(socket_, res_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    spdlog::debug("HTTP write failed: {}", ec.message());
                    return;
                }
                if (!self->res_.keep_alive()) {
                    self->close();
                    return;
                }
                self->do_read();
            });
    }

    void close() {
        beast::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_send, ec);
    }
};

} // namespace

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(ApiRouter& router, const ServerConfig& config)
    : router_(router)
    , config_(config)
    , acceptor_(ioc_)
{
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    beast::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("Invalid bind address " + config_.bind_address + ": " + ec.message());
    }
    tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.port));

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("Cannot listen on " + config_.bind_address + ":" +
                                 std::to_string(config_.port) + ": " + ec.message());
    }

    do_accept();

    int threads = std::max(1, config_.threads);
    for (int i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { ioc_.run(); });
    }
    spdlog::info("HTTP server listening on {}:{} ({} threads)", config_.bind_address, port(), threads);
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    beast::error_code ec;
    acceptor_.close(ec);
    ioc_.stop();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    spdlog::info("HTTP server stopped");
}

unsigned short HttpServer::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? static_cast<unsigned short>(config_.port) : endpoint.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (running_.load()) {
                    spdlog::warn("Accept failed: {}", ec.message());
                }
            } else {
                SETTLE_COUNTER("http_connections").increment();
                std::make_shared<HttpSession>(std::move(socket), router_)->run();
            }
            if (running_.load() && acceptor_.is_open()) {
                do_accept();
            }
        });
}

} // namespace api
} // namespace settle
