#include "core/http_server.h"
#include "core/api_json.h"
#include "core/logger.h"

#include <cerrno>
#include <chrono>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>

namespace sign_core {

namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

static const std::size_t kMaxBodyBytes = 8 * 1024 * 1024;

static HttpResponse textResponse(const HttpRequest& request, http::status status, const std::string& body) {
    HttpResponse res{status, request.version()};
    res.set(http::field::server, "sign-server");
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(request.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

static HttpResponse jsonResponse(const HttpRequest& request, int status, const nlohmann::json& body) {
    HttpResponse res{static_cast<http::status>(status), request.version()};
    res.set(http::field::server, "sign-server");
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(request.keep_alive());
    // Script output and error text are not guaranteed to be valid UTF-8.
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

static HttpResponse errorResponse(const HttpRequest& request, ErrorKind kind, const std::string& message) {
    return jsonResponse(request, httpStatusFor(kind), errorJson(kind, message));
}

static std::string requestPath(const HttpRequest& request) {
    std::string target(request.target());
    auto query = target.find('?');
    if (query != std::string::npos) {
        target.erase(query);
    }
    while (target.size() > 1 && target.back() == '/') {
        target.pop_back();
    }
    return target;
}

static bool isSignRequest(const HttpRequest& request) {
    return request.method() == http::verb::post && requestPath(request).compare(0, 5, "/sign") == 0;
}

namespace {

// Watches a connection while its request is served and cancels the token once
// the peer hangs up, so a caller parked in ContextPool::acquire gives up its
// place in the queue right away.
class DisconnectWatcher {
public:
    DisconnectWatcher(int fd, CancellationToken& token) : fd_(fd), token_(token) {
        if (::pipe(wake_) != 0) {
            wake_[0] = wake_[1] = -1;
            LOG_WARN("HttpServer", std::string("Disconnect watch unavailable: pipe() failed, errno ") +
                     std::to_string(errno));
            return;
        }
        thread_ = std::thread(&DisconnectWatcher::loop, this);
    }

    ~DisconnectWatcher() {
        if (thread_.joinable()) {
            done_.store(true);
            char byte = 0;
            if (::write(wake_[1], &byte, 1) < 0) {
                LOG_DEBUG("HttpServer", "Disconnect watch wake-up failed, waiting for poll timeout");
            }
            thread_.join();
        }
        if (wake_[0] >= 0) ::close(wake_[0]);
        if (wake_[1] >= 0) ::close(wake_[1]);
    }

    DisconnectWatcher(const DisconnectWatcher&) = delete;
    DisconnectWatcher& operator=(const DisconnectWatcher&) = delete;

private:
    void loop() {
        while (!done_.load()) {
            pollfd fds[2] = {{fd_, POLLIN | POLLRDHUP, 0}, {wake_[0], POLLIN, 0}};
            int rc = ::poll(fds, 2, 250);
            if (rc < 0 && errno != EINTR) {
                return;
            }
            if (rc <= 0) {
                continue;
            }
            if (fds[1].revents != 0) {
                return;
            }
            if (fds[0].revents & (POLLHUP | POLLERR | POLLRDHUP)) {
                token_.cancel();
                return;
            }
            if (fds[0].revents & POLLIN) {
                char byte;
                if (::recv(fd_, &byte, 1, MSG_PEEK | MSG_DONTWAIT) == 0) {
                    token_.cancel();
                }
                return; // pipelined bytes stay queued for the next read
            }
        }
    }

    int fd_;
    CancellationToken& token_;
    int wake_[2] = {-1, -1};
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace

HttpServer::HttpServer(SigningService& service, std::string host, unsigned short port)
    : service_(service), host_(std::move(host)), port_(port) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::run() {
    boost::system::error_code ec;
    auto address = net::ip::make_address(host_, ec);
    if (ec) {
        LOG_ERROR("HttpServer", "Invalid listen address '" + host_ + "': " + ec.message());
        return false;
    }

    tcp::endpoint endpoint{address, port_};
    acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
    acceptor_->open(endpoint.protocol(), ec);
    if (!ec) acceptor_->set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_->bind(endpoint, ec);
    if (!ec) acceptor_->listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG_ERROR("HttpServer", "Cannot listen on " + host_ + ":" + std::to_string(port_) + ": " + ec.message());
        return false;
    }

    tcp::endpoint local = acceptor_->local_endpoint(ec);
    boundPort_.store(ec ? port_ : local.port());

    LOG_INFO("HttpServer", "Listening on http://" + host_ + ":" + std::to_string(boundPort_.load()));
    accept();
    ioc_.run();

    // stop() has shut the sockets down and cancelled waiting callers, so the
    // remaining sessions end within one invocation timeout.
    std::unique_lock<std::mutex> lock(sessionsMutex_);
    sessionsDone_.wait(lock, [this] { return activeSessions_ == 0; });
    LOG_INFO("HttpServer", "Stopped");
    return true;
}

size_t HttpServer::activeSessions() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return activeSessions_;
}

void HttpServer::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    ioc_.stop();

    std::lock_guard<std::mutex> lock(sessionsMutex_);
    for (tcp::socket* socket : sessions_) {
        boost::system::error_code ignored;
        socket->shutdown(tcp::socket::shutdown_both, ignored);
    }
}

void HttpServer::accept() {
    acceptor_->async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (stopping_) {
            return;
        }
        if (ec) {
            LOG_WARN("HttpServer", "Accept failed: " + ec.message());
        } else {
            {
                std::lock_guard<std::mutex> lock(sessionsMutex_);
                ++activeSessions_;
            }
            std::thread(&HttpServer::session, this, std::move(socket)).detach();
        }
        accept();
    });
}

void HttpServer::session(tcp::socket socket) {
    bool serve = false;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        if (!stopping_) {
            sessions_.insert(&socket);
            serve = true;
        }
    }

    boost::system::error_code ec;
    boost::beast::flat_buffer buffer;
    while (serve) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(kMaxBodyBytes);
        http::read(socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec) {
            LOG_DEBUG("HttpServer", "Read failed: " + ec.message());
            break;
        }

        HttpRequest request = parser.release();
        HttpResponse response;
        if (isSignRequest(request)) {
            CancellationToken cancel;
            DisconnectWatcher watcher(socket.native_handle(), cancel);
            response = handle(request, &cancel);
        } else {
            response = handle(request);
        }
        bool close = response.need_eof();

        http::write(socket, response, ec);
        if (ec) {
            LOG_DEBUG("HttpServer", "Write failed: " + ec.message());
            break;
        }
        if (close) {
            break;
        }
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);

    // Last touch of the server; run() may return as soon as the lock drops.
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    sessions_.erase(&socket);
    --activeSessions_;
    sessionsDone_.notify_all();
}

HttpResponse HttpServer::handle(const HttpRequest& request, CancellationToken* cancel) {
    const std::string path = requestPath(request);
    const http::verb method = request.method();
    LOG_DEBUG("HttpServer", std::string(request.method_string()) + " " + std::string(request.target()));

    try {
        if (method == http::verb::get && path == "/health") {
            return handleHealth(request);
        }
        if (method == http::verb::get && path == "/sign/status") {
            return handleStatus(request);
        }
        if (method == http::verb::post && path == "/sign") {
            return handleSign(request, "", cancel);
        }
        if (method == http::verb::post && path.compare(0, 6, "/sign/") == 0) {
            std::string platform = path.substr(6);
            if (!platform.empty() && platform.find('/') == std::string::npos) {
                return handleSign(request, platform, cancel);
            }
        }
        if (method == http::verb::post && path == "/admin/script") {
            return handleScriptUpdate(request);
        }
        if (method == http::verb::post && path == "/admin/script/rollback") {
            return handleScriptRollback(request);
        }
        if (method == http::verb::post && path == "/admin/rules") {
            return handleRules(request);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("HttpServer", "Unhandled error on " + path + ": " + e.what());
        return errorResponse(request, ErrorKind::INTERNAL, e.what());
    }

    return jsonResponse(request, 404, {
        {"success", false},
        {"message", "no route for " + std::string(request.method_string()) + " " + path}
    });
}

HttpResponse HttpServer::handleSign(const HttpRequest& request, const std::string& pathPlatform,
                                    CancellationToken* cancel) {
    SigningRequest signing;
    try {
        signing = requestFromJson(nlohmann::json::parse(request.body()), pathPlatform);
    } catch (const nlohmann::json::parse_error& e) {
        return errorResponse(request, ErrorKind::INVALID_REQUEST, std::string("body is not valid JSON: ") + e.what());
    } catch (const SignError& e) {
        return errorResponse(request, e.kind(), e.what());
    }

    SigningResponse response = service_.sign(signing, cancel);
    return jsonResponse(request, httpStatusFor(response.errorKind), response);
}

HttpResponse HttpServer::handleScriptUpdate(const HttpRequest& request) {
    std::string source = request.body();

    auto contentType = request.find(http::field::content_type);
    if (contentType != request.end() && contentType->value().find("json") != boost::beast::string_view::npos) {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(request.body());
        } catch (const nlohmann::json::parse_error& e) {
            return errorResponse(request, ErrorKind::INVALID_REQUEST, std::string("body is not valid JSON: ") + e.what());
        }
        if (!body.is_object() || !body.contains("source") || !body["source"].is_string()) {
            return errorResponse(request, ErrorKind::INVALID_REQUEST, "JSON body must carry a string 'source'");
        }
        source = body["source"].get<std::string>();
    }

    try {
        ScriptPtr script = service_.updateScript(source, "admin");
        return jsonResponse(request, 200, {
            {"success", true},
            {"hash", script->hash},
            {"version", script->version}
        });
    } catch (const SignError& e) {
        return errorResponse(request, e.kind(), e.what());
    }
}

HttpResponse HttpServer::handleScriptRollback(const HttpRequest& request) {
    try {
        ScriptPtr script = service_.rollbackScript();
        return jsonResponse(request, 200, {
            {"success", true},
            {"hash", script->hash},
            {"version", script->version}
        });
    } catch (const SignError& e) {
        return errorResponse(request, e.kind(), e.what());
    }
}

HttpResponse HttpServer::handleRules(const HttpRequest& request) {
    try {
        service_.reloadRules(DispatchRouter::parseRules(nlohmann::json::parse(request.body())));
    } catch (const nlohmann::json::parse_error& e) {
        return errorResponse(request, ErrorKind::INVALID_REQUEST, std::string("body is not valid JSON: ") + e.what());
    } catch (const SignError& e) {
        return errorResponse(request, e.kind(), e.what());
    }
    return jsonResponse(request, 200, {
        {"success", true},
        {"rules", DispatchRouter::rulesToJson(service_.router().rules())}
    });
}

HttpResponse HttpServer::handleHealth(const HttpRequest& request) {
    if (service_.isLive()) {
        return textResponse(request, http::status::ok, "ok");
    }
    return textResponse(request, http::status::service_unavailable, "unavailable");
}

HttpResponse HttpServer::handleStatus(const HttpRequest& request) {
    return jsonResponse(request, 200, service_.status());
}

} // namespace sign_core
