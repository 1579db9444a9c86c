#ifndef SIGN_CORE_HTTP_SERVER_H
#define SIGN_CORE_HTTP_SERVER_H

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include "core/signing_service.h"

namespace sign_core {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief HTTP front-end for a SigningService.
 *
 * Accepts connections on an io_context and serves each one synchronously
 * on its own thread (keep-alive supported). Routing lives in handle(), which
 * does no I/O and can be driven directly.
 */
class HttpServer {
public:
    HttpServer(SigningService& service, std::string host, unsigned short port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Binds and serves until stop() is called.
     * @return false if the listening socket could not be opened.
     */
    bool run();

    // Stops accepting and shuts down open connections. Safe from any thread.
    void stop();

    // Port the server is listening on once run() has bound it, 0 before.
    unsigned short boundPort() const { return boundPort_.load(); }

    // Connections whose session thread has not finished yet.
    size_t activeSessions() const;

    // `cancel` fires when the client goes away while the request is served.
    HttpResponse handle(const HttpRequest& request, CancellationToken* cancel = nullptr);

private:
    void accept();
    void session(boost::asio::ip::tcp::socket socket);

    HttpResponse handleSign(const HttpRequest& request, const std::string& pathPlatform,
                            CancellationToken* cancel);
    HttpResponse handleScriptUpdate(const HttpRequest& request);
    HttpResponse handleScriptRollback(const HttpRequest& request);
    HttpResponse handleRules(const HttpRequest& request);
    HttpResponse handleHealth(const HttpRequest& request);
    HttpResponse handleStatus(const HttpRequest& request);

    SigningService& service_;
    std::string host_;
    unsigned short port_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::atomic<bool> stopping_{false};
    std::atomic<unsigned short> boundPort_{0};

    // Guards sessions_ and activeSessions_. A session is counted from accept
    // until its thread stops touching the server.
    mutable std::mutex sessionsMutex_;
    std::condition_variable sessionsDone_;
    std::set<boost::asio::ip::tcp::socket*> sessions_;
    size_t activeSessions_ = 0;
};

} // namespace sign_core

#endif // SIGN_CORE_HTTP_SERVER_H
