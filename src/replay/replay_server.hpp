#pragma once

#include "replay/api_emulator.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>

namespace chunkdump::replay {

class HttpSession;

/// Decode an application/x-www-form-urlencoded string ("a=1&b=x%20y")
[[nodiscard]] std::map<std::string, std::string> parse_form(std::string_view form);

/// Build an ApiRequest from an HTTP target ("/api/<method>?query") and body.
/// Body parameters override query parameters of the same name.
[[nodiscard]] ApiRequest make_api_request(std::string_view target,
                                          std::string_view body,
                                          std::string_view content_type);

/// HTTP front end of the ApiEmulator, serving /api/<method>.
/// Runs on its own io_context in a separate thread.
class ReplayServer {
public:
    using tcp = boost::asio::ip::tcp;

    /// @param emulator Request handler, must outlive the server
    /// @param host Address to bind
    /// @param port Port to listen on, 0 picks a free port
    ReplayServer(ApiEmulator& emulator, std::string host, std::uint16_t port);

    ~ReplayServer();

    // Non-copyable, non-movable
    ReplayServer(const ReplayServer&) = delete;
    ReplayServer& operator=(const ReplayServer&) = delete;

    /// Bind, listen and launch the io thread. Throws on bind failure.
    void start();

    /// Close all sessions and join the io thread
    void stop();

    /// Bound port, valid after start()
    [[nodiscard]] std::uint16_t port() const noexcept;

    [[nodiscard]] bool is_running() const noexcept;

    /// Base URL clients should use, e.g. "http://127.0.0.1:8089/api/"
    [[nodiscard]] std::string url() const;

private:
    friend class HttpSession;

    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);
    void add_session(const std::shared_ptr<HttpSession>& session);
    void remove_session(const std::shared_ptr<HttpSession>& session);

    /// Call into the emulator; exceptions become 500 responses
    [[nodiscard]] ApiResponse dispatch(const ApiRequest& request);

    ApiEmulator& emulator_;
    std::string host_;
    std::uint16_t port_;
    std::atomic<std::uint16_t> bound_port_{0};

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex sessions_mutex_;
    std::set<std::shared_ptr<HttpSession>> sessions_;
};

/// One client connection, HTTP/1.1 keep-alive
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using tcp = boost::asio::ip::tcp;

    HttpSession(tcp::socket socket, ReplayServer& server);

    void start();
    void close();

private:
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void on_write(bool keep_alive, boost::system::error_code ec, std::size_t bytes_transferred);

    boost::beast::tcp_stream stream_;
    ReplayServer& server_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> request_;
    boost::beast::http::response<boost::beast::http::string_body> response_;
};

}  // namespace chunkdump::replay
