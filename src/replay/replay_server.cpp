#include "replay/replay_server.hpp"
#include <boost/asio/post.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <spdlog/spdlog.h>

namespace chunkdump::replay {

namespace http = boost::beast::http;

namespace {

constexpr std::string_view kApiPrefix = "/api/";
constexpr auto kSessionTimeout = std::chrono::seconds(30);

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace

std::map<std::string, std::string> parse_form(std::string_view form) {
    std::map<std::string, std::string> params;
    while (!form.empty()) {
        auto amp = form.find('&');
        auto pair = form.substr(0, amp);
        form = amp == std::string_view::npos ? std::string_view{} : form.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            params[url_decode(pair)] = "";
        } else {
            params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
    }
    return params;
}

ApiRequest make_api_request(std::string_view target,
                            std::string_view body,
                            std::string_view content_type) {
    ApiRequest request;

    auto q = target.find('?');
    auto path = target.substr(0, q);
    if (path.substr(0, kApiPrefix.size()) == kApiPrefix) {
        request.method = std::string(path.substr(kApiPrefix.size()));
    } else {
        request.method = std::string(path);
    }
    if (q != std::string_view::npos) {
        request.params = parse_form(target.substr(q + 1));
    }

    if (content_type.substr(0, 33) == "application/x-www-form-urlencoded") {
        for (auto& [key, value] : parse_form(body)) {
            request.params[key] = std::move(value);
        }
    }
    return request;
}

// ============================================================================
// ReplayServer
// ============================================================================

ReplayServer::ReplayServer(ApiEmulator& emulator, std::string host, std::uint16_t port)
    : emulator_(emulator)
    , host_(std::move(host))
    , port_(port)
    , acceptor_(ioc_)
{}

ReplayServer::~ReplayServer() {
    stop();
}

void ReplayServer::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    try {
        // A previous stop() leaves the io_context stopped
        ioc_.restart();

        tcp::endpoint endpoint(boost::asio::ip::make_address(host_), port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        bound_port_ = acceptor_.local_endpoint().port();

        spdlog::info("Replay server listening on {}", url());

        do_accept();

        io_thread_ = std::thread([this]() {
            ioc_.run();
        });

    } catch (const std::exception& e) {
        spdlog::error("Failed to start replay server: {}", e.what());
        running_ = false;
        throw;
    }
}

void ReplayServer::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    spdlog::info("Replay server stopping");

    // Close sessions and the acceptor on the io thread, then stop it
    boost::asio::post(ioc_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            for (const auto& session : sessions_) {
                session->close();
            }
            sessions_.clear();
        }
        ioc_.stop();
    });

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

std::uint16_t ReplayServer::port() const noexcept {
    return bound_port_.load();
}

bool ReplayServer::is_running() const noexcept {
    return running_.load();
}

std::string ReplayServer::url() const {
    return "http://" + host_ + ":" + std::to_string(port()) + std::string(kApiPrefix);
}

void ReplayServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        }
    );
}

void ReplayServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            spdlog::warn("Accept error: {}", ec.message());
        }
        return;
    }

    spdlog::debug("New replay client connected");

    auto session = std::make_shared<HttpSession>(std::move(socket), *this);
    add_session(session);
    session->start();

    if (running_) {
        do_accept();
    }
}

void ReplayServer::add_session(const std::shared_ptr<HttpSession>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.insert(session);
}

void ReplayServer::remove_session(const std::shared_ptr<HttpSession>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
}

ApiResponse ReplayServer::dispatch(const ApiRequest& request) {
    try {
        return emulator_.handle(request);
    } catch (const std::exception& e) {
        spdlog::error("replay {}: {}", request.method, e.what());
        return ApiResponse{500, nlohmann::json{{"ok", false}, {"error", e.what()}}};
    }
}

// ============================================================================
// HttpSession
// ============================================================================

HttpSession::HttpSession(tcp::socket socket, ReplayServer& server)
    : stream_(std::move(socket))
    , server_(server)
{}

void HttpSession::start() {
    do_read();
}

void HttpSession::do_read() {
    request_ = {};
    stream_.expires_after(kSessionTimeout);

    http::async_read(
        stream_,
        buffer_,
        request_,
        [self = shared_from_this()](boost::system::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void HttpSession::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        if (ec != http::error::end_of_stream) {
            spdlog::debug("HTTP read error: {}", ec.message());
        }
        close();
        server_.remove_session(shared_from_this());
        return;
    }

    auto api_request = make_api_request(
        std::string_view(request_.target().data(), request_.target().size()),
        request_.body(),
        std::string_view(request_[http::field::content_type].data(),
                         request_[http::field::content_type].size())
    );
    auto api_response = server_.dispatch(api_request);

    response_ = {};
    response_.version(request_.version());
    response_.result(static_cast<http::status>(api_response.status));
    response_.set(http::field::server, "chunkdump/1.0");
    response_.set(http::field::content_type, "application/json");
    response_.keep_alive(request_.keep_alive());
    response_.body() = api_response.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    response_.prepare_payload();

    http::async_write(
        stream_,
        response_,
        [self = shared_from_this(), keep_alive = response_.keep_alive()](
            boost::system::error_code write_ec, std::size_t bytes) {
            self->on_write(keep_alive, write_ec, bytes);
        }
    );
}

void HttpSession::on_write(bool keep_alive, boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        spdlog::debug("HTTP write error: {}", ec.message());
        close();
        server_.remove_session(shared_from_this());
        return;
    }

    if (!keep_alive) {
        close();
        server_.remove_session(shared_from_this());
        return;
    }

    do_read();
}

void HttpSession::close() {
    boost::system::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream_.socket().close(ec);
}

}  // namespace chunkdump::replay
