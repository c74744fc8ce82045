#include "ws_feed.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

WsFeed::WsFeed(const std::string& url)
    : ssl_ctx_(asio::ssl::context::tls_client) {
    parse_url(url);
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
}

WsFeed::~WsFeed() {
    close();
}

void WsFeed::parse_url(const std::string& url) {
    std::string u = url;

    if (u.rfind("wss://", 0) == 0) {
        use_ssl_ = true;
        u = u.substr(6);
    } else if (u.rfind("ws://", 0) == 0) {
        use_ssl_ = false;
        u = u.substr(5);
    } else {
        throw std::invalid_argument("WebSocket URL must start with ws:// or wss://: " + url);
    }

    auto slash_pos = u.find('/');
    if (slash_pos != std::string::npos) {
        target_ = u.substr(slash_pos);
        u = u.substr(0, slash_pos);
    } else {
        target_ = "/";
    }

    auto colon_pos = u.find(':');
    if (colon_pos != std::string::npos) {
        host_ = u.substr(0, colon_pos);
        port_ = u.substr(colon_pos + 1);
    } else {
        host_ = u;
        port_ = use_ssl_ ? "443" : "80";
    }
}

WsFeed::tcp::socket& WsFeed::socket() {
    if (tls_) {
        return beast::get_lowest_layer(*tls_).socket();
    }
    return beast::get_lowest_layer(*plain_).socket();
}

void WsFeed::connect() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    plain_.reset();
    tls_.reset();
    buffer_.clear();

    tcp::resolver resolver(ioc_);
    auto const endpoints = resolver.resolve(host_, port_);
    std::string host_header = host_ + ":" + port_;

    if (use_ssl_) {
        auto ws = std::make_unique<tls_ws>(ioc_, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), host_.c_str())) {
            throw beast::system_error(
                beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
        }
        beast::get_lowest_layer(*ws).connect(endpoints);
        ws->next_layer().handshake(asio::ssl::stream_base::client);
        ws->read_message_max(64 * 1024 * 1024);
        ws->handshake(host_header, target_);
        tls_ = std::move(ws);
    } else {
        auto ws = std::make_unique<plain_ws>(ioc_);
        beast::get_lowest_layer(*ws).connect(endpoints);
        ws->read_message_max(64 * 1024 * 1024);
        ws->handshake(host_header, target_);
        plain_ = std::move(ws);
    }

    spdlog::info("WebSocket connected to {}{}", host_, target_);
}

void WsFeed::send(const std::string& message) {
    if (tls_) {
        tls_->write(asio::buffer(message));
    } else if (plain_) {
        plain_->write(asio::buffer(message));
    } else {
        throw std::runtime_error("WebSocket is not connected");
    }
}

std::optional<std::string> WsFeed::read() {
    buffer_.clear();
    beast::error_code ec;

    if (tls_) {
        tls_->read(buffer_, ec);
    } else if (plain_) {
        plain_->read(buffer_, ec);
    } else {
        throw std::runtime_error("WebSocket is not connected");
    }

    if (ec == websocket::error::closed) {
        return std::nullopt;
    }
    if (ec) {
        throw beast::system_error(ec);
    }
    return beast::buffers_to_string(buffer_.data());
}

void WsFeed::close() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (!tls_ && !plain_) {
        return;
    }
    // Shutting the socket down unblocks a read pending on the reader thread
    beast::error_code ec;
    socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected) {
        spdlog::debug("WebSocket shutdown: {}", ec.message());
    }
}
