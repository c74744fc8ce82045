#pragma once

#include "feed_source.hpp"
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

// Solana JSON-RPC WebSocket over ws:// or wss://
class WsFeed : public FeedSource {
public:
    explicit WsFeed(const std::string& url);
    ~WsFeed() override;

    void connect() override;
    void send(const std::string& message) override;
    std::optional<std::string> read() override;
    void close() override;

private:
    using tcp = boost::asio::ip::tcp;
    using plain_ws = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using tls_ws = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    std::string host_;
    std::string port_;
    std::string target_;
    bool use_ssl_ = false;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::unique_ptr<plain_ws> plain_;
    std::unique_ptr<tls_ws> tls_;
    boost::beast::flat_buffer buffer_;
    std::mutex socket_mutex_;

    void parse_url(const std::string& url);
    tcp::socket& socket();
};
