#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace tradestats::server {

class Router;

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& io,
               std::shared_ptr<const Router> router,
               std::string host,
               unsigned short port);

    // Binds and starts accepting. Throws boost::system::system_error when the address
    // cannot be bound.
    void start();
    void stop();

    unsigned short port() const;

private:
    void doAccept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<const Router> router_;
    std::string host_;
    unsigned short port_{};
    std::atomic<bool> running_{false};
};

} // namespace tradestats::server
