#pragma once

/**
 * @file http_server.hpp
 * @brief Boost.Asio TCP front end that feeds requests to HttpService.
 *
 * @details
 * Model:
 *   - one acceptor on the configured endpoint,
 *   - one Session per connection (shared_ptr-owned, kept alive by its handlers),
 *   - each Session reads a single request, answers it, and closes,
 *   - a steady_timer per Session aborts clients that stall.
 *
 * The io_context is owned by the caller and may be run from any number of
 * threads. Sessions never share state with each other; the registry behind
 * HttpService does its own locking.
 */

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/asio.hpp>

#include "iptrack/http_service.hpp"

namespace iptrack {

class HttpServer {
public:
    /**
     * @param io        io_context the acceptor and sessions run on.
     * @param service   Route table; must outlive the server.
     * @param timeout   Per-connection deadline for reading and writing.
     */
    HttpServer(boost::asio::io_context& io,
               const HttpService& service,
               std::chrono::seconds timeout = std::chrono::seconds(30));

    /**
     * @brief Open, bind and listen on @p endpoint (port 0 picks a free port).
     * @param err  Reason on failure (address in use, permission, ...).
     * @return true when the socket is listening.
     */
    bool listen(const boost::asio::ip::tcp::endpoint& endpoint, std::string& err);

    /** @brief Begin accepting connections (non-blocking). Call after listen(). */
    void start();

    /** @brief Stop accepting; sessions in flight finish on their own. */
    void stop();

    /** @brief Port actually bound (useful when constructed with port 0). */
    std::uint16_t port() const;

private:
    void do_accept();

    boost::asio::io_context&        io_;
    boost::asio::ip::tcp::acceptor  acceptor_;
    const HttpService&              service_;
    std::chrono::seconds            timeout_;
};

} // namespace iptrack
