// -----------------------------------------------------------------------------
// http_server.cpp - Boost.Asio plumbing for iptrackd
//
// Each accepted socket is bound to its own strand, so a Session's read/write
// handlers and its deadline timer never run concurrently with each other.
// Sessions across connections run in parallel on the io_context threads.
// -----------------------------------------------------------------------------

#include "iptrack/http_server.hpp"

#include <memory>
#include <string>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>   // iequals
#include <spdlog/spdlog.h>

namespace asio = boost::asio;
using asio::ip::tcp;
using boost::system::error_code;

namespace iptrack {

namespace {

std::string format_peer(const tcp::endpoint& ep) {
    const auto addr = ep.address();
    if (addr.is_v6() && !addr.to_v6().is_v4_mapped())
        return "[" + addr.to_string() + "]:" + std::to_string(ep.port());
    if (addr.is_v6())
        return addr.to_v6().to_v4().to_string() + ":" + std::to_string(ep.port());
    return addr.to_string() + ":" + std::to_string(ep.port());
}

// One request, one response, then close.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, const HttpService& service, std::chrono::seconds timeout)
    : socket_(std::move(socket)),
      timer_(socket_.get_executor()),
      service_(service),
      timeout_(timeout),
      buffer_(http::MAX_HEADER_BYTES) {}

    void start() {
        error_code ec;
        const auto peer = socket_.remote_endpoint(ec);
        if (!ec) request_.remote_address = format_peer(peer);

        timer_.expires_after(timeout_);
        timer_.async_wait([self = shared_from_this()](const error_code& ec) {
            if (ec) return;                                 // cancelled: finished in time
            spdlog::debug("Closing stalled connection from {}", self->request_.remote_address);
            error_code ignore;
            self->socket_.close(ignore);
        });

        read_head();
    }

private:
    void read_head() {
        asio::async_read_until(socket_, buffer_, "\r\n\r\n",
            [self = shared_from_this()](const error_code& ec, std::size_t n) {
                self->on_head(ec, n);
            });
    }

    void on_head(const error_code& ec, std::size_t head_bytes) {
        if (ec == asio::error::not_found) {                // streambuf hit MAX_HEADER_BYTES
            reply(http::error(431, "Request Header Fields Too Large"));
            return;
        }
        if (ec) { finish(); return; }                      // peer went away or timed out

        const auto data = buffer_.data();
        std::string raw(asio::buffers_begin(data), asio::buffers_end(data));
        const std::string head = raw.substr(0, head_bytes);
        std::string extra = raw.substr(head_bytes);        // body bytes read ahead
        buffer_.consume(buffer_.size());

        const std::string peer = request_.remote_address;
        std::string err;
        if (!http::parse_request_head(head, request_, err)) {
            spdlog::debug("Malformed request from {}: {}", peer, err);
            reply(http::error(400, "Bad Request: " + err));
            return;
        }
        request_.remote_address = peer;

        std::size_t length = 0;
        if (!http::content_length(request_, length)) {
            reply(http::error(400, "Bad Request: invalid Content-Length"));
            return;
        }
        if (length > http::MAX_BODY_BYTES) {
            reply(http::error(413, "Request body too large"));
            return;
        }

        if (extra.size() >= length) {
            request_.body = extra.substr(0, length);
            respond();
            return;
        }

        request_.body = std::move(extra);
        const std::size_t have = request_.body.size();
        request_.body.resize(length);

        if (boost::algorithm::iequals(request_.header("expect"), "100-continue")) {
            continue_line_ = "HTTP/1.1 100 Continue\r\n\r\n";
            asio::async_write(socket_, asio::buffer(continue_line_),
                [self = shared_from_this(), have](const error_code& ec, std::size_t) {
                    if (ec) { self->finish(); return; }
                    self->read_body(have);
                });
            return;
        }
        read_body(have);
    }

    void read_body(std::size_t have) {
        asio::async_read(socket_, asio::buffer(&request_.body[have], request_.body.size() - have),
            [self = shared_from_this()](const error_code& ec, std::size_t) {
                if (ec) { self->finish(); return; }
                self->respond();
            });
    }

    void respond() {
        reply(service_.handle(request_));
    }

    void reply(const http::Response& resp) {
        out_ = http::serialize(resp);
        spdlog::debug("{} {} {} -> {}", request_.remote_address, request_.method,
                      request_.target, resp.status);
        asio::async_write(socket_, asio::buffer(out_),
            [self = shared_from_this()](const error_code&, std::size_t) {
                self->finish();
            });
    }

    void finish() {
        error_code ignore;
        socket_.shutdown(tcp::socket::shutdown_both, ignore);
        socket_.close(ignore);
        timer_.cancel();
    }

    tcp::socket               socket_;
    asio::steady_timer        timer_;
    const HttpService&        service_;
    std::chrono::seconds      timeout_;
    asio::streambuf           buffer_;
    http::Request             request_;
    std::string               continue_line_;
    std::string               out_;
};

} // namespace

// ---------- HttpServer ----------

HttpServer::HttpServer(asio::io_context& io, const HttpService& service, std::chrono::seconds timeout)
: io_(io), acceptor_(io), service_(service), timeout_(timeout) {}

bool HttpServer::listen(const tcp::endpoint& endpoint, std::string& err) {
    error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        err = ec.message();
        error_code ignore;
        acceptor_.close(ignore);
        return false;
    }
    return true;
}

void HttpServer::start() {
    do_accept();
}

void HttpServer::stop() {
    error_code ignore;
    acceptor_.close(ignore);
}

std::uint16_t HttpServer::port() const {
    error_code ec;
    const auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_),
        [this](const error_code& ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) return;   // stop() closed the acceptor
            if (ec) {
                spdlog::warn("Accept error: {}", ec.message());
            } else {
                std::make_shared<Session>(std::move(socket), service_, timeout_)->start();
            }
            if (acceptor_.is_open()) do_accept();
        });
}

} // namespace iptrack
