#include "client_connection_handlers/AsyncTcpClient.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include "common/Errors.hpp"
#include "protocol/WireCodec.hpp"

namespace gw {
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    AsyncTcpClient::AsyncTcpClient(asio::io_context &ioc)
        : ioc_(ioc),
          strand_(ioc.get_executor()),
          socket_(ioc) {
    }

    void AsyncTcpClient::start(tcp::socket socket) {
        auto self = shared_from_this();
        asio::dispatch(strand_, [self, socket = std::move(socket)]() mutable {
            self->close_socket_hard_();

            self->socket_ = std::move(socket);
            ++self->session_;
            self->closing_ = false;
            self->open_ = true;
            self->write_in_flight_ = false;

            self->start_write_(); // frames queued before the session started
            self->do_read_header_();
        });
    }

    void AsyncTcpClient::do_read_header_() {
        auto self = shared_from_this();
        const auto session = session_;
        asio::async_read(socket_, asio::buffer(header_),
                         asio::bind_executor(strand_,
                                             [self, session](const boost::system::error_code &ec, std::size_t) {
                                                 if (session != self->session_) return;
                                                 if (ec) return self->fail_(ec, "read header");

                                                 const auto len = protocol::decode_length(self->header_);
                                                 if (len > protocol::kMaxFrameSize) {
                                                     return self->fail_(
                                                         error::make_error_code(error::errc::connection_reset),
                                                         "frame too large");
                                                 }
                                                 self->do_read_body_(len);
                                             }));
    }

    void AsyncTcpClient::do_read_body_(std::uint32_t len) {
        body_.assign(len, '\0');
        auto self = shared_from_this();
        const auto session = session_;
        asio::async_read(socket_, asio::buffer(body_),
                         asio::bind_executor(strand_,
                                             [self, session](const boost::system::error_code &ec, std::size_t) {
                                                 if (session != self->session_) return;
                                                 if (ec) return self->fail_(ec, "read body");

                                                 if (self->on_frame_) {
                                                     try {
                                                         self->on_frame_(std::move(self->body_));
                                                     } catch (const std::exception &e) {
                                                         self->log_.error(std::string("frame handler: ") + e.what());
                                                     }
                                                 }
                                                 self->do_read_header_();
                                             }));
    }

    void AsyncTcpClient::send(std::string bytes, WriteHandler done) {
        auto self = shared_from_this();
        asio::dispatch(strand_, [self, bytes = std::move(bytes), done = std::move(done)]() mutable {
            if (self->closing_) {
                if (done) done(error::make_error_code(error::errc::connection_reset));
                return;
            }
            self->outbox_.push_back(Outgoing{std::move(bytes), std::move(done)});
            self->start_write_();
        });
    }

    void AsyncTcpClient::start_write_() {
        // strand-only
        if (write_in_flight_) return;
        if (outbox_.empty()) return;
        if (closing_) return;
        do_write_();
    }

    void AsyncTcpClient::do_write_() {
        // strand-only
        write_in_flight_ = true;

        auto self = shared_from_this();
        const auto session = session_;
        asio::async_write(socket_, asio::buffer(outbox_.front().bytes),
                          asio::bind_executor(strand_,
                                              [self, session](const boost::system::error_code &ec, std::size_t) {
                                                  if (session != self->session_) return;
                                                  self->write_in_flight_ = false;

                                                  if (ec) return self->fail_(ec, "write");

                                                  auto done = std::move(self->outbox_.front().done);
                                                  self->outbox_.pop_front();
                                                  if (done) done({});
                                                  self->start_write_();
                                              }));
    }

    void AsyncTcpClient::close() {
        auto self = shared_from_this();
        asio::dispatch(strand_, [self] {
            if (self->closing_) return;
            self->closing_ = true;
            ++self->session_;
            self->close_socket_hard_();
            self->fail_outbox_(error::make_error_code(error::errc::shutdown));
        });
    }

    void AsyncTcpClient::fail_(boost::system::error_code ec, std::string_view where) {
        // strand-only
        if (closing_) return;
        closing_ = true;
        ++session_;

        log_.warn(std::string(where) + ": " + ec.message());

        close_socket_hard_();
        fail_outbox_(ec);
        if (on_close_) on_close_(ec);
    }

    void AsyncTcpClient::fail_outbox_(const boost::system::error_code &ec) {
        const auto reported = is_connection_error(ec) ? error::make_error_code(error::errc::connection_reset) : ec;
        auto pending = std::move(outbox_);
        outbox_.clear();
        write_in_flight_ = false;
        for (auto &out: pending) {
            if (out.done) out.done(reported);
        }
    }

    void AsyncTcpClient::close_socket_hard_() noexcept {
        open_ = false;
        boost::system::error_code ignored;
        socket_.cancel(ignored);
        socket_.close(ignored);
    }
} // namespace gw
