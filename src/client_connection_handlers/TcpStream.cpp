#include "client_connection_handlers/TcpStream.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <sys/socket.h>

#include "common/Errors.hpp"
#include "protocol/WireCodec.hpp"

namespace gw {
    namespace asio = boost::asio;

    TcpStream::TcpStream(std::string host, std::uint16_t port)
        : socket_(ioc_), host_(std::move(host)), port_(port) {
    }

    TcpStream::~TcpStream() {
        shutdown();
    }

    std::unique_ptr<TcpStream> TcpStream::connect(const std::string &host, std::uint16_t port) {
        std::unique_ptr<TcpStream> stream(new TcpStream(host, port));
        boost::system::error_code ec;
        stream->open_(ec);
        if (ec) {
            throw boost::system::system_error(error::make_error_code(error::errc::connection_failed),
                                              host + ":" + std::to_string(port) + ": " + ec.message());
        }
        return stream;
    }

    void TcpStream::open_(boost::system::error_code &ec) {
        tcp::resolver resolver(ioc_);
        const auto results = resolver.resolve(host_, std::to_string(port_), ec);
        if (ec) return;

        tcp::socket fresh(ioc_);
        asio::connect(fresh, results, ec);
        if (ec) return;
        fresh.set_option(tcp::no_delay(true), ec);
        if (ec) return;

        std::lock_guard lk(state_mu_);
        if (shutdown_) {
            ec = asio::error::operation_aborted;
            return;
        }
        boost::system::error_code ignored;
        socket_.close(ignored);
        socket_ = std::move(fresh);
    }

    std::string TcpStream::read_frame(boost::system::error_code &ec) {
        std::lock_guard lk(read_mu_);
        unsigned char prefix[4];
        asio::read(socket_, asio::buffer(prefix), ec);
        if (ec) return {};

        const auto len = protocol::decode_length(prefix);
        if (len > protocol::kMaxFrameSize) {
            // The stream is out of sync; only a fresh connection recovers it.
            ec = error::make_error_code(error::errc::connection_reset);
            return {};
        }
        std::string payload(len, '\0');
        if (len > 0) asio::read(socket_, asio::buffer(payload.data(), payload.size()), ec);
        if (ec) return {};
        return payload;
    }

    void TcpStream::write_all(std::string_view bytes, boost::system::error_code &ec) {
        std::lock_guard lk(write_mu_);
        asio::write(socket_, asio::buffer(bytes.data(), bytes.size()), ec);
    }

    void TcpStream::reconnect(boost::system::error_code &ec) {
        std::lock_guard lk(write_mu_);
        open_(ec);
    }

    void TcpStream::sleep(std::chrono::milliseconds d) {
        std::unique_lock lk(state_mu_);
        state_cv_.wait_for(lk, d, [this] { return shutdown_; });
    }

    void TcpStream::shutdown() noexcept {
        {
            std::lock_guard lk(state_mu_);
            if (!shutdown_) {
                shutdown_ = true;
                if (socket_.is_open()) ::shutdown(socket_.native_handle(), SHUT_RDWR);
            }
        }
        state_cv_.notify_all();
    }
} // namespace gw
