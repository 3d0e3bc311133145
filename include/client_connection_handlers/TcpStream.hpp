#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "abstract/Stream.hpp"

namespace gw {
    /**
     * @brief Blocking TCP transport for the threaded model.
     *
     * Reads and writes take separate locks so one dispatcher thread can sit in
     * read_frame() while callers write. shutdown() closes both halves at the OS level
     * to unblock the reader, since a blocking asio read ignores SO_RCVTIMEO.
     */
    class TcpStream final : public IStream {
    public:
        /// Connects with TCP_NODELAY. Throws system_error(connection_failed).
        static std::unique_ptr<TcpStream> connect(const std::string &host, std::uint16_t port);

        TcpStream(const TcpStream &) = delete;

        TcpStream &operator=(const TcpStream &) = delete;

        ~TcpStream() override;

        std::string read_frame(boost::system::error_code &ec) override;

        void write_all(std::string_view bytes, boost::system::error_code &ec) override;

        void reconnect(boost::system::error_code &ec) override;

        /// Interrupted early by shutdown().
        void sleep(std::chrono::milliseconds d) override;

        void shutdown() noexcept override;

        [[nodiscard]] const std::string &host() const noexcept { return host_; }
        [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    private:
        TcpStream(std::string host, std::uint16_t port);

        void open_(boost::system::error_code &ec);

    private:
        using tcp = boost::asio::ip::tcp;

        boost::asio::io_context ioc_;
        tcp::socket socket_;

        std::string host_;
        std::uint16_t port_;

        std::mutex read_mu_;
        std::mutex write_mu_;

        std::mutex state_mu_; // guards shutdown_ and socket replacement
        std::condition_variable state_cv_;
        bool shutdown_{false};
    };
} // namespace gw
