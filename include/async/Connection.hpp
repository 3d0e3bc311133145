#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <string>

#include "connection/Connection.hpp"

namespace gw::async {
    /**
     * @brief Startup exchange and reconnection for the task model.
     *
     * Produces handshaken sockets; the framed session itself is AsyncTcpClient's job.
     * All members run on get_executor() (a strand in practice).
     */
    class Connection {
    public:
        using tcp = boost::asio::ip::tcp;

        Connection(boost::asio::any_io_executor ex, std::string host, std::uint16_t port, int client_id,
                   connection::ConnectionOptions options = {});

        Connection(const Connection &) = delete;

        Connection &operator=(const Connection &) = delete;

        /// TCP connect + startup exchange. Throws system_error (connection_failed, handshake_incomplete).
        boost::asio::awaitable<tcp::socket> connect();

        /// Fibonacci backoff over connect(). Throws system_error(connection_failed) once retries run out.
        boost::asio::awaitable<tcp::socket> reconnect();

        /// Ends a pending backoff sleep; reconnect() gives up. Call on get_executor().
        void cancel_wait() noexcept;

        void record_request(const protocol::RequestMessage &message) const;

        void record_response(const protocol::ResponseMessage &message) const;

        [[nodiscard]] const ConnectionMetadata &metadata() const noexcept { return metadata_; }
        [[nodiscard]] int server_version() const noexcept { return metadata_.server_version; }
        [[nodiscard]] int client_id() const noexcept { return client_id_; }
        [[nodiscard]] const boost::asio::any_io_executor &get_executor() const noexcept { return ex_; }

    private:
        boost::asio::awaitable<ConnectionMetadata> handshake_(tcp::socket &socket);

        boost::asio::awaitable<protocol::ResponseMessage> read_message_(tcp::socket &socket,
                                                                        boost::system::error_code &ec);

        boost::asio::awaitable<void> write_bytes_(tcp::socket &socket, std::string bytes,
                                                  boost::system::error_code &ec);

    private:
        boost::asio::any_io_executor ex_;
        std::string host_;
        std::uint16_t port_;
        int client_id_;
        connection::ConnectionOptions options_;
        connection::ConnectionHandler handler_;
        ConnectionMetadata metadata_;
        bool established_{false};
        bool stopped_{false};
        boost::asio::steady_timer backoff_timer_;
        Logger log_;
    };
} // namespace gw::async
