#pragma once

#include <memory>

#include "abstract/Stream.hpp"
#include "connection/ConnectionMetadata.hpp"
#include "connection/Handshake.hpp"
#include "postprocess/MessageRecorder.hpp"
#include "transport/Backoff.hpp"
#include "utils/Logger.hpp"

namespace gw::connection {
    struct ConnectionOptions {
        int min_version{server_versions::MIN_CLIENT_VERSION};
        int max_version{server_versions::MAX_CLIENT_VERSION};
        transport::ReconnectPolicy reconnect{};
        StartupCallback startup{};
        std::shared_ptr<MessageRecorder> recorder{}; ///< null = no recording
        LogFn log{};
    };

    /**
     * @brief Blocking session over an IStream: startup exchange, framed I/O, reconnection.
     *
     * read_message() is for the single reader (startup code, then the dispatcher).
     * write_message() may be called from any thread.
     */
    class Connection {
    public:
        Connection(std::unique_ptr<IStream> stream, int client_id, ConnectionOptions options = {});

        Connection(const Connection &) = delete;

        Connection &operator=(const Connection &) = delete;

        /// Handshake, start-API, account info. Throws system_error (handshake_incomplete, connection_failed).
        void establish_connection();

        /**
         * Fibonacci-backoff reconnection. Each attempt reopens the stream and redoes the
         * startup exchange. Throws system_error(connection_failed) once retries run out.
         */
        void reconnect();

        void write_message(const protocol::RequestMessage &message, boost::system::error_code &ec);

        void write_message(const protocol::RequestMessage &message);

        protocol::ResponseMessage read_message(boost::system::error_code &ec);

        [[nodiscard]] const ConnectionMetadata &metadata() const noexcept { return metadata_; }
        [[nodiscard]] int server_version() const noexcept { return metadata_.server_version; }
        [[nodiscard]] int client_id() const noexcept { return client_id_; }

        void shutdown() noexcept { stream_->shutdown(); }

    private:
        ConnectionMetadata handshake_();

    private:
        std::unique_ptr<IStream> stream_;
        int client_id_;
        ConnectionOptions options_;
        ConnectionHandler handler_;
        ConnectionMetadata metadata_;
        bool established_{false};
        Logger log_;
    };
} // namespace gw::connection
