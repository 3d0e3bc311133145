#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "abstract/Stream.hpp"
#include "client/ClientConfig.hpp"
#include "subscription/Decoders.hpp"
#include "subscription/Subscription.hpp"
#include "transport/MessageBus.hpp"

namespace gw {
    /**
     * @brief Blocking client: one gateway session, shareable across threads.
     *
     * Usage:
     *   auto client = gw::Client::connect(cfg);
     *   auto positions = client.positions();
     *   for (auto &update : positions) { ... }
     *
     * Copies share the session; the last copy going away shuts it down.
     */
    class Client {
    public:
        /// TCP connect + startup exchange. Throws system_error (connection_failed, handshake_incomplete).
        static Client connect(const ClientConfig &cfg);

        /// Same over a caller supplied stream (tests, proxies).
        static Client connect(std::unique_ptr<IStream> stream, const ClientConfig &cfg);

        [[nodiscard]] const ConnectionMetadata &connection_metadata() const noexcept { return bus_->metadata(); }
        [[nodiscard]] int server_version() const noexcept { return bus_->server_version(); }
        [[nodiscard]] int client_id() const noexcept { return bus_->metadata().client_id; }
        [[nodiscard]] bool is_connected() const noexcept { return bus_->is_connected(); }

        [[nodiscard]] int next_request_id() noexcept { return bus_->ids().next_request_id(); }
        [[nodiscard]] int next_order_id() noexcept { return bus_->ids().next_order_id(); }

        /// Gateway clock. Re-issued when a connection reset interrupts it.
        std::chrono::system_clock::time_point server_time();

        /// Accounts this login can trade. Re-issued after a connection reset.
        std::vector<std::string> managed_accounts();

        /// Asks the gateway for the next usable order id and re-seeds next_order_id() from it.
        int next_valid_order_id();

        /// Position updates, terminated by PositionEnd.
        Subscription<PositionsDecoder> positions();

        /// Every order related frame of this session. One stream at a time.
        Subscription<RawDecoder> order_update_stream();

        /// Raw access for request/response collaborators.
        transport::InternalSubscription send_request(int request_id, const protocol::RequestMessage &message);

        transport::InternalSubscription send_order(int order_id, const protocol::RequestMessage &message);

        transport::InternalSubscription send_shared_request(protocol::OutgoingMessage kind,
                                                            const protocol::RequestMessage &message);

        void send_message(const protocol::RequestMessage &message);

        template<ResponseDecoder Decoder>
        Subscription<Decoder> subscribe(int request_id, const protocol::RequestMessage &message) {
            auto ctx = context_();
            ctx.request_id = request_id;
            return Subscription<Decoder>(bus_->send_request(request_id, message), ctx, cfg_.log);
        }

        template<ResponseDecoder Decoder>
        Subscription<Decoder> subscribe_order(int order_id, const protocol::RequestMessage &message) {
            auto ctx = context_();
            ctx.order_id = order_id;
            return Subscription<Decoder>(bus_->send_order(order_id, message), ctx, cfg_.log);
        }

        template<ResponseDecoder Decoder>
        Subscription<Decoder> subscribe_shared(protocol::OutgoingMessage kind, const protocol::RequestMessage &message) {
            auto ctx = context_();
            ctx.request_type = kind;
            return Subscription<Decoder>(bus_->send_shared_request(kind, message), ctx, cfg_.log);
        }

        /// Stops the dispatcher; every subscription ends.
        void disconnect();

        /// Blocks until the session ends on its own (gateway shutdown or reconnect exhaustion).
        void wait();

    private:
        Client(std::shared_ptr<transport::MessageBus> bus, ClientConfig cfg);

        [[nodiscard]] DecoderContext context_() const;

        template<ResponseDecoder Decoder>
        typename Decoder::value_type shared_one_shot_(protocol::OutgoingMessage kind,
                                                      const protocol::RequestMessage &message);

    private:
        std::shared_ptr<transport::MessageBus> bus_;
        ClientConfig cfg_;
        Logger log_;
    };
} // namespace gw
