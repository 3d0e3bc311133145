#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "async/MessageBus.hpp"
#include "async/Subscription.hpp"
#include "client/ClientConfig.hpp"
#include "subscription/Decoders.hpp"

namespace gw::async {
    /**
     * @brief Task-model client: the operations of gw::Client as coroutines.
     *
     *   boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
     *       auto client = co_await gw::async::Client::connect(ioc, cfg);
     *       auto positions = co_await client.positions();
     *       while (auto update = co_await positions.next()) { ... }
     *   }, boost::asio::detached);
     *   ioc.run();
     */
    class Client {
    public:
        /// TCP connect + startup exchange. Throws system_error (connection_failed, handshake_incomplete).
        static boost::asio::awaitable<Client> connect(boost::asio::io_context &ioc, ClientConfig cfg);

        [[nodiscard]] const ConnectionMetadata &connection_metadata() const noexcept { return bus_->metadata(); }
        [[nodiscard]] int server_version() const noexcept { return bus_->server_version(); }
        [[nodiscard]] int client_id() const noexcept { return bus_->metadata().client_id; }
        [[nodiscard]] bool is_connected() const noexcept { return bus_->is_connected(); }

        [[nodiscard]] int next_request_id() noexcept { return bus_->ids().next_request_id(); }
        [[nodiscard]] int next_order_id() noexcept { return bus_->ids().next_order_id(); }

        boost::asio::awaitable<std::chrono::system_clock::time_point> server_time();

        boost::asio::awaitable<std::vector<std::string> > managed_accounts();

        boost::asio::awaitable<int> next_valid_order_id();

        boost::asio::awaitable<Subscription<PositionsDecoder> > positions();

        Subscription<RawDecoder> order_update_stream();

        boost::asio::awaitable<InternalSubscription> send_request(int request_id, protocol::RequestMessage message);

        boost::asio::awaitable<InternalSubscription> send_order(int order_id, protocol::RequestMessage message);

        boost::asio::awaitable<InternalSubscription> send_shared_request(protocol::OutgoingMessage kind,
                                                                         protocol::RequestMessage message);

        boost::asio::awaitable<void> send_message(protocol::RequestMessage message);

        template<ResponseDecoder Decoder>
        boost::asio::awaitable<Subscription<Decoder> > subscribe(int request_id, protocol::RequestMessage message) {
            auto ctx = context_();
            ctx.request_id = request_id;
            auto internal = co_await bus_->send_request(request_id, std::move(message));
            co_return Subscription<Decoder>(std::move(internal), ctx, bus_->get_executor(), cfg_.log);
        }

        template<ResponseDecoder Decoder>
        boost::asio::awaitable<Subscription<Decoder> > subscribe_order(int order_id, protocol::RequestMessage message) {
            auto ctx = context_();
            ctx.order_id = order_id;
            auto internal = co_await bus_->send_order(order_id, std::move(message));
            co_return Subscription<Decoder>(std::move(internal), ctx, bus_->get_executor(), cfg_.log);
        }

        template<ResponseDecoder Decoder>
        boost::asio::awaitable<Subscription<Decoder> > subscribe_shared(protocol::OutgoingMessage kind,
                                                                        protocol::RequestMessage message) {
            auto ctx = context_();
            ctx.request_type = kind;
            auto internal = co_await bus_->send_shared_request(kind, std::move(message));
            co_return Subscription<Decoder>(std::move(internal), ctx, bus_->get_executor(), cfg_.log);
        }

        /// Closes the socket; every subscription ends.
        void disconnect();

    private:
        Client(std::shared_ptr<MessageBus> bus, ClientConfig cfg);

        [[nodiscard]] DecoderContext context_() const;

        template<ResponseDecoder Decoder>
        boost::asio::awaitable<typename Decoder::value_type> shared_one_shot_(protocol::OutgoingMessage kind,
                                                                              protocol::RequestMessage message);

    private:
        std::shared_ptr<MessageBus> bus_;
        ClientConfig cfg_;
        Logger log_;
    };
} // namespace gw::async
