#include "async/Client.hpp"

#include <boost/asio/strand.hpp>

#include "async/Retry.hpp"

namespace gw::async {
    namespace asio = boost::asio;
    using asio::awaitable;
    using protocol::OutgoingMessage;

    Client::Client(std::shared_ptr<MessageBus> bus, ClientConfig cfg)
        : bus_(std::move(bus)), cfg_(std::move(cfg)), log_("AsyncClient", cfg_.log) {
    }

    awaitable<Client> Client::connect(asio::io_context &ioc, ClientConfig cfg) {
        auto conn = std::make_unique<Connection>(asio::make_strand(ioc), cfg.host, cfg.port, cfg.client_id,
                                                 connection_options(cfg));
        auto socket = co_await conn->connect();

        auto bus = std::make_shared<MessageBus>(ioc, std::move(conn), cfg.log);
        bus->start(std::move(socket));
        co_return Client(std::move(bus), std::move(cfg));
    }

    DecoderContext Client::context_() const {
        DecoderContext ctx;
        ctx.server_version = bus_->server_version();
        const auto &tz = bus_->metadata().time_zone;
        ctx.time_zone = tz ? &*tz : nullptr;
        return ctx;
    }

    template<ResponseDecoder Decoder>
    awaitable<typename Decoder::value_type> Client::shared_one_shot_(OutgoingMessage kind,
                                                                     protocol::RequestMessage message) {
        co_return co_await retry_on_connection_reset([this, kind, message]() -> awaitable<typename Decoder::value_type> {
            co_await bus_->wait_until_connected(cfg_.request_timeout);
            auto reply = co_await bus_->send_shared_one_shot(kind, message, cfg_.request_timeout);
            auto ctx = context_();
            ctx.request_type = kind;
            co_return Decoder::decode(ctx, reply);
        }, log_);
    }

    awaitable<std::chrono::system_clock::time_point> Client::server_time() {
        co_return co_await shared_one_shot_<CurrentTimeDecoder>(OutgoingMessage::RequestCurrentTime,
                                                                requests::current_time());
    }

    awaitable<std::vector<std::string> > Client::managed_accounts() {
        co_return co_await shared_one_shot_<ManagedAccountsDecoder>(OutgoingMessage::RequestManagedAccounts,
                                                                    requests::managed_accounts());
    }

    awaitable<int> Client::next_valid_order_id() {
        auto reply = co_await bus_->send_shared_one_shot(OutgoingMessage::RequestIds, requests::next_valid_order_id(),
                                                         cfg_.request_timeout);
        const int id = NextValidIdDecoder::decode(context_(), reply);
        bus_->ids().update_order_id(id);
        co_return id;
    }

    awaitable<Subscription<PositionsDecoder> > Client::positions() {
        co_return co_await subscribe_shared<PositionsDecoder>(OutgoingMessage::RequestPositions, requests::positions());
    }

    Subscription<RawDecoder> Client::order_update_stream() {
        return Subscription<RawDecoder>(bus_->create_order_update_subscription(), context_(), bus_->get_executor(),
                                        cfg_.log);
    }

    awaitable<InternalSubscription> Client::send_request(int request_id, protocol::RequestMessage message) {
        co_return co_await bus_->send_request(request_id, std::move(message));
    }

    awaitable<InternalSubscription> Client::send_order(int order_id, protocol::RequestMessage message) {
        co_return co_await bus_->send_order(order_id, std::move(message));
    }

    awaitable<InternalSubscription> Client::send_shared_request(OutgoingMessage kind, protocol::RequestMessage message) {
        co_return co_await bus_->send_shared_request(kind, std::move(message));
    }

    awaitable<void> Client::send_message(protocol::RequestMessage message) {
        co_await bus_->send_message(std::move(message));
    }

    void Client::disconnect() {
        bus_->shutdown();
    }
} // namespace gw::async
