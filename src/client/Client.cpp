#include "client/Client.hpp"

#include "client_connection_handlers/TcpStream.hpp"
#include "transport/Retry.hpp"

namespace gw {
    using protocol::OutgoingMessage;

    Client::Client(std::shared_ptr<transport::MessageBus> bus, ClientConfig cfg)
        : bus_(std::move(bus)), cfg_(std::move(cfg)), log_("Client", cfg_.log) {
    }

    Client Client::connect(const ClientConfig &cfg) {
        return connect(TcpStream::connect(cfg.host, cfg.port), cfg);
    }

    Client Client::connect(std::unique_ptr<IStream> stream, const ClientConfig &cfg) {
        auto conn = std::make_unique<connection::Connection>(std::move(stream), cfg.client_id, connection_options(cfg));
        conn->establish_connection();

        auto bus = std::make_shared<transport::MessageBus>(std::move(conn), cfg.log);
        bus->start();
        return {std::move(bus), cfg};
    }

    DecoderContext Client::context_() const {
        DecoderContext ctx;
        ctx.server_version = bus_->server_version();
        const auto &tz = bus_->metadata().time_zone;
        ctx.time_zone = tz ? &*tz : nullptr;
        return ctx;
    }

    template<ResponseDecoder Decoder>
    typename Decoder::value_type Client::shared_one_shot_(OutgoingMessage kind, const protocol::RequestMessage &message) {
        return transport::retry_on_connection_reset([&] {
            bus_->wait_until_connected(cfg_.request_timeout);
            auto reply = bus_->send_shared_one_shot(kind, message, cfg_.request_timeout);
            auto ctx = context_();
            ctx.request_type = kind;
            return Decoder::decode(ctx, reply);
        }, log_);
    }

    std::chrono::system_clock::time_point Client::server_time() {
        return shared_one_shot_<CurrentTimeDecoder>(OutgoingMessage::RequestCurrentTime, requests::current_time());
    }

    std::vector<std::string> Client::managed_accounts() {
        return shared_one_shot_<ManagedAccountsDecoder>(OutgoingMessage::RequestManagedAccounts,
                                                        requests::managed_accounts());
    }

    int Client::next_valid_order_id() {
        auto reply = bus_->send_shared_one_shot(OutgoingMessage::RequestIds, requests::next_valid_order_id(),
                                                cfg_.request_timeout);
        const int id = NextValidIdDecoder::decode(context_(), reply);
        bus_->ids().update_order_id(id);
        return id;
    }

    Subscription<PositionsDecoder> Client::positions() {
        return subscribe_shared<PositionsDecoder>(OutgoingMessage::RequestPositions, requests::positions());
    }

    Subscription<RawDecoder> Client::order_update_stream() {
        return Subscription<RawDecoder>(bus_->create_order_update_subscription(), context_(), cfg_.log);
    }

    transport::InternalSubscription Client::send_request(int request_id, const protocol::RequestMessage &message) {
        return bus_->send_request(request_id, message);
    }

    transport::InternalSubscription Client::send_order(int order_id, const protocol::RequestMessage &message) {
        return bus_->send_order(order_id, message);
    }

    transport::InternalSubscription Client::send_shared_request(OutgoingMessage kind,
                                                                const protocol::RequestMessage &message) {
        return bus_->send_shared_request(kind, message);
    }

    void Client::send_message(const protocol::RequestMessage &message) {
        bus_->send_message(message);
    }

    void Client::disconnect() {
        bus_->shutdown();
        bus_->join();
    }

    void Client::wait() {
        bus_->join();
    }
} // namespace gw
