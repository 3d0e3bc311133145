#include "connection/Handshake.hpp"

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <charconv>

namespace gw::connection {
    using protocol::IncomingMessage;
    using protocol::OutgoingMessage;

    namespace {
        bool parse_digits(std::string_view s, int &out) noexcept {
            if (s.empty()) return false;
            const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc{} && ptr == s.data() + s.size();
        }
    } // namespace

    std::string ConnectionHandler::format_handshake() const {
        const std::string version = "v" + std::to_string(min_version_) + ".." + std::to_string(max_version_);
        std::string out("API", 3);
        out.push_back('\0');
        out += protocol::encode_length(version);
        return out;
    }

    HandshakeData ConnectionHandler::parse_handshake_response(protocol::ResponseMessage &response) const {
        HandshakeData data;
        data.min_version = min_version_;
        data.max_version = max_version_;
        data.server_version = response.next_int();
        data.server_time = response.next_string();
        return data;
    }

    protocol::RequestMessage ConnectionHandler::format_start_api(int client_id, int server_version) const {
        constexpr int kVersion = 2;
        protocol::RequestMessage msg;
        msg.push(OutgoingMessage::StartApi).push(kVersion).push(client_id);
        if (server_version > server_versions::OPTIONAL_CAPABILITIES) {
            msg.push(""); // optional capabilities
        }
        return msg;
    }

    AccountInfo ConnectionHandler::parse_account_info(protocol::ResponseMessage &message,
                                                      const StartupCallback &callback,
                                                      const Logger &log) const {
        AccountInfo info;
        switch (message.message_type()) {
            case IncomingMessage::NextValidId:
                message.skip(); // type
                message.skip(); // version
                info.next_order_id = message.next_int();
                break;
            case IncomingMessage::ManagedAccounts:
                message.skip();
                message.skip();
                info.managed_accounts = message.next_string();
                break;
            case IncomingMessage::Error:
                log.error("error during startup: " + message.encode_simple());
                break;
            default:
                if (callback) {
                    callback(message);
                } else {
                    log.warn("startup frame dropped (no startup callback): " + message.encode_simple());
                }
                break;
        }
        return info;
    }

    std::pair<std::optional<std::chrono::system_clock::time_point>, std::optional<utils::TimeZone> >
    parse_connection_time(std::string_view text, const Logger &log) {
        namespace lt = boost::local_time;
        namespace pt = boost::posix_time;

        const auto first = text.find(' ');
        const auto second = first == std::string_view::npos ? first : text.find(' ', first + 1);
        if (second == std::string_view::npos || second + 1 >= text.size()) {
            log.error("invalid connection time format: " + std::string(text));
            return {};
        }

        const auto date_part = text.substr(0, first);
        const auto time_part = text.substr(first + 1, second - first - 1);
        const auto zone_part = text.substr(second + 1);

        auto zone = utils::find_timezone(zone_part);
        if (!zone) {
            log.error("time zone not found for " + std::string(zone_part));
            return {};
        }

        int ymd = 0, hh = 0, mm = 0, ss = 0;
        if (date_part.size() != 8 || time_part.size() != 8
            || time_part[2] != ':' || time_part[5] != ':'
            || !parse_digits(date_part, ymd)
            || !parse_digits(time_part.substr(0, 2), hh)
            || !parse_digits(time_part.substr(3, 2), mm)
            || !parse_digits(time_part.substr(6, 2), ss)
            || hh > 23 || mm > 59 || ss > 59) {
            log.warn("could not parse connection time from " + std::string(text));
            return {std::nullopt, std::move(zone)};
        }

        try {
            const boost::gregorian::date day(
                static_cast<unsigned short>(ymd / 10000),
                static_cast<unsigned short>(ymd / 100 % 100),
                static_cast<unsigned short>(ymd % 100));
            const lt::local_date_time local(day, pt::time_duration(hh, mm, ss), zone->rules,
                                            lt::local_date_time::NOT_DATE_TIME_ON_ERROR);
            if (local.is_not_a_date_time()) {
                log.warn("connection time does not exist in zone " + zone->name);
                return {std::nullopt, std::move(zone)};
            }
            const pt::ptime epoch(boost::gregorian::date(1970, 1, 1));
            const auto seconds = (local.utc_time() - epoch).total_seconds();
            return {
                std::chrono::system_clock::time_point{std::chrono::seconds{seconds}},
                std::move(zone)
            };
        } catch (const std::out_of_range &e) {
            log.warn("could not parse connection time from " + std::string(text) + ": " + e.what());
            return {std::nullopt, std::move(zone)};
        }
    }

    bool apply_account_info(const AccountInfo &info, ConnectionMetadata &meta, bool &saw_order_id,
                            bool &saw_accounts) {
        if (info.next_order_id) {
            meta.next_order_id = *info.next_order_id;
            saw_order_id = true;
        }
        if (info.managed_accounts) {
            meta.managed_accounts = *info.managed_accounts;
            saw_accounts = true;
        }
        return saw_order_id && saw_accounts;
    }

    void log_metadata_changes(const ConnectionMetadata &current, const ConnectionMetadata &fresh, const Logger &log) {
        if (fresh.server_version != current.server_version) {
            log.warn("server version changed across reconnect: " + std::to_string(current.server_version) +
                     " -> " + std::to_string(fresh.server_version));
        }
        if (fresh.managed_accounts != current.managed_accounts) {
            log.warn("managed accounts changed across reconnect: " + fresh.managed_accounts);
        }
    }
} // namespace gw::connection
