#include "utils/TimeZone.hpp"

#include <boost/date_time/local_time/local_time.hpp>

#include <array>
#include <utility>

namespace gw::utils {
    namespace {
        constexpr std::string_view kShanghai = "Asia/Shanghai";

        // Offsets use Boost's convention: "-05" is five hours west of UTC.
        struct ZoneRule {
            std::string_view iana;
            std::string_view posix;
        };

        constexpr std::array<ZoneRule, 16> kRules{{
            {"America/New_York", "EST-05EDT+01,M3.2.0/02:00,M11.1.0/02:00"},
            {"America/Chicago", "CST-06CDT+01,M3.2.0/02:00,M11.1.0/02:00"},
            {"America/Denver", "MST-07MDT+01,M3.2.0/02:00,M11.1.0/02:00"},
            {"America/Los_Angeles", "PST-08PDT+01,M3.2.0/02:00,M11.1.0/02:00"},
            {"America/Toronto", "EST-05EDT+01,M3.2.0/02:00,M11.1.0/02:00"},
            {"Europe/London", "GMT+00BST+01,M3.5.0/01:00,M10.5.0/02:00"},
            {"Europe/Berlin", "CET+01CEST+01,M3.5.0/02:00,M10.5.0/03:00"},
            {"Europe/Zurich", "CET+01CEST+01,M3.5.0/02:00,M10.5.0/03:00"},
            {"Asia/Shanghai", "CST+08"},
            {"Asia/Hong_Kong", "HKT+08"},
            {"Asia/Singapore", "SGT+08"},
            {"Asia/Tokyo", "JST+09"},
            {"Asia/Kolkata", "IST+05:30"},
            {"Australia/Sydney", "AEST+10AEDT+01,M10.1.0/02:00,M4.1.0/03:00"},
            {"Pacific/Auckland", "NZST+12NZDT+01,M9.5.0/02:00,M4.1.0/03:00"},
            {"UTC", "UTC+00"},
        }};

        // Abbreviations and Windows names seen in gateway handshakes.
        constexpr std::array<std::pair<std::string_view, std::string_view>, 40> kAliases{{
            {"EST", "America/New_York"}, {"EDT", "America/New_York"},
            {"US/Eastern", "America/New_York"}, {"Eastern Standard Time", "America/New_York"},
            {"CST", "America/Chicago"}, {"CDT", "America/Chicago"},
            {"US/Central", "America/Chicago"}, {"Central Standard Time", "America/Chicago"},
            {"MST", "America/Denver"}, {"MDT", "America/Denver"},
            {"US/Mountain", "America/Denver"}, {"Mountain Standard Time", "America/Denver"},
            {"PST", "America/Los_Angeles"}, {"PDT", "America/Los_Angeles"},
            {"US/Pacific", "America/Los_Angeles"}, {"Pacific Standard Time", "America/Los_Angeles"},
            {"GMT", "Europe/London"}, {"BST", "Europe/London"},
            {"GMT Standard Time", "Europe/London"}, {"Europe/Dublin", "Europe/London"},
            {"CET", "Europe/Berlin"}, {"CEST", "Europe/Berlin"}, {"MET", "Europe/Berlin"},
            {"W. Europe Standard Time", "Europe/Berlin"}, {"Central Europe Standard Time", "Europe/Berlin"},
            {"HKT", "Asia/Hong_Kong"}, {"Hongkong", "Asia/Hong_Kong"},
            {"SGT", "Asia/Singapore"}, {"Singapore Standard Time", "Asia/Singapore"},
            {"JST", "Asia/Tokyo"}, {"Japan", "Asia/Tokyo"}, {"Tokyo Standard Time", "Asia/Tokyo"},
            {"IST", "Asia/Kolkata"}, {"India Standard Time", "Asia/Kolkata"},
            {"AEST", "Australia/Sydney"}, {"AEDT", "Australia/Sydney"},
            {"AUS Eastern Standard Time", "Australia/Sydney"},
            {"NZST", "Pacific/Auckland"},
            {"Etc/UTC", "UTC"}, {"Z", "UTC"},
        }};

        std::string_view canonical_name(std::string_view name) noexcept {
            for (const auto &r: kRules) {
                if (r.iana == name) return r.iana;
            }
            for (const auto &[alias, iana]: kAliases) {
                if (alias == name) return iana;
            }
            return {};
        }
    } // namespace

    bool is_valid_utf8(std::string_view text) noexcept {
        std::size_t i = 0;
        while (i < text.size()) {
            const auto c = static_cast<unsigned char>(text[i]);
            std::size_t extra;
            if (c < 0x80) extra = 0;
            else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
            else if ((c & 0xF0) == 0xE0) extra = 2;
            else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
            else return false;
            if (extra > 0 && i + extra >= text.size()) return false;
            for (std::size_t k = 1; k <= extra; ++k) {
                if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) return false;
            }
            i += extra + 1;
        }
        return true;
    }

    std::string_view map_timezone_name(std::string_view name) noexcept {
        if (name == "中国标准时间" || name == "北京时间") return kShanghai;
        if (name == "China Standard Time") return kShanghai;
        // GB2312 names decoded lossily carry U+FFFD; undecoded ones are not UTF-8 at all.
        if (name.find("\xEF\xBF\xBD") != std::string_view::npos) return kShanghai;
        if (!is_valid_utf8(name)) return kShanghai;
        return name;
    }

    std::optional<TimeZone> find_timezone(std::string_view name) {
        const auto iana = canonical_name(map_timezone_name(name));
        if (iana.empty()) return std::nullopt;
        for (const auto &r: kRules) {
            if (r.iana != iana) continue;
            return TimeZone{
                std::string(r.iana),
                boost::local_time::time_zone_ptr(new boost::local_time::posix_time_zone(std::string(r.posix)))
            };
        }
        return std::nullopt;
    }
} // namespace gw::utils
