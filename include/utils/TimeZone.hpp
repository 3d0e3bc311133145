#pragma once

#include <boost/date_time/local_time/local_time_types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace gw::utils {
    /// A resolved gateway time zone: canonical IANA name plus its rules.
    struct TimeZone {
        std::string name;
        boost::local_time::time_zone_ptr rules;
    };

    /**
     * 'map_timezone_name' folds the names gateways actually send onto IANA names.
     * Chinese localized names, "China Standard Time", text containing U+FFFD and
     * text that is not valid UTF-8 (GB2312 installs) all map to Asia/Shanghai.
     * Any other name is returned unchanged.
     */
    [[nodiscard]] std::string_view map_timezone_name(std::string_view name) noexcept;

    /// Resolves IANA names, common abbreviations and Windows names. nullopt when unknown.
    [[nodiscard]] std::optional<TimeZone> find_timezone(std::string_view name);

    [[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;
} // namespace gw::utils
