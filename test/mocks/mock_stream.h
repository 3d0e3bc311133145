#pragma once

#include <gmock/gmock.h>

#include "abstract/Stream.hpp"

namespace gw {
    /// @brief GoogleMock test double for IStream (failure paths of the blocking connection).
    class MockStream : public IStream {
    public:
        /// @brief One payload per call; end of stream is reported through ec.
        MOCK_METHOD(std::string, read_frame, (boost::system::error_code &), (override));
        /// @brief Raw, already framed bytes.
        MOCK_METHOD(void, write_all, (std::string_view, boost::system::error_code &), (override));
        /// @brief Reopen the socket to the same endpoint.
        MOCK_METHOD(void, reconnect, (boost::system::error_code &), (override));
        /// @brief Backoff sleep.
        MOCK_METHOD(void, sleep, (std::chrono::milliseconds), (override));
        /// @brief Unblock reads, close both halves.
        MOCK_METHOD(void, shutdown, (), (noexcept, override));
    };
} // namespace gw
