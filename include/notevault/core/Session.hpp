#ifndef INCLUDE_NOTEVAULT_CORE_SESSION_HPP
#define INCLUDE_NOTEVAULT_CORE_SESSION_HPP

#include "notevault/core/Cipher.hpp"
#include <chrono>
#include <functional>
#include <optional>

namespace notevault::core
{

// Key material of one logged-on user plus its idle deadline. Destroying the Session wipes the key.
class Session final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::seconds;
    using NowProvider = std::function<TimePoint()>;

    // A non-positive idle timeout disables expiry.
    Session(Cipher&& cipher, Duration idleTimeout, NowProvider nowProvider = Clock::now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) noexcept = default;
    Session& operator=(Session&&) noexcept = default;
    ~Session() = default;

    // Pushes the deadline out by a full idle timeout.
    void touch() noexcept;
    [[nodiscard]] bool isExpired() const noexcept;

    // Time left before expiry, rounded down; nullopt when expiry is disabled.
    [[nodiscard]] std::optional<Duration> remaining() const noexcept;

    [[nodiscard]] Duration idleTimeout() const noexcept
    {
        return m_idleTimeout;
    }
    [[nodiscard]] Cipher& cipher() noexcept
    {
        return m_cipher;
    }

    // Swaps in the cipher for a new password and counts as activity. The old key is wiped.
    void rebind(Cipher&& cipher) noexcept;

private:
    [[nodiscard]] bool expires() const noexcept
    {
        return m_idleTimeout > Duration::zero();
    }

    NowProvider m_now;
    Duration m_idleTimeout{};
    TimePoint m_deadline{};
    Cipher m_cipher;
};

} // namespace notevault::core

#endif // INCLUDE_NOTEVAULT_CORE_SESSION_HPP
