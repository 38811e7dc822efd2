#include "notevault/core/Session.hpp"

#include <utility>

namespace notevault::core
{

Session::Session(Cipher&& cipher, Duration idleTimeout, NowProvider nowProvider)
    : m_now(std::move(nowProvider)), m_idleTimeout(idleTimeout), m_cipher(std::move(cipher))
{
    touch();
}

void Session::touch() noexcept
{
    m_deadline = m_now() + m_idleTimeout;
}

bool Session::isExpired() const noexcept
{
    return expires() && m_now() > m_deadline;
}

std::optional<Session::Duration> Session::remaining() const noexcept
{
    if (!expires())
    {
        return std::nullopt;
    }
    const auto left{ std::chrono::floor<Duration>(m_deadline - m_now()) };
    return (left > Duration::zero()) ? left : Duration::zero();
}

void Session::rebind(Cipher&& cipher) noexcept
{
    m_cipher = std::move(cipher);
    touch();
}

} // namespace notevault::core
