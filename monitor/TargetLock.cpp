#include "TargetLock.hpp"

#include <utility>

namespace lanwatch::monitor
{
    TargetLock::Token::Token(TargetLock *owner, std::string key)
        : m_owner(owner), m_key(std::move(key))
    {
    }

    TargetLock::Token::Token(Token &&other) noexcept
        : m_owner(other.m_owner), m_key(std::move(other.m_key))
    {
        other.m_owner = nullptr;
    }

    TargetLock::Token &TargetLock::Token::operator=(Token &&other) noexcept
    {
        if (this != &other)
        {
            Release();
            m_owner = other.m_owner;
            m_key = std::move(other.m_key);
            other.m_owner = nullptr;
        }
        return *this;
    }

    TargetLock::Token::~Token()
    {
        Release();
    }

    void TargetLock::Token::Release()
    {
        if (m_owner)
        {
            m_owner->Release(m_key);
            m_owner = nullptr;
        }
    }

    std::optional<TargetLock::Token> TargetLock::TryAcquire(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_held.insert(key).second)
            return std::nullopt;
        return Token(this, key);
    }

    bool TargetLock::IsHeld(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_held.count(key) > 0;
    }

    void TargetLock::Release(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_held.erase(key);
    }
}
