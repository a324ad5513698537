#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace lanwatch::monitor
{
    // Non-blocking per-target exclusion. A second acquire of a held key fails instead of waiting.
    class TargetLock
    {
    public:
        class Token
        {
        public:
            Token(Token &&other) noexcept;
            Token &operator=(Token &&other) noexcept;
            Token(const Token &) = delete;
            Token &operator=(const Token &) = delete;
            ~Token();

            const std::string &Key() const { return m_key; }

        private:
            friend class TargetLock;
            Token(TargetLock *owner, std::string key);
            void Release();

            TargetLock *m_owner;
            std::string m_key;
        };

        std::optional<Token> TryAcquire(const std::string &key);
        bool IsHeld(const std::string &key) const;

    private:
        void Release(const std::string &key);

        mutable std::mutex m_mutex;
        std::set<std::string> m_held;
    };
}
