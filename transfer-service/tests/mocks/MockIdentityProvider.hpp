#pragma once

#include "ports/output/IIdentityProvider.hpp"
#include <map>
#include <string>

namespace transfer::tests::mocks {

/**
 * @brief Mock реализация IIdentityProvider для тестов
 */
class MockIdentityProvider : public ports::output::IIdentityProvider {
public:
    // Настройка ответов
    void addToken(const std::string& token, const std::string& userId, domain::Role role) {
        principals_[token] = domain::Principal{userId, role};
    }

    void clearTokens() {
        principals_.clear();
    }

    // Счётчики вызовов
    int resolveCallCount() const { return resolveCallCount_; }

    std::optional<domain::Principal> resolve(const std::string& token) override {
        ++resolveCallCount_;

        auto it = principals_.find(token);
        if (it == principals_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::string, domain::Principal> principals_;  // token -> principal
    int resolveCallCount_ = 0;
};

} // namespace transfer::tests::mocks
