#pragma once

#include "ports/output/IAccountRegistry.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <cctype>
#include <memory>

namespace ledger::adapters::secondary::memory {

/**
 * @brief In-memory реестр счетов
 *
 * Поиск по id, затем по имени без учёта регистра.
 */
class InMemoryAccountRegistry : public ports::output::IAccountRegistry {
public:
    /**
     * @return false если счёт с таким id или именем уже есть
     */
    bool add(const domain::Account& account) {
        if (findByName(account.name)) {
            return false;
        }
        return accounts_.insertIfAbsent(account.id, std::make_shared<domain::Account>(account));
    }

    bool remove(const std::string& id) {
        return accounts_.erase(id);
    }

    std::optional<domain::Account> resolve(const std::string& nameOrId) override {
        if (auto byId = accounts_.find(nameOrId)) {
            return *byId;
        }
        if (auto byName = findByName(nameOrId)) {
            return *byName;
        }
        return std::nullopt;
    }

    std::vector<domain::Account> findAll() override {
        std::vector<domain::Account> result;
        for (const auto& account : accounts_.values()) {
            result.push_back(*account);
        }
        std::sort(result.begin(), result.end(),
            [](const domain::Account& a, const domain::Account& b) { return a.name < b.name; });
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::Account> accounts_;

    std::shared_ptr<domain::Account> findByName(const std::string& name) const {
        auto lower = toLower(name);
        return accounts_.findIf([&lower](const domain::Account& account) {
            return toLower(account.name) == lower;
        });
    }

    static std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }
};

} // namespace ledger::adapters::secondary::memory
