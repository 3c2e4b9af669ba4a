#pragma once

#include "LedgerTables.hpp"
#include "ports/output/ICurrencyRepository.hpp"
#include "ports/output/IExchangeRateRepository.hpp"
#include "ports/output/IHoldingRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>

namespace ledger::adapters::secondary::memory {

/**
 * @brief Базовый класс: доступ к таблицам сессии
 */
class TablesAccess {
protected:
    TablesAccess(LedgerTables& tables, bool readOnly)
        : tables_(tables)
        , readOnly_(readOnly)
    {}

    void requireWritable(const char* operation) const {
        if (readOnly_) {
            throw std::logic_error(std::string("Read-only session: ") + operation);
        }
    }

    LedgerTables& tables_;
    bool readOnly_;
};

class InMemoryCurrencyRepository : public ports::output::ICurrencyRepository, private TablesAccess {
public:
    InMemoryCurrencyRepository(LedgerTables& tables, bool readOnly) : TablesAccess(tables, readOnly) {}

    bool insert(const domain::Currency& currency) override {
        requireWritable("insert currency");
        return tables_.currencies.emplace(currency.code, currency).second;
    }

    std::optional<domain::Currency> findByCode(const std::string& code) override {
        auto it = tables_.currencies.find(code);
        return it != tables_.currencies.end() ? std::optional(it->second) : std::nullopt;
    }

    std::vector<domain::Currency> findAll() override {
        std::vector<domain::Currency> result;
        for (const auto& [code, currency] : tables_.currencies) {
            result.push_back(currency);
        }
        return result;
    }

    bool setEnabled(const std::string& code, bool enabled) override {
        requireWritable("set currency enabled");
        auto it = tables_.currencies.find(code);
        if (it == tables_.currencies.end()) {
            return false;
        }
        it->second.enabled = enabled;
        return true;
    }
};

class InMemoryExchangeRateRepository : public ports::output::IExchangeRateRepository, private TablesAccess {
public:
    InMemoryExchangeRateRepository(LedgerTables& tables, bool readOnly) : TablesAccess(tables, readOnly) {}

    int64_t upsert(const domain::ExchangeRate& rate) override {
        requireWritable("upsert exchange rate");
        LedgerTables::RateKey key{rate.fromCurrency, rate.toCurrency, rate.timestamp.toUnixMicros()};

        auto it = tables_.rates.find(key);
        if (it != tables_.rates.end()) {
            it->second.rate = rate.rate;
            it->second.source = rate.source;
            it->second.notes = rate.notes;
            return it->second.id;
        }

        domain::ExchangeRate stored = rate;
        stored.id = tables_.nextRateId++;
        tables_.rates.emplace(key, stored);
        return stored.id;
    }

    std::optional<domain::ExchangeRate> findLatest(const std::string& from, const std::string& to) override {
        return lastAtOrBefore(from, to, std::numeric_limits<int64_t>::max());
    }

    std::optional<domain::ExchangeRate> findAsOf(
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) override {
        return lastAtOrBefore(from, to, at.toUnixMicros());
    }

    std::vector<domain::ExchangeRate> findPage(
        const std::string& from,
        const std::string& to,
        const std::optional<domain::Timestamp>& before,
        size_t limit
    ) override {
        std::vector<domain::ExchangeRate> page;
        // Ключи пары упорядочены по timestamp, идём от конца
        auto lower = tables_.rates.lower_bound({from, to, std::numeric_limits<int64_t>::min()});
        auto upper = before
            ? tables_.rates.lower_bound({from, to, before->toUnixMicros()})
            : tables_.rates.upper_bound({from, to, std::numeric_limits<int64_t>::max()});

        for (auto it = upper; it != lower && page.size() < limit;) {
            --it;
            page.push_back(it->second);
        }
        return page;
    }

private:
    std::optional<domain::ExchangeRate> lastAtOrBefore(
        const std::string& from,
        const std::string& to,
        int64_t micros
    ) const {
        auto it = tables_.rates.upper_bound(LedgerTables::RateKey{from, to, micros});
        if (it == tables_.rates.begin()) {
            return std::nullopt;
        }
        --it;
        if (std::get<0>(it->first) != from || std::get<1>(it->first) != to) {
            return std::nullopt;
        }
        return it->second;
    }
};

class InMemoryHoldingRepository : public ports::output::IHoldingRepository, private TablesAccess {
public:
    InMemoryHoldingRepository(LedgerTables& tables, bool readOnly) : TablesAccess(tables, readOnly) {}

    std::optional<domain::Holding> find(const std::string& accountId, const std::string& asset) override {
        auto it = tables_.holdings.find({accountId, asset});
        return it != tables_.holdings.end() ? std::optional(it->second) : std::nullopt;
    }

    // Пишущая сессия уже владеет эксклюзивной блокировкой хранилища
    std::optional<domain::Holding> findForUpdate(const std::string& accountId, const std::string& asset) override {
        return find(accountId, asset);
    }

    std::vector<domain::Holding> findByAccount(const std::string& accountId) override {
        std::vector<domain::Holding> result;
        auto it = tables_.holdings.lower_bound({accountId, std::string()});
        for (; it != tables_.holdings.end() && it->first.first == accountId; ++it) {
            result.push_back(it->second);
        }
        return result;
    }

    std::vector<domain::Holding> findAll() override {
        std::vector<domain::Holding> result;
        for (const auto& [key, holding] : tables_.holdings) {
            result.push_back(holding);
        }
        return result;
    }

    void save(const domain::Holding& holding) override {
        requireWritable("save holding");
        tables_.holdings[{holding.accountId, holding.asset}] = holding;
    }

    bool remove(const std::string& accountId, const std::string& asset) override {
        requireWritable("remove holding");
        return tables_.holdings.erase({accountId, asset}) > 0;
    }

    size_t removeAll(const std::string& accountId) override {
        requireWritable("remove account holdings");
        size_t removed = 0;
        auto it = tables_.holdings.lower_bound({accountId, std::string()});
        while (it != tables_.holdings.end() && it->first.first == accountId) {
            it = tables_.holdings.erase(it);
            ++removed;
        }
        return removed;
    }
};

class InMemoryTransactionRepository : public ports::output::ITransactionRepository, private TablesAccess {
public:
    InMemoryTransactionRepository(LedgerTables& tables, bool readOnly) : TablesAccess(tables, readOnly) {}

    int64_t append(const domain::TransactionRecord& record) override {
        requireWritable("append transaction");
        domain::TransactionRecord stored = record;
        stored.id = static_cast<int64_t>(tables_.transactions.size()) + 1;
        tables_.transactions.push_back(stored);
        return stored.id;
    }

    std::vector<domain::TransactionRecord> findRecent(size_t limit) override {
        return collect(limit, [](const domain::TransactionRecord&) { return true; });
    }

    std::vector<domain::TransactionRecord> findByAccount(const std::string& accountId, size_t limit) override {
        return collect(limit, [&accountId](const domain::TransactionRecord& record) {
            return record.fromAccountId == accountId || record.toAccountId == accountId;
        });
    }

    std::optional<domain::TransactionRecord> findById(int64_t id) override {
        if (id < 1 || id > static_cast<int64_t>(tables_.transactions.size())) {
            return std::nullopt;
        }
        return tables_.transactions[static_cast<size_t>(id - 1)];
    }

    std::vector<domain::TransactionRecord> findMatching(const domain::TransactionFilter& filter) override {
        auto result = collect(tables_.transactions.size(), [&filter](const domain::TransactionRecord& record) {
            return filter.matches(record);
        });
        std::reverse(result.begin(), result.end());
        return result;
    }

private:
    /**
     * @brief Новые первыми: по timestamp, при равенстве по id
     */
    template <typename Predicate>
    std::vector<domain::TransactionRecord> collect(size_t limit, Predicate matches) const {
        std::vector<domain::TransactionRecord> result;
        for (const auto& record : tables_.transactions) {
            if (matches(record)) {
                result.push_back(record);
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::TransactionRecord& a, const domain::TransactionRecord& b) {
                if (a.timestamp != b.timestamp) {
                    return a.timestamp > b.timestamp;
                }
                return a.id > b.id;
            });
        if (result.size() > limit) {
            result.resize(limit);
        }
        return result;
    }
};

} // namespace ledger::adapters::secondary::memory
