#pragma once

#include "domain/TransactionRecord.hpp"
#include "domain/TransactionFilter.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Интерфейс журнала транзакций (только добавление)
 */
class ITransactionRepository {
public:
    virtual ~ITransactionRepository() = default;

    /**
     * @brief Добавить запись
     * @return Присвоенный id
     */
    virtual int64_t append(const domain::TransactionRecord& record) = 0;

    /**
     * @brief Последние записи, новые первыми
     */
    virtual std::vector<domain::TransactionRecord> findRecent(size_t limit) = 0;

    /**
     * @brief Записи, затрагивающие счёт (с любой стороны), новые первыми
     */
    virtual std::vector<domain::TransactionRecord> findByAccount(
        const std::string& accountId,
        size_t limit
    ) = 0;

    virtual std::optional<domain::TransactionRecord> findById(int64_t id) = 0;

    /**
     * @brief Все записи по фильтру (filter.account - id счёта), старые первыми
     */
    virtual std::vector<domain::TransactionRecord> findMatching(const domain::TransactionFilter& filter) = 0;
};

} // namespace ledger::ports::output
