#pragma once

#include "domain/TransactionRequest.hpp"
#include "domain/TransactionResult.hpp"
#include "domain/TransactionFilter.hpp"
#include "domain/ImportReport.hpp"
#include "domain/Result.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Запись транзакций (Input Port)
 *
 * Каждая транзакция применяется атомарно: либо все ноги и запись журнала,
 * либо ничего.
 */
class ITransactionRecorder {
public:
    virtual ~ITransactionRecorder() = default;

    virtual domain::Result<domain::TransactionResult> record(
        const domain::TransactionRequest& request
    ) = 0;

    /**
     * @brief Пробный прогон: те же проверки и расчёт, что у record, без commit
     *
     * Идентификаторы в результате равны 0.
     */
    virtual domain::Result<domain::TransactionResult> preview(
        const domain::TransactionRequest& request
    ) = 0;

    /**
     * @brief Записать строки импорта, каждую в своей транзакции
     *
     * Ошибка строки попадает в отчёт и не останавливает остальные.
     */
    virtual domain::Result<domain::ImportReport> importRows(
        const std::vector<domain::ImportRow>& rows
    ) = 0;

    /**
     * @brief Записи журнала по фильтру, старые первыми
     */
    virtual domain::Result<std::vector<domain::TransactionRecord>> exportRecords(
        const domain::TransactionFilter& filter
    ) = 0;

    /**
     * @brief Последние транзакции, новые первыми
     */
    virtual domain::Result<std::vector<domain::TransactionRecord>> list(size_t limit) = 0;

    virtual domain::Result<std::vector<domain::TransactionRecord>> listByAccount(
        const std::string& account,
        size_t limit
    ) = 0;

    virtual domain::Result<domain::TransactionRecord> get(int64_t id) = 0;
};

} // namespace ledger::ports::input
