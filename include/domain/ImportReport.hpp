#pragma once

#include "TransactionRequest.hpp"
#include "LedgerError.hpp"
#include <cstdint>
#include <vector>

namespace ledger::domain {

/**
 * @brief Строка импорта: запрос и номер строки исходного файла
 */
struct ImportRow {
    size_t line = 0;
    TransactionRequest request;
};

struct ImportFailure {
    size_t line = 0;
    LedgerError error;
};

/**
 * @brief Итог импорта: каждая строка записывается отдельной транзакцией
 */
struct ImportReport {
    std::vector<int64_t> transactionIds;  ///< В порядке строк файла
    std::vector<ImportFailure> failures;  ///< По возрастанию номера строки

    size_t imported() const { return transactionIds.size(); }
};

} // namespace ledger::domain
