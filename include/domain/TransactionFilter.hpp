#pragma once

#include "TransactionRecord.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Отбор записей журнала для выгрузки
 *
 * Пустое поле не ограничивает выборку. Границы по времени включительные,
 * дата без времени означает полночь UTC.
 */
struct TransactionFilter {
    std::optional<std::string> account;  ///< На входном порту имя или id, в репозитории только id
    std::optional<std::string> asset;    ///< Актив с любой стороны записи
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;

    bool matches(const TransactionRecord& record) const {
        if (account && record.fromAccountId != account && record.toAccountId != account) {
            return false;
        }
        if (asset && record.fromAsset != asset && record.toAsset != asset) {
            return false;
        }
        if (from && record.timestamp < *from) {
            return false;
        }
        if (to && record.timestamp > *to) {
            return false;
        }
        return true;
    }
};

} // namespace ledger::domain
