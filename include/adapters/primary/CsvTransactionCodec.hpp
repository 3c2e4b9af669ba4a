#pragma once

#include "domain/ImportReport.hpp"
#include "domain/TransactionRecord.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Разобранный CSV: готовые к записи строки и строки с ошибкой формата
 */
struct CsvImport {
    std::vector<domain::ImportRow> rows;
    std::vector<domain::ImportFailure> failures;
};

/**
 * @brief Чтение транзакций из CSV и выгрузка журнала в CSV
 *
 * Формат импорта (первая строка - заголовок, порядок колонок любой):
 *
 *   date,type,asset,quantity,price,price_currency,fee,fee_asset,
 *   to_account,to_asset,to_quantity,rate,notes
 *
 * Обязательны date, type, asset, quantity. Колонка price_usd
 * принимается как price с валютой USD. Счёт берётся из аргумента,
 * to_account нужен только для transfer (для swap по умолчанию тот же счёт).
 *
 * Поля в кавычках поддерживаются ("" внутри кавычек - сама кавычка),
 * перевод строки внутри поля - нет.
 */
class CsvTransactionCodec {
public:
    /**
     * @throws domain::LedgerException(INVALID_INPUT) если нет заголовка
     *         или обязательной колонки
     */
    static CsvImport read(std::istream& in, const std::string& account);

    /**
     * @brief Выгрузить записи журнала (счета - по id)
     */
    static void write(std::ostream& out, const std::vector<domain::TransactionRecord>& records);

    /**
     * @throws std::invalid_argument при незакрытой кавычке
     */
    static std::vector<std::string> splitLine(const std::string& line);

    static std::string escape(const std::string& field);
};

} // namespace ledger::adapters::primary
