#pragma once

#include "ports/input/ICurrencyCatalog.hpp"
#include "ports/input/IExchangeRateStore.hpp"
#include "ports/input/IHoldingsLedger.hpp"
#include "ports/input/ITransactionRecorder.hpp"
#include "ports/input/IPortfolioAggregator.hpp"
#include "ports/output/IAccountRegistry.hpp"
#include "ports/output/IPriceFeed.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ledger::adapters::primary {

/**
 * @brief Разобранная командная строка: позиционные аргументы и --опции
 */
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    static CommandArgs parse(const std::vector<std::string>& tokens);

    bool has(const std::string& name) const { return options.count(name) > 0; }
    std::optional<std::string> option(const std::string& name) const;
};

/**
 * @brief Обработчик команд ledger-cli
 *
 * Команды:
 * - currency list [--class C] [--all] | add CODE NAME SYMBOL DECIMALS CLASS | enable CODE | disable CODE
 * - rate set FROM TO RATE [--at T] [--source S] [--notes N] | latest FROM TO | asof FROM TO T
 *   | history FROM TO [--limit N] | convert AMOUNT FROM TO [--at T]
 * - tx buy|sell ACCOUNT ASSET QTY PRICE [--currency C]
 *   | transfer FROM TO ASSET QTY [--fee F] [--fee-asset A]
 *   | swap FROM_ACCOUNT FROM_ASSET FROM_QTY TO_ACCOUNT TO_ASSET TO_QTY [--rate R]
 *   | list [--account A] [--limit N]
 *   | export FILE [--format csv|json] [--account A] [--asset X] [--from T] [--to T]
 *   (общие опции записи: --at T, --notes N, --dry-run)
 * - import FILE --account A
 * - holdings [ACCOUNT]
 * - portfolio [ACCOUNT]
 *
 * Вывод - JSON. Код возврата: 0 - успех, 1 - ошибка операции, 2 - неверные аргументы.
 * Флаги без значения (--all, --dry-run) ставятся после позиционных аргументов.
 * FILE "-" в tx export означает вывод самих данных в out.
 */
class LedgerCommandHandler {
public:
    LedgerCommandHandler(
        std::shared_ptr<ports::input::ICurrencyCatalog> catalog,
        std::shared_ptr<ports::input::IExchangeRateStore> rates,
        std::shared_ptr<ports::input::IHoldingsLedger> holdings,
        std::shared_ptr<ports::input::ITransactionRecorder> recorder,
        std::shared_ptr<ports::input::IPortfolioAggregator> portfolio,
        std::shared_ptr<ports::output::IAccountRegistry> accounts,
        std::shared_ptr<ports::output::IPriceFeed> prices
    );

    int handle(const std::vector<std::string>& tokens, std::ostream& out);

private:
    std::shared_ptr<ports::input::ICurrencyCatalog> catalog_;
    std::shared_ptr<ports::input::IExchangeRateStore> rates_;
    std::shared_ptr<ports::input::IHoldingsLedger> holdings_;
    std::shared_ptr<ports::input::ITransactionRecorder> recorder_;
    std::shared_ptr<ports::input::IPortfolioAggregator> portfolio_;
    std::shared_ptr<ports::output::IAccountRegistry> accounts_;
    std::shared_ptr<ports::output::IPriceFeed> prices_;

    int handleCurrency(const CommandArgs& args, std::ostream& out);
    int handleRate(const CommandArgs& args, std::ostream& out);
    int handleTx(const CommandArgs& args, std::ostream& out);
    int handleExport(const CommandArgs& args, std::ostream& out);
    int handleImport(const CommandArgs& args, std::ostream& out);
    int handleHoldings(const CommandArgs& args, std::ostream& out);
    int handlePortfolio(const CommandArgs& args, std::ostream& out);

    /**
     * @brief Ошибка для неизвестного счёта со списком допустимых имён
     */
    std::optional<nlohmann::json> unknownAccount(const std::string& nameOrId);
};

} // namespace ledger::adapters::primary
