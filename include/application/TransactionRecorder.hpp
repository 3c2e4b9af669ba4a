#pragma once

#include "ports/input/ITransactionRecorder.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IAccountRegistry.hpp"
#include "settings/ILedgerSettings.hpp"
#include "application/HoldingsLedger.hpp"
#include "application/ExchangeRateStore.hpp"
#include "application/RateConverter.hpp"
#include <memory>

namespace ledger::application {

/**
 * @brief Сервис записи транзакций Buy / Sell / Transfer / Swap
 *
 * Координирует работу между:
 * - HoldingsLedger (изменение позиций)
 * - ExchangeRateStore (курс из фиат-фиат обмена)
 * - ITransactionRepository (журнал)
 *
 * Вся транзакция выполняется в одной сессии SERIALIZABLE: сначала все
 * проверки, затем изменения позиций, запись журнала и курса, commit.
 * Любая ошибка до commit откатывает сессию. Ошибка сериализации
 * возвращается как CONFLICT и не повторяется.
 */
class TransactionRecorder : public ports::input::ITransactionRecorder {
public:
    TransactionRecorder(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IAccountRegistry> registry,
        std::shared_ptr<settings::ILedgerSettings> settings,
        std::shared_ptr<HoldingsLedger> holdings,
        std::shared_ptr<ExchangeRateStore> rates,
        std::shared_ptr<RateConverter> converter
    );

    domain::Result<domain::TransactionResult> record(const domain::TransactionRequest& request) override;

    domain::Result<domain::TransactionResult> preview(const domain::TransactionRequest& request) override;

    domain::Result<domain::ImportReport> importRows(const std::vector<domain::ImportRow>& rows) override;

    domain::Result<std::vector<domain::TransactionRecord>> exportRecords(
        const domain::TransactionFilter& filter
    ) override;

    domain::Result<std::vector<domain::TransactionRecord>> list(size_t limit) override;

    domain::Result<std::vector<domain::TransactionRecord>> listByAccount(
        const std::string& account,
        size_t limit
    ) override;

    domain::Result<domain::TransactionRecord> get(int64_t id) override;

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IAccountRegistry> registry_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    std::shared_ptr<HoldingsLedger> holdings_;
    std::shared_ptr<ExchangeRateStore> rates_;
    std::shared_ptr<RateConverter> converter_;

    /**
     * @brief Контекст одной записи: сессия и общие поля запроса
     */
    struct Context {
        ports::output::ILedgerSession& session;
        const domain::TransactionRequest& request;
        domain::Timestamp timestamp;
    };

    /**
     * @brief Выполнить запрос в сессии SERIALIZABLE; без commit сессия откатывается
     */
    domain::TransactionResult execute(const domain::TransactionRequest& request, bool commit);

    domain::TransactionResult handle(Context& ctx, const domain::BuyRequest& buy);
    domain::TransactionResult handle(Context& ctx, const domain::SellRequest& sell);
    domain::TransactionResult handle(Context& ctx, const domain::TransferRequest& transfer);
    domain::TransactionResult handle(Context& ctx, const domain::SwapRequest& swap);

    /**
     * @brief Валюта цены: явная, иначе валюта себестоимости позиции, иначе базовая
     */
    std::string resolvePriceCurrency(
        Context& ctx,
        const std::optional<std::string>& requested,
        const std::optional<domain::Holding>& holding
    );

    /**
     * @brief Привести цену к валюте себестоимости непустой позиции
     *
     * @return Цена и валюта, в которых её нужно применить
     */
    std::pair<domain::Decimal, std::string> priceInCostCurrency(
        Context& ctx,
        const domain::Decimal& price,
        const std::string& currency,
        const std::optional<domain::Holding>& holding
    );

    domain::TransactionRecord append(Context& ctx, domain::TransactionRecord record);
};

} // namespace ledger::application
