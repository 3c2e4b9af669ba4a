#pragma once

#include "ports/input/IHoldingsLedger.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IAccountRegistry.hpp"
#include "settings/ILedgerSettings.hpp"
#include <memory>
#include <optional>
#include <string>

namespace ledger::application {

/**
 * @brief Сервис позиций со средневзвешенной себестоимостью
 *
 * Увеличение с ценой p:  c1 = (q0*c0 + d*p) / (q0 + d)
 * Увеличение без цены:   c1 = c0
 * Уменьшение:            c1 = c0, q1 = q0 + d >= 0
 *
 * Строки с нулевым количеством не удаляются.
 */
class HoldingsLedger : public ports::input::IHoldingsLedger {
public:
    HoldingsLedger(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IAccountRegistry> registry,
        std::shared_ptr<settings::ILedgerSettings> settings
    );

    domain::Result<domain::HoldingSnapshot> apply(
        const std::string& account,
        const std::string& asset,
        const domain::Decimal& quantityDelta,
        const std::optional<domain::Decimal>& unitPrice,
        const std::optional<std::string>& priceCurrency
    ) override;

    domain::Result<domain::Holding> get(const std::string& account, const std::string& asset) override;

    domain::Result<std::vector<domain::Holding>> list(const std::optional<std::string>& account) override;

    domain::Result<domain::Unit> remove(const std::string& account, const std::string& asset) override;

    domain::Result<size_t> removeAccount(const std::string& account) override;

    /**
     * @brief Применить изменение внутри открытой сессии
     *
     * Счёт и актив уже проверены вызывающим кодом.
     * priceCurrency должна совпадать с валютой себестоимости непустой позиции.
     *
     * @throws domain::LedgerException (INVALID_INPUT, INSUFFICIENT_HOLDINGS)
     */
    domain::HoldingSnapshot applyIn(
        ports::output::ILedgerSession& session,
        const std::string& accountId,
        const std::string& asset,
        const domain::Decimal& quantityDelta,
        const std::optional<domain::Decimal>& unitPrice,
        const std::optional<std::string>& priceCurrency
    );

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IAccountRegistry> registry_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
};

} // namespace ledger::application
