#include "application/HoldingsLedger.hpp"
#include "application/ServiceGuard.hpp"
#include "application/LedgerChecks.hpp"
#include <iostream>

namespace ledger::application {

using domain::Decimal;
using domain::ErrorCode;
using domain::LedgerException;
using ports::output::SessionMode;

HoldingsLedger::HoldingsLedger(
    std::shared_ptr<ports::output::ILedgerStore> store,
    std::shared_ptr<ports::output::IAccountRegistry> registry,
    std::shared_ptr<settings::ILedgerSettings> settings
) : store_(std::move(store))
  , registry_(std::move(registry))
  , settings_(std::move(settings))
{}

domain::HoldingSnapshot HoldingsLedger::applyIn(
    ports::output::ILedgerSession& session,
    const std::string& accountId,
    const std::string& asset,
    const Decimal& quantityDelta,
    const std::optional<Decimal>& unitPrice,
    const std::optional<std::string>& priceCurrency
) {
    if (quantityDelta.isZero()) {
        throw LedgerException(ErrorCode::INVALID_INPUT, "Quantity change must be non-zero");
    }
    if (unitPrice && unitPrice->isNegative()) {
        throw LedgerException(ErrorCode::INVALID_INPUT, "Unit price must not be negative");
    }

    auto existing = session.holdings().findForUpdate(accountId, asset);

    domain::Holding holding;
    if (existing) {
        holding = *existing;
    } else {
        holding.accountId = accountId;
        holding.asset = asset;
    }

    const Decimal q0 = holding.quantity;
    const Decimal c0 = holding.avgCostBasis;

    domain::HoldingSnapshot snapshot;
    snapshot.previousQuantity = q0;
    snapshot.previousAvgCost = c0;

    if (quantityDelta.isPositive()) {
        if (unitPrice) {
            std::string currency = priceCurrency.value_or(
                holding.costBasisCurrency.empty() ? settings_->getBaseCurrency() : holding.costBasisCurrency);

            if (q0.isZero()) {
                // Пустая позиция принимает валюту цены
                holding.costBasisCurrency = currency;
                holding.avgCostBasis = *unitPrice;
            } else {
                if (currency != holding.costBasisCurrency) {
                    throw LedgerException(ErrorCode::INVALID_INPUT,
                        "Price currency " + currency + " differs from cost basis currency " +
                        holding.costBasisCurrency + " of " + asset);
                }
                holding.avgCostBasis = (q0 * c0 + quantityDelta * *unitPrice) / (q0 + quantityDelta);
            }
        } else if (holding.costBasisCurrency.empty()) {
            holding.costBasisCurrency = settings_->getBaseCurrency();
        }
        holding.quantity = q0 + quantityDelta;
    } else {
        Decimal q1 = q0 + quantityDelta;
        if (q1.isNegative()) {
            throw LedgerException(ErrorCode::INSUFFICIENT_HOLDINGS,
                "Insufficient " + asset + " in account " + accountId +
                ": have " + q0.toString() + ", need " + quantityDelta.abs().toString());
        }
        if (unitPrice) {
            if (priceCurrency && !holding.costBasisCurrency.empty() && *priceCurrency != holding.costBasisCurrency) {
                throw LedgerException(ErrorCode::INVALID_INPUT,
                    "Price currency " + *priceCurrency + " differs from cost basis currency " +
                    holding.costBasisCurrency + " of " + asset);
            }
            snapshot.realizedPnl = (*unitPrice - c0) * quantityDelta.abs();
        }
        holding.quantity = q1;
    }

    holding.updatedAt = domain::Timestamp::now();
    session.holdings().save(holding);

    snapshot.holding = holding;
    return snapshot;
}

domain::Result<domain::HoldingSnapshot> HoldingsLedger::apply(
    const std::string& account,
    const std::string& asset,
    const Decimal& quantityDelta,
    const std::optional<Decimal>& unitPrice,
    const std::optional<std::string>& priceCurrency
) {
    return guarded("HoldingsLedger", [&] {
        auto resolved = requireAccount(*registry_, account);
        auto session = store_->openSession(SessionMode::SERIALIZABLE);

        auto assetCode = requireCurrency(session->currencies(), asset).code;
        std::optional<std::string> currency;
        if (priceCurrency) {
            currency = requireCurrency(session->currencies(), *priceCurrency).code;
        }

        auto snapshot = applyIn(*session, resolved.id, assetCode, quantityDelta, unitPrice, currency);
        session->commit();

        std::cout << "[HoldingsLedger] " << resolved.name << " " << assetCode << ": "
                  << snapshot.previousQuantity << " -> " << snapshot.holding.quantity
                  << " @ " << snapshot.holding.avgCostBasis << " "
                  << snapshot.holding.costBasisCurrency << std::endl;
        return snapshot;
    });
}

domain::Result<domain::Holding> HoldingsLedger::get(const std::string& account, const std::string& asset) {
    return guarded("HoldingsLedger", [&] {
        auto resolved = requireAccount(*registry_, account);
        auto assetCode = normalizeCode(asset);
        auto session = store_->openSession(SessionMode::READ_ONLY);
        auto holding = session->holdings().find(resolved.id, assetCode);
        if (!holding) {
            throw LedgerException(ErrorCode::NOT_FOUND,
                "No " + assetCode + " holding in account " + resolved.name);
        }
        return *holding;
    });
}

domain::Result<std::vector<domain::Holding>> HoldingsLedger::list(const std::optional<std::string>& account) {
    return guarded("HoldingsLedger", [&] {
        std::optional<std::string> accountId;
        if (account) {
            accountId = requireAccount(*registry_, *account).id;
        }
        auto session = store_->openSession(SessionMode::READ_ONLY);
        return accountId ? session->holdings().findByAccount(*accountId)
                         : session->holdings().findAll();
    });
}

domain::Result<domain::Unit> HoldingsLedger::remove(const std::string& account, const std::string& asset) {
    return guarded("HoldingsLedger", [&] {
        auto resolved = requireAccount(*registry_, account);
        auto assetCode = normalizeCode(asset);
        auto session = store_->openSession(SessionMode::SERIALIZABLE);
        if (!session->holdings().remove(resolved.id, assetCode)) {
            throw LedgerException(ErrorCode::NOT_FOUND,
                "No " + assetCode + " holding in account " + resolved.name);
        }
        session->commit();

        std::cout << "[HoldingsLedger] Removed " << assetCode << " from " << resolved.name << std::endl;
        return domain::Unit{};
    });
}

domain::Result<size_t> HoldingsLedger::removeAccount(const std::string& account) {
    return guarded("HoldingsLedger", [&] {
        // Счёт может быть уже удалён из реестра, тогда account - это его id
        auto resolved = registry_->resolve(account);
        std::string accountId = resolved ? resolved->id : account;

        auto session = store_->openSession(SessionMode::SERIALIZABLE);
        size_t removed = session->holdings().removeAll(accountId);
        session->commit();

        std::cout << "[HoldingsLedger] Removed " << removed << " holdings of account "
                  << accountId << std::endl;
        return removed;
    });
}

} // namespace ledger::application
