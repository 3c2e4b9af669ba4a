#pragma once

#include "domain/Currency.hpp"
#include "domain/ExchangeRate.hpp"
#include "domain/Holding.hpp"
#include "domain/HoldingSnapshot.hpp"
#include "domain/TransactionRecord.hpp"
#include "domain/TransactionResult.hpp"
#include "domain/Valuation.hpp"
#include "domain/Account.hpp"
#include "domain/LedgerError.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace ledger::adapters::primary {

/**
 * @brief Преобразование доменных объектов в JSON вывода CLI
 *
 * Десятичные значения выводятся строками, чтобы не терять точность.
 */
namespace mapper {

inline nlohmann::json decimal(const std::optional<domain::Decimal>& value) {
    return value ? nlohmann::json(value->toString()) : nlohmann::json(nullptr);
}

inline nlohmann::json text(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

inline nlohmann::json toJson(const domain::LedgerError& error) {
    nlohmann::json j;
    j["error"] = domain::toString(error.code);
    j["message"] = error.message;
    return j;
}

inline nlohmann::json toJson(const domain::Currency& currency) {
    nlohmann::json j;
    j["code"] = currency.code;
    j["name"] = currency.displayName;
    j["symbol"] = currency.symbol;
    j["decimals"] = currency.decimalPrecision;
    j["asset_class"] = domain::toString(currency.assetClass);
    j["enabled"] = currency.enabled;
    return j;
}

inline nlohmann::json toJson(const domain::ExchangeRate& rate) {
    nlohmann::json j;
    j["id"] = rate.id;
    j["from"] = rate.fromCurrency;
    j["to"] = rate.toCurrency;
    j["rate"] = rate.rate.toString();
    j["timestamp"] = rate.timestamp.toString();
    j["source"] = rate.source;
    j["notes"] = rate.notes;
    return j;
}

inline nlohmann::json toJson(const domain::Holding& holding) {
    nlohmann::json j;
    j["account_id"] = holding.accountId;
    j["asset"] = holding.asset;
    j["quantity"] = holding.quantity.toString();
    j["avg_cost_basis"] = holding.avgCostBasis.toString();
    j["cost_basis_currency"] = holding.costBasisCurrency;
    j["updated_at"] = holding.updatedAt.toString();
    return j;
}

inline nlohmann::json toJson(const domain::HoldingSnapshot& snapshot) {
    nlohmann::json j = toJson(snapshot.holding);
    j["previous_quantity"] = snapshot.previousQuantity.toString();
    j["previous_avg_cost"] = snapshot.previousAvgCost.toString();
    if (snapshot.realizedPnl) {
        j["realized_pnl"] = snapshot.realizedPnl->toString();
    }
    return j;
}

inline nlohmann::json toJson(const domain::TransactionRecord& record) {
    nlohmann::json j;
    j["id"] = record.id;
    j["type"] = domain::toString(record.type);
    j["from_account_id"] = text(record.fromAccountId);
    j["from_asset"] = text(record.fromAsset);
    j["from_quantity"] = decimal(record.fromQuantity);
    j["to_account_id"] = text(record.toAccountId);
    j["to_asset"] = text(record.toAsset);
    j["to_quantity"] = decimal(record.toQuantity);
    j["unit_price"] = decimal(record.unitPrice);
    j["price_currency"] = text(record.priceCurrency);
    j["fee"] = decimal(record.fee);
    j["fee_asset"] = text(record.feeAsset);
    j["exchange_rate"] = decimal(record.exchangeRate);
    j["timestamp"] = record.timestamp.toString();
    j["notes"] = record.notes;
    return j;
}

inline nlohmann::json toJson(const domain::TransactionResult& result) {
    nlohmann::json j;
    j["transaction"] = toJson(result.record);

    nlohmann::json legs = nlohmann::json::array();
    for (const auto& leg : result.legs) {
        legs.push_back(toJson(leg));
    }
    j["holdings"] = legs;

    j["realized_pnl"] = decimal(result.realizedPnl);
    if (result.capturedRate) {
        j["captured_rate"] = toJson(*result.capturedRate);
    }
    return j;
}

inline nlohmann::json toJson(const domain::HoldingValuation& valuation) {
    nlohmann::json j;
    j["asset"] = valuation.holding.asset;
    j["quantity"] = valuation.holding.quantity.toString();
    j["avg_cost_basis"] = valuation.holding.avgCostBasis.toString();
    j["cost_basis_currency"] = valuation.holding.costBasisCurrency;
    j["price"] = decimal(valuation.price);
    j["value"] = decimal(valuation.value);
    j["cost"] = decimal(valuation.cost);
    j["unrealized_pnl"] = decimal(valuation.unrealizedPnl);
    std::optional<domain::Decimal> pnlPercent;
    if (valuation.pnlPercent) {
        pnlPercent = valuation.pnlPercent->round(2);
    }
    j["pnl_percent"] = decimal(pnlPercent);
    return j;
}

inline nlohmann::json toJson(const domain::AccountValuation& account) {
    nlohmann::json j;
    j["account_id"] = account.accountId;
    j["account"] = account.accountName;
    j["total_value"] = account.totalValue.toString();
    j["total_cost"] = account.totalCost.toString();
    j["unrealized_pnl"] = account.unrealizedPnl.toString();

    nlohmann::json holdings = nlohmann::json::array();
    for (const auto& holding : account.holdings) {
        holdings.push_back(toJson(holding));
    }
    j["holdings"] = holdings;
    return j;
}

inline nlohmann::json toJson(const domain::PortfolioValuation& portfolio) {
    nlohmann::json j;
    j["currency"] = portfolio.valuationCurrency;
    j["total_value"] = portfolio.totalValue.toString();
    j["total_cost"] = portfolio.totalCost.toString();
    j["unrealized_pnl"] = portfolio.unrealizedPnl.toString();
    j["pnl_percent"] = portfolio.pnlPercent.round(2).toString();

    nlohmann::json categories = nlohmann::json::array();
    for (const auto& category : portfolio.categories) {
        nlohmann::json c;
        c["category"] = category.category;
        c["total_value"] = category.totalValue.toString();
        c["total_cost"] = category.totalCost.toString();
        c["unrealized_pnl"] = category.unrealizedPnl.toString();

        nlohmann::json accounts = nlohmann::json::array();
        for (const auto& account : category.accounts) {
            accounts.push_back(toJson(account));
        }
        c["accounts"] = accounts;
        categories.push_back(c);
    }
    j["categories"] = categories;

    nlohmann::json assets = nlohmann::json::array();
    for (const auto& asset : portfolio.assets) {
        nlohmann::json a;
        a["asset"] = asset.asset;
        a["quantity"] = asset.quantity.toString();
        a["value"] = decimal(asset.value);
        assets.push_back(a);
    }
    j["assets"] = assets;
    return j;
}

} // namespace mapper

} // namespace ledger::adapters::primary
