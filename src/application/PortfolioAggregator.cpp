#include "application/PortfolioAggregator.hpp"
#include "application/ServiceGuard.hpp"
#include "application/LedgerChecks.hpp"
#include <algorithm>
#include <map>

namespace ledger::application {

using domain::Decimal;
using ports::output::SessionMode;

namespace {

const Decimal HUNDRED = Decimal::fromInt(100);

Decimal percentOf(const Decimal& pnl, const Decimal& cost) {
    return cost.isZero() ? Decimal::zero() : pnl * HUNDRED / cost;
}

} // namespace

PortfolioAggregator::PortfolioAggregator(
    std::shared_ptr<ports::output::ILedgerStore> store,
    std::shared_ptr<ports::output::IAccountRegistry> registry,
    std::shared_ptr<settings::ILedgerSettings> settings,
    std::shared_ptr<RateConverter> converter
) : store_(std::move(store))
  , registry_(std::move(registry))
  , settings_(std::move(settings))
  , converter_(std::move(converter))
{}

domain::Result<domain::PortfolioValuation> PortfolioAggregator::valuate(
    const PriceLookup& prices,
    const std::optional<std::string>& account
) {
    return guarded("PortfolioAggregator", [&] {
        std::optional<std::string> accountId;
        if (account) {
            accountId = requireAccount(*registry_, *account).id;
        }

        std::map<std::string, domain::Account> accounts;
        for (auto& known : registry_->findAll()) {
            accounts[known.id] = known;
        }

        domain::PortfolioValuation portfolio;
        portfolio.valuationCurrency = settings_->getBaseCurrency();

        auto session = store_->openSession(SessionMode::READ_ONLY);
        auto holdings = accountId ? session->holdings().findByAccount(*accountId)
                                  : session->holdings().findAll();

        std::map<std::string, domain::AccountValuation> byAccount;
        std::map<std::string, domain::AssetTotal> byAsset;
        std::map<std::string, Decimal> costRates;

        for (const auto& holding : holdings) {
            if (!holding.quantity.isPositive()) {
                continue;
            }

            domain::HoldingValuation valuation;
            valuation.holding = holding;

            auto known = accounts.find(holding.accountId);
            valuation.accountName = known != accounts.end() ? known->second.name : holding.accountId;
            valuation.category = known != accounts.end() ? known->second.category : "Uncategorized";

            // Себестоимость в валюте оценки
            std::optional<Decimal> costRate;
            auto cached = costRates.find(holding.costBasisCurrency);
            if (cached != costRates.end()) {
                costRate = cached->second;
            } else {
                costRate = converter_->latestRate(session->exchangeRates(),
                                                  holding.costBasisCurrency, portfolio.valuationCurrency);
                if (costRate) {
                    costRates[holding.costBasisCurrency] = *costRate;
                }
            }
            if (costRate) {
                valuation.cost = holding.totalCost() * *costRate;
            }

            if (prices) {
                valuation.price = prices(holding.asset);
            }
            if (valuation.price) {
                valuation.value = holding.quantity * *valuation.price;
                if (valuation.cost) {
                    valuation.unrealizedPnl = *valuation.value - *valuation.cost;
                    valuation.pnlPercent = percentOf(*valuation.unrealizedPnl, *valuation.cost);
                }
            }

            auto& accountValuation = byAccount[holding.accountId];
            accountValuation.accountId = holding.accountId;
            accountValuation.accountName = valuation.accountName;
            accountValuation.category = valuation.category;
            if (valuation.value) accountValuation.totalValue += *valuation.value;
            if (valuation.cost) accountValuation.totalCost += *valuation.cost;

            auto& assetTotal = byAsset[holding.asset];
            bool firstForAsset = assetTotal.asset.empty();
            assetTotal.asset = holding.asset;
            assetTotal.quantity += holding.quantity;
            if (valuation.value && (firstForAsset || assetTotal.value)) {
                assetTotal.value = assetTotal.value.value_or(Decimal::zero()) + *valuation.value;
            } else {
                assetTotal.value.reset();
            }

            accountValuation.holdings.push_back(std::move(valuation));
        }

        // P&L агрегатов считается от их итогов: позиция без цены входит только в себестоимость
        std::map<std::string, domain::CategoryValuation> byCategory;
        for (auto& [id, accountValuation] : byAccount) {
            accountValuation.unrealizedPnl = accountValuation.totalValue - accountValuation.totalCost;
            auto& category = byCategory[accountValuation.category];
            category.category = accountValuation.category;
            category.totalValue += accountValuation.totalValue;
            category.totalCost += accountValuation.totalCost;
            category.accounts.push_back(std::move(accountValuation));
        }

        for (auto& [name, category] : byCategory) {
            category.unrealizedPnl = category.totalValue - category.totalCost;
            std::sort(category.accounts.begin(), category.accounts.end(),
                [](const domain::AccountValuation& a, const domain::AccountValuation& b) {
                    if (a.totalValue != b.totalValue) {
                        return a.totalValue > b.totalValue;
                    }
                    return a.accountName < b.accountName;
                });

            portfolio.totalValue += category.totalValue;
            portfolio.totalCost += category.totalCost;
            portfolio.categories.push_back(std::move(category));
        }

        std::sort(portfolio.categories.begin(), portfolio.categories.end(),
            [](const domain::CategoryValuation& a, const domain::CategoryValuation& b) {
                if (a.totalValue != b.totalValue) {
                    return a.totalValue > b.totalValue;
                }
                return a.category < b.category;
            });

        for (auto& [asset, total] : byAsset) {
            portfolio.assets.push_back(std::move(total));
        }

        portfolio.unrealizedPnl = portfolio.totalValue - portfolio.totalCost;
        portfolio.pnlPercent = percentOf(portfolio.unrealizedPnl, portfolio.totalCost);
        return portfolio;
    });
}

} // namespace ledger::application
