#include "application/TransactionRecorder.hpp"
#include "application/ServiceGuard.hpp"
#include "application/LedgerChecks.hpp"
#include <iostream>
#include <variant>

namespace ledger::application {

using domain::Decimal;
using domain::ErrorCode;
using domain::LedgerException;
using domain::TransactionType;
using ports::output::SessionMode;

namespace {

void requirePositive(const Decimal& value, const std::string& what) {
    if (!value.isPositive()) {
        throw LedgerException(ErrorCode::INVALID_INPUT, what + " must be positive");
    }
}

void requireAvailable(const std::optional<domain::Holding>& holding,
                      const domain::Account& account,
                      const std::string& asset,
                      const Decimal& quantity) {
    Decimal available = holding ? holding->quantity : Decimal::zero();
    if (available < quantity) {
        throw LedgerException(ErrorCode::INSUFFICIENT_HOLDINGS,
            "Insufficient " + asset + " in '" + account.name + "': have " +
            available.toString() + ", need " + quantity.toString());
    }
}

} // namespace

TransactionRecorder::TransactionRecorder(
    std::shared_ptr<ports::output::ILedgerStore> store,
    std::shared_ptr<ports::output::IAccountRegistry> registry,
    std::shared_ptr<settings::ILedgerSettings> settings,
    std::shared_ptr<HoldingsLedger> holdings,
    std::shared_ptr<ExchangeRateStore> rates,
    std::shared_ptr<RateConverter> converter
) : store_(std::move(store))
  , registry_(std::move(registry))
  , settings_(std::move(settings))
  , holdings_(std::move(holdings))
  , rates_(std::move(rates))
  , converter_(std::move(converter))
{}

domain::Result<domain::TransactionResult> TransactionRecorder::record(const domain::TransactionRequest& request) {
    return guarded("TransactionRecorder", [&] { return execute(request, true); });
}

domain::Result<domain::TransactionResult> TransactionRecorder::preview(const domain::TransactionRequest& request) {
    return guarded("TransactionRecorder", [&] { return execute(request, false); });
}

domain::TransactionResult TransactionRecorder::execute(const domain::TransactionRequest& request, bool commit) {
    auto session = store_->openSession(SessionMode::SERIALIZABLE);
    Context ctx{*session, request, request.timestamp.value_or(domain::Timestamp::now())};

    auto result = std::visit([&](const auto& kind) { return handle(ctx, kind); }, request.kind);

    if (!commit) {
        // Сессия уничтожается без commit: позиции, журнал и курс откатываются
        result.record.id = 0;
        if (result.capturedRate) {
            result.capturedRate->id = 0;
        }
        std::cout << "[TransactionRecorder] Dry run " << toString(result.record.type)
                  << " validated, nothing recorded" << std::endl;
        return result;
    }

    session->commit();

    std::cout << "[TransactionRecorder] Recorded " << toString(result.record.type)
              << " #" << result.record.id << std::endl;
    return result;
}

// ============================================================================
// IMPORT / EXPORT
// ============================================================================

domain::Result<domain::ImportReport> TransactionRecorder::importRows(const std::vector<domain::ImportRow>& rows) {
    return guarded("TransactionRecorder", [&] {
        domain::ImportReport report;
        for (const auto& row : rows) {
            auto result = record(row.request);
            if (result.isOk()) {
                report.transactionIds.push_back(result.value().record.id);
            } else {
                report.failures.push_back(domain::ImportFailure{row.line, result.error()});
            }
        }
        std::cout << "[TransactionRecorder] Imported " << report.imported() << " of " << rows.size()
                  << " rows" << std::endl;
        return report;
    });
}

domain::Result<std::vector<domain::TransactionRecord>> TransactionRecorder::exportRecords(
    const domain::TransactionFilter& filter
) {
    return guarded("TransactionRecorder", [&] {
        domain::TransactionFilter resolved = filter;
        if (filter.account) {
            resolved.account = requireAccount(*registry_, *filter.account).id;
        }
        if (filter.asset) {
            resolved.asset = normalizeCode(*filter.asset);
        }
        if (filter.from && filter.to && *filter.to < *filter.from) {
            throw LedgerException(ErrorCode::INVALID_INPUT,
                "Export range is empty: " + filter.from->toString() + " > " + filter.to->toString());
        }
        auto session = store_->openSession(SessionMode::READ_ONLY);
        return session->transactions().findMatching(resolved);
    });
}

// ============================================================================
// BUY / SELL
// ============================================================================

domain::TransactionResult TransactionRecorder::handle(Context& ctx, const domain::BuyRequest& buy) {
    auto account = requireAccount(*registry_, buy.account);
    auto asset = requireCurrency(ctx.session.currencies(), buy.asset).code;
    requirePositive(buy.quantity, "Quantity");
    requirePositive(buy.unitPrice, "Unit price");

    auto existing = ctx.session.holdings().findForUpdate(account.id, asset);
    auto priceCurrency = resolvePriceCurrency(ctx, buy.priceCurrency, existing);
    auto [price, costCurrency] = priceInCostCurrency(ctx, buy.unitPrice, priceCurrency, existing);

    domain::TransactionResult result;
    result.legs.push_back(holdings_->applyIn(ctx.session, account.id, asset, buy.quantity, price, costCurrency));

    domain::TransactionRecord record;
    record.type = TransactionType::BUY;
    record.toAccountId = account.id;
    record.toAsset = asset;
    record.toQuantity = buy.quantity;
    record.unitPrice = buy.unitPrice;
    record.priceCurrency = priceCurrency;
    result.record = append(ctx, std::move(record));
    return result;
}

domain::TransactionResult TransactionRecorder::handle(Context& ctx, const domain::SellRequest& sell) {
    auto account = requireAccount(*registry_, sell.account);
    auto asset = requireCurrency(ctx.session.currencies(), sell.asset).code;
    requirePositive(sell.quantity, "Quantity");
    requirePositive(sell.unitPrice, "Unit price");

    auto existing = ctx.session.holdings().findForUpdate(account.id, asset);
    requireAvailable(existing, account, asset, sell.quantity);

    auto priceCurrency = resolvePriceCurrency(ctx, sell.priceCurrency, existing);
    auto [price, costCurrency] = priceInCostCurrency(ctx, sell.unitPrice, priceCurrency, existing);

    domain::TransactionResult result;
    auto leg = holdings_->applyIn(ctx.session, account.id, asset, -sell.quantity, price, costCurrency);
    result.realizedPnl = leg.realizedPnl;
    result.legs.push_back(std::move(leg));

    domain::TransactionRecord record;
    record.type = TransactionType::SELL;
    record.fromAccountId = account.id;
    record.fromAsset = asset;
    record.fromQuantity = sell.quantity;
    record.unitPrice = sell.unitPrice;
    record.priceCurrency = priceCurrency;
    result.record = append(ctx, std::move(record));
    return result;
}

// ============================================================================
// TRANSFER
// ============================================================================

domain::TransactionResult TransactionRecorder::handle(Context& ctx, const domain::TransferRequest& transfer) {
    auto from = requireAccount(*registry_, transfer.fromAccount);
    auto to = requireAccount(*registry_, transfer.toAccount);
    if (from.id == to.id) {
        throw LedgerException(ErrorCode::INVALID_INPUT,
            "Source and destination accounts must differ: " + from.name);
    }

    auto asset = requireCurrency(ctx.session.currencies(), transfer.asset).code;
    requirePositive(transfer.quantity, "Quantity");
    if (transfer.fee.isNegative()) {
        throw LedgerException(ErrorCode::INVALID_INPUT, "Fee must not be negative");
    }

    // Комиссия в другом активе пересчитывается в переводимый по курсу на момент транзакции
    std::string feeAsset = ctx.request.feeAsset
        ? requireCurrency(ctx.session.currencies(), *ctx.request.feeAsset).code
        : asset;
    Decimal fee = transfer.fee;
    if (feeAsset != asset && !fee.isZero()) {
        fee = converter_->convert(ctx.session.exchangeRates(), fee, feeAsset, asset, ctx.timestamp);
    }

    Decimal netReceived = transfer.quantity - fee;
    if (!netReceived.isPositive()) {
        throw LedgerException(ErrorCode::INVALID_INPUT,
            "Fee " + fee.toString() + " " + asset + " leaves nothing to receive");
    }

    auto source = ctx.session.holdings().findForUpdate(from.id, asset);
    requireAvailable(source, from, asset, transfer.quantity);

    // Получатель наследует себестоимость источника
    const Decimal sourceCost = source->avgCostBasis;
    const std::string sourceCurrency = source->costBasisCurrency;
    auto destination = ctx.session.holdings().findForUpdate(to.id, asset);
    auto [price, costCurrency] = priceInCostCurrency(ctx, sourceCost, sourceCurrency, destination);

    domain::TransactionResult result;
    result.legs.push_back(holdings_->applyIn(ctx.session, from.id, asset, -transfer.quantity,
                                             std::nullopt, std::nullopt));
    result.legs.push_back(holdings_->applyIn(ctx.session, to.id, asset, netReceived, price, costCurrency));
    if (!fee.isZero()) {
        result.realizedPnl = -(fee * sourceCost);
    }

    domain::TransactionRecord record;
    record.type = TransactionType::TRANSFER;
    record.fromAccountId = from.id;
    record.fromAsset = asset;
    record.fromQuantity = transfer.quantity;
    record.toAccountId = to.id;
    record.toAsset = asset;
    record.toQuantity = netReceived;
    record.unitPrice = sourceCost;
    record.priceCurrency = sourceCurrency;
    record.fee = transfer.fee;
    record.feeAsset = feeAsset;
    result.record = append(ctx, std::move(record));
    return result;
}

// ============================================================================
// SWAP
// ============================================================================

domain::TransactionResult TransactionRecorder::handle(Context& ctx, const domain::SwapRequest& swap) {
    auto fromAccount = requireAccount(*registry_, swap.fromAccount);
    auto toAccount = requireAccount(*registry_, swap.toAccount);
    auto fromCurrency = requireCurrency(ctx.session.currencies(), swap.fromAsset);
    auto toCurrency = requireCurrency(ctx.session.currencies(), swap.toAsset);
    if (fromCurrency.code == toCurrency.code) {
        throw LedgerException(ErrorCode::INVALID_INPUT,
            "Swap assets must differ: " + fromCurrency.code);
    }
    requirePositive(swap.fromQuantity, "From quantity");

    // rate = цена одной единицы toAsset в единицах fromAsset
    Decimal rate;
    if (swap.manualRate) {
        requirePositive(*swap.manualRate, "Manual rate");
        requirePositive(swap.toQuantity, "To quantity");
        rate = *swap.manualRate;
    } else {
        if (swap.toQuantity.isZero()) {
            throw LedgerException(ErrorCode::ARITHMETIC_ERROR,
                "Cannot derive swap rate: to quantity is zero");
        }
        requirePositive(swap.toQuantity, "To quantity");
        rate = swap.fromQuantity / swap.toQuantity;
    }

    auto source = ctx.session.holdings().findForUpdate(fromAccount.id, fromCurrency.code);
    requireAvailable(source, fromAccount, fromCurrency.code, swap.fromQuantity);

    // Цена полученного актива: в терминах себестоимости источника, если она известна
    Decimal unitPrice = rate;
    std::string unitCurrency = fromCurrency.code;
    if (source->avgCostBasis.isPositive() && !source->costBasisCurrency.empty()) {
        unitPrice = rate * source->avgCostBasis;
        unitCurrency = source->costBasisCurrency;
    }
    auto destination = ctx.session.holdings().findForUpdate(toAccount.id, toCurrency.code);
    auto [price, costCurrency] = priceInCostCurrency(ctx, unitPrice, unitCurrency, destination);

    domain::TransactionResult result;
    result.legs.push_back(holdings_->applyIn(ctx.session, fromAccount.id, fromCurrency.code,
                                             -swap.fromQuantity, std::nullopt, std::nullopt));
    result.legs.push_back(holdings_->applyIn(ctx.session, toAccount.id, toCurrency.code,
                                             swap.toQuantity, price, costCurrency));

    domain::TransactionRecord record;
    record.type = TransactionType::SWAP;
    record.fromAccountId = fromAccount.id;
    record.fromAsset = fromCurrency.code;
    record.fromQuantity = swap.fromQuantity;
    record.toAccountId = toAccount.id;
    record.toAsset = toCurrency.code;
    record.toQuantity = swap.toQuantity;
    record.unitPrice = rate;
    record.priceCurrency = fromCurrency.code;
    record.exchangeRate = rate;
    result.record = append(ctx, std::move(record));

    // Фиат-фиат обмен фиксирует курс: toAsset → fromAsset = rate
    if (fromCurrency.isFiat() && toCurrency.isFiat()) {
        domain::ExchangeRate captured;
        captured.fromCurrency = toCurrency.code;
        captured.toCurrency = fromCurrency.code;
        captured.rate = rate;
        captured.timestamp = ctx.timestamp;
        captured.source = "swap";
        captured.notes = "Captured from swap #" + std::to_string(result.record.id);
        captured.id = rates_->upsertIn(ctx.session, captured);

        std::cout << "[TransactionRecorder] Captured rate " << captured.fromCurrency << "/"
                  << captured.toCurrency << " = " << captured.rate << std::endl;
        result.capturedRate = captured;
    }
    return result;
}

// ============================================================================
// HELPERS
// ============================================================================

std::string TransactionRecorder::resolvePriceCurrency(
    Context& ctx,
    const std::optional<std::string>& requested,
    const std::optional<domain::Holding>& holding
) {
    if (requested) {
        return requireCurrency(ctx.session.currencies(), *requested).code;
    }
    if (holding && !holding->costBasisCurrency.empty()) {
        return holding->costBasisCurrency;
    }
    return requireCurrency(ctx.session.currencies(), settings_->getBaseCurrency()).code;
}

std::pair<Decimal, std::string> TransactionRecorder::priceInCostCurrency(
    Context& ctx,
    const Decimal& price,
    const std::string& currency,
    const std::optional<domain::Holding>& holding
) {
    if (!holding || !holding->quantity.isPositive() || holding->costBasisCurrency == currency) {
        return {price, currency};
    }
    auto converted = converter_->convert(ctx.session.exchangeRates(), price, currency,
                                         holding->costBasisCurrency, ctx.timestamp);
    return {converted, holding->costBasisCurrency};
}

domain::TransactionRecord TransactionRecorder::append(Context& ctx, domain::TransactionRecord record) {
    record.timestamp = ctx.timestamp;
    record.notes = ctx.request.notes;
    record.id = ctx.session.transactions().append(record);
    return record;
}

// ============================================================================
// READ
// ============================================================================

domain::Result<std::vector<domain::TransactionRecord>> TransactionRecorder::list(size_t limit) {
    return guarded("TransactionRecorder", [&] {
        auto session = store_->openSession(SessionMode::READ_ONLY);
        return session->transactions().findRecent(limit);
    });
}

domain::Result<std::vector<domain::TransactionRecord>> TransactionRecorder::listByAccount(
    const std::string& account,
    size_t limit
) {
    return guarded("TransactionRecorder", [&] {
        auto resolved = requireAccount(*registry_, account);
        auto session = store_->openSession(SessionMode::READ_ONLY);
        return session->transactions().findByAccount(resolved.id, limit);
    });
}

domain::Result<domain::TransactionRecord> TransactionRecorder::get(int64_t id) {
    return guarded("TransactionRecorder", [&] {
        auto session = store_->openSession(SessionMode::READ_ONLY);
        auto record = session->transactions().findById(id);
        if (!record) {
            throw LedgerException(ErrorCode::NOT_FOUND, "Transaction not found: #" + std::to_string(id));
        }
        return *record;
    });
}

} // namespace ledger::application
