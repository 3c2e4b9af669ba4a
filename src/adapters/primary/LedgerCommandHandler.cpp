#include "adapters/primary/LedgerCommandHandler.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "adapters/primary/CsvTransactionCodec.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace ledger::adapters::primary {

using domain::Decimal;
using domain::Timestamp;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

constexpr size_t DEFAULT_LIST_LIMIT = 50;

/**
 * @brief Неверные аргументы командной строки
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void print(std::ostream& out, const nlohmann::json& body) {
    out << body.dump(2) << std::endl;
}

const std::string& arg(const CommandArgs& args, size_t index, const char* usage) {
    if (index >= args.positional.size()) {
        throw UsageError(std::string("Usage: ") + usage);
    }
    return args.positional[index];
}

Decimal parseDecimal(const std::string& text, const char* what) {
    auto value = Decimal::tryParse(text);
    if (!value) {
        throw UsageError(std::string("Invalid ") + what + ": " + text);
    }
    return *value;
}

Timestamp parseTimestamp(const std::string& text) {
    auto value = Timestamp::parse(text);
    if (!value) {
        throw UsageError("Invalid timestamp (expected ISO 8601): " + text);
    }
    return *value;
}

/**
 * @brief Целое число без хвоста ("3abc" не принимается)
 */
long parseInteger(const std::string& text, const char* what) {
    size_t pos = 0;
    long value = 0;
    try {
        value = std::stol(text, &pos);
    } catch (const std::logic_error&) {
        throw UsageError(std::string("Invalid ") + what + ": " + text);
    }
    if (pos != text.size()) {
        throw UsageError(std::string("Invalid ") + what + ": " + text);
    }
    return value;
}

size_t parseLimit(const CommandArgs& args) {
    auto limit = args.option("limit");
    if (!limit) {
        return DEFAULT_LIST_LIMIT;
    }
    long value = parseInteger(*limit, "limit");
    if (value <= 0) {
        throw UsageError("Limit must be positive: " + *limit);
    }
    return static_cast<size_t>(value);
}

/**
 * @brief Напечатать значение результата или ошибку
 */
template <typename T, typename Mapper>
int respond(std::ostream& out, const domain::Result<T>& result, Mapper toJson) {
    if (!result.isOk()) {
        print(out, mapper::toJson(result.error()));
        return EXIT_FAILED;
    }
    print(out, toJson(result.value()));
    return EXIT_OK;
}

template <typename T>
nlohmann::json toArray(const std::vector<T>& items) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& item : items) {
        array.push_back(mapper::toJson(item));
    }
    return array;
}

} // namespace

// ============================================================================
// CommandArgs
// ============================================================================

CommandArgs CommandArgs::parse(const std::vector<std::string>& tokens) {
    CommandArgs args;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token.size() > 2 && token.compare(0, 2, "--") == 0) {
            std::string name = token.substr(2);
            bool hasValue = i + 1 < tokens.size() && tokens[i + 1].compare(0, 2, "--") != 0;
            args.options[name] = hasValue ? tokens[++i] : std::string();
        } else {
            args.positional.push_back(token);
        }
    }
    return args;
}

std::optional<std::string> CommandArgs::option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// LedgerCommandHandler
// ============================================================================

LedgerCommandHandler::LedgerCommandHandler(
    std::shared_ptr<ports::input::ICurrencyCatalog> catalog,
    std::shared_ptr<ports::input::IExchangeRateStore> rates,
    std::shared_ptr<ports::input::IHoldingsLedger> holdings,
    std::shared_ptr<ports::input::ITransactionRecorder> recorder,
    std::shared_ptr<ports::input::IPortfolioAggregator> portfolio,
    std::shared_ptr<ports::output::IAccountRegistry> accounts,
    std::shared_ptr<ports::output::IPriceFeed> prices
) : catalog_(std::move(catalog))
  , rates_(std::move(rates))
  , holdings_(std::move(holdings))
  , recorder_(std::move(recorder))
  , portfolio_(std::move(portfolio))
  , accounts_(std::move(accounts))
  , prices_(std::move(prices))
{}

int LedgerCommandHandler::handle(const std::vector<std::string>& tokens, std::ostream& out) {
    auto args = CommandArgs::parse(tokens);

    try {
        const auto& command = arg(args, 0, "ledger-cli <currency|rate|tx|import|holdings|portfolio> ...");
        if (command == "currency") return handleCurrency(args, out);
        if (command == "rate") return handleRate(args, out);
        if (command == "tx") return handleTx(args, out);
        if (command == "import") return handleImport(args, out);
        if (command == "holdings") return handleHoldings(args, out);
        if (command == "portfolio") return handlePortfolio(args, out);
        throw UsageError("Unknown command: " + command);

    } catch (const UsageError& e) {
        print(out, mapper::toJson(domain::LedgerError{domain::ErrorCode::INVALID_INPUT, e.what()}));
        return EXIT_USAGE;
    } catch (const domain::LedgerException& e) {
        // Ошибки вне сервисов (чтение файла цен, реестр счетов)
        std::cerr << "[LedgerCommandHandler] " << e.what() << std::endl;
        print(out, mapper::toJson(e.toError()));
        return EXIT_FAILED;
    }
}

int LedgerCommandHandler::handleCurrency(const CommandArgs& args, std::ostream& out) {
    const auto& action = arg(args, 1, "currency <list|add|enable|disable>");

    if (action == "list") {
        std::optional<domain::AssetClass> assetClass;
        if (auto cls = args.option("class")) {
            assetClass = domain::assetClassFromString(*cls);
            if (!assetClass) {
                throw UsageError("Unknown asset class: " + *cls);
            }
        }
        return respond(out, catalog_->list(assetClass, !args.has("all")),
                       [](const auto& items) { return toArray(items); });
    }

    if (action == "add") {
        const char* usage = "currency add CODE NAME SYMBOL DECIMALS <fiat|crypto|stablecoin>";
        domain::Currency currency;
        currency.code = arg(args, 2, usage);
        currency.displayName = arg(args, 3, usage);
        currency.symbol = arg(args, 4, usage);
        long decimals = parseInteger(arg(args, 5, usage), "decimals");
        if (decimals < std::numeric_limits<int>::min() || decimals > std::numeric_limits<int>::max()) {
            throw UsageError("Invalid decimals: " + args.positional[5]);
        }
        currency.decimalPrecision = static_cast<int>(decimals);
        auto assetClass = domain::assetClassFromString(arg(args, 6, usage));
        if (!assetClass) {
            throw UsageError("Unknown asset class: " + args.positional[6]);
        }
        currency.assetClass = *assetClass;
        return respond(out, catalog_->registerCurrency(currency),
                       [](const domain::Currency& c) { return mapper::toJson(c); });
    }

    if (action == "enable" || action == "disable") {
        const auto& code = arg(args, 2, "currency <enable|disable> CODE");
        bool enabled = action == "enable";
        return respond(out, catalog_->setEnabled(code, enabled), [&](const domain::Unit&) {
            nlohmann::json j;
            j["code"] = code;
            j["enabled"] = enabled;
            return j;
        });
    }

    throw UsageError("Unknown currency action: " + action);
}

int LedgerCommandHandler::handleRate(const CommandArgs& args, std::ostream& out) {
    const auto& action = arg(args, 1, "rate <set|latest|asof|history|convert>");

    if (action == "set") {
        const char* usage = "rate set FROM TO RATE [--at T] [--source S] [--notes N]";
        domain::ExchangeRate rate;
        rate.fromCurrency = arg(args, 2, usage);
        rate.toCurrency = arg(args, 3, usage);
        rate.rate = parseDecimal(arg(args, 4, usage), "rate");
        if (auto at = args.option("at")) {
            rate.timestamp = parseTimestamp(*at);
        }
        rate.source = args.option("source").value_or("manual");
        rate.notes = args.option("notes").value_or("");
        return respond(out, rates_->upsert(rate), [](int64_t id) {
            nlohmann::json j;
            j["id"] = id;
            return j;
        });
    }

    if (action == "latest") {
        const char* usage = "rate latest FROM TO";
        return respond(out, rates_->latest(arg(args, 2, usage), arg(args, 3, usage)),
                       [](const domain::ExchangeRate& r) { return mapper::toJson(r); });
    }

    if (action == "asof") {
        const char* usage = "rate asof FROM TO TIMESTAMP";
        auto at = parseTimestamp(arg(args, 4, usage));
        return respond(out, rates_->asOf(arg(args, 2, usage), arg(args, 3, usage), at),
                       [](const domain::ExchangeRate& r) { return mapper::toJson(r); });
    }

    if (action == "history") {
        const char* usage = "rate history FROM TO [--limit N]";
        size_t limit = parseLimit(args);
        return respond(out, rates_->history(arg(args, 2, usage), arg(args, 3, usage)),
            [limit](const domain::RateHistory& history) {
                nlohmann::json array = nlohmann::json::array();
                for (auto it = history.begin(); it != history.end() && array.size() < limit; ++it) {
                    array.push_back(mapper::toJson(*it));
                }
                return array;
            });
    }

    if (action == "convert") {
        const char* usage = "rate convert AMOUNT FROM TO [--at T]";
        auto amount = parseDecimal(arg(args, 2, usage), "amount");
        const auto& from = arg(args, 3, usage);
        const auto& to = arg(args, 4, usage);
        auto at = args.option("at") ? parseTimestamp(*args.option("at")) : Timestamp::now();
        return respond(out, rates_->convert(amount, from, to, at), [&](const Decimal& converted) {
            nlohmann::json j;
            j["amount"] = amount.toString();
            j["from"] = from;
            j["to"] = to;
            j["converted"] = converted.toString();
            j["at"] = at.toString();
            return j;
        });
    }

    throw UsageError("Unknown rate action: " + action);
}

int LedgerCommandHandler::handleTx(const CommandArgs& args, std::ostream& out) {
    const auto& action = arg(args, 1, "tx <buy|sell|transfer|swap|list|export>");

    if (action == "export") {
        return handleExport(args, out);
    }

    if (action == "list") {
        size_t limit = parseLimit(args);
        if (auto account = args.option("account")) {
            if (auto error = unknownAccount(*account)) {
                print(out, *error);
                return EXIT_FAILED;
            }
            return respond(out, recorder_->listByAccount(*account, limit),
                           [](const auto& items) { return toArray(items); });
        }
        return respond(out, recorder_->list(limit), [](const auto& items) { return toArray(items); });
    }

    domain::TransactionRequest request;
    std::vector<std::string> accounts;

    if (action == "buy" || action == "sell") {
        const char* usage = "tx <buy|sell> ACCOUNT ASSET QUANTITY UNIT_PRICE [--currency C]";
        const auto& account = arg(args, 2, usage);
        const auto& asset = arg(args, 3, usage);
        auto quantity = parseDecimal(arg(args, 4, usage), "quantity");
        auto price = parseDecimal(arg(args, 5, usage), "unit price");
        if (action == "buy") {
            request.kind = domain::BuyRequest{account, asset, quantity, price, args.option("currency")};
        } else {
            request.kind = domain::SellRequest{account, asset, quantity, price, args.option("currency")};
        }
        accounts = {account};
    } else if (action == "transfer") {
        const char* usage = "tx transfer FROM_ACCOUNT TO_ACCOUNT ASSET QUANTITY [--fee F] [--fee-asset A]";
        domain::TransferRequest transfer;
        transfer.fromAccount = arg(args, 2, usage);
        transfer.toAccount = arg(args, 3, usage);
        transfer.asset = arg(args, 4, usage);
        transfer.quantity = parseDecimal(arg(args, 5, usage), "quantity");
        if (auto fee = args.option("fee")) {
            transfer.fee = parseDecimal(*fee, "fee");
        }
        request.feeAsset = args.option("fee-asset");
        accounts = {transfer.fromAccount, transfer.toAccount};
        request.kind = transfer;
    } else if (action == "swap") {
        const char* usage = "tx swap FROM_ACCOUNT FROM_ASSET FROM_QTY TO_ACCOUNT TO_ASSET TO_QTY [--rate R]";
        domain::SwapRequest swap;
        swap.fromAccount = arg(args, 2, usage);
        swap.fromAsset = arg(args, 3, usage);
        swap.fromQuantity = parseDecimal(arg(args, 4, usage), "from quantity");
        swap.toAccount = arg(args, 5, usage);
        swap.toAsset = arg(args, 6, usage);
        swap.toQuantity = parseDecimal(arg(args, 7, usage), "to quantity");
        if (auto rate = args.option("rate")) {
            swap.manualRate = parseDecimal(*rate, "rate");
        }
        accounts = {swap.fromAccount, swap.toAccount};
        request.kind = swap;
    } else {
        throw UsageError("Unknown tx action: " + action);
    }

    for (const auto& account : accounts) {
        if (auto error = unknownAccount(account)) {
            print(out, *error);
            return EXIT_FAILED;
        }
    }

    if (auto at = args.option("at")) {
        request.timestamp = parseTimestamp(*at);
    }
    request.notes = args.option("notes").value_or("");

    if (args.has("dry-run")) {
        return respond(out, recorder_->preview(request), [](const domain::TransactionResult& result) {
            auto j = mapper::toJson(result);
            j["dry_run"] = true;
            return j;
        });
    }
    return respond(out, recorder_->record(request),
                   [](const domain::TransactionResult& result) { return mapper::toJson(result); });
}

int LedgerCommandHandler::handleExport(const CommandArgs& args, std::ostream& out) {
    const char* usage = "tx export FILE [--format csv|json] [--account A] [--asset X] [--from T] [--to T]";
    const auto& file = arg(args, 2, usage);
    auto format = args.option("format").value_or("csv");
    if (format != "csv" && format != "json") {
        throw UsageError("Unsupported export format: " + format);
    }

    domain::TransactionFilter filter;
    if (auto account = args.option("account")) {
        if (auto error = unknownAccount(*account)) {
            print(out, *error);
            return EXIT_FAILED;
        }
        filter.account = *account;
    }
    filter.asset = args.option("asset");
    if (auto from = args.option("from")) {
        filter.from = parseTimestamp(*from);
    }
    if (auto to = args.option("to")) {
        filter.to = parseTimestamp(*to);
    }

    auto records = recorder_->exportRecords(filter);
    if (!records.isOk()) {
        print(out, mapper::toJson(records.error()));
        return EXIT_FAILED;
    }

    auto writeTo = [&](std::ostream& target) {
        if (format == "csv") {
            CsvTransactionCodec::write(target, records.value());
        } else {
            target << toArray(records.value()).dump(2) << std::endl;
        }
    };

    if (file == "-") {
        writeTo(out);
        return EXIT_OK;
    }

    std::ofstream stream(file);
    if (!stream) {
        throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT, "Cannot write file: " + file);
    }
    writeTo(stream);
    stream.close();
    if (!stream) {
        throw domain::LedgerException(domain::ErrorCode::STORAGE_ERROR, "Failed writing file: " + file);
    }

    std::cout << "[LedgerCommandHandler] Exported " << records.value().size()
              << " transactions to " << file << std::endl;
    nlohmann::json j;
    j["file"] = file;
    j["format"] = format;
    j["count"] = records.value().size();
    print(out, j);
    return EXIT_OK;
}

int LedgerCommandHandler::handleImport(const CommandArgs& args, std::ostream& out) {
    const char* usage = "import FILE --account A";
    const auto& file = arg(args, 1, usage);
    auto account = args.option("account");
    if (!account || account->empty()) {
        throw UsageError(std::string("Usage: ") + usage);
    }
    if (auto error = unknownAccount(*account)) {
        print(out, *error);
        return EXIT_FAILED;
    }

    std::ifstream stream(file);
    if (!stream) {
        throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT, "File not found: " + file);
    }
    auto parsed = CsvTransactionCodec::read(stream, *account);

    auto imported = recorder_->importRows(parsed.rows);
    if (!imported.isOk()) {
        print(out, mapper::toJson(imported.error()));
        return EXIT_FAILED;
    }

    // Ошибки разбора и записи вместе, по порядку строк
    auto failures = parsed.failures;
    const auto& report = imported.value();
    failures.insert(failures.end(), report.failures.begin(), report.failures.end());
    std::sort(failures.begin(), failures.end(),
        [](const domain::ImportFailure& a, const domain::ImportFailure& b) { return a.line < b.line; });

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& failure : failures) {
        auto e = mapper::toJson(failure.error);
        e["line"] = failure.line;
        errors.push_back(e);
    }

    nlohmann::json j;
    j["file"] = file;
    j["account"] = *account;
    j["imported"] = report.imported();
    j["failed"] = failures.size();
    j["transactions"] = report.transactionIds;
    j["errors"] = errors;
    print(out, j);
    return failures.empty() ? EXIT_OK : EXIT_FAILED;
}

int LedgerCommandHandler::handleHoldings(const CommandArgs& args, std::ostream& out) {
    std::optional<std::string> account;
    if (args.positional.size() > 1) {
        account = args.positional[1];
        if (auto error = unknownAccount(*account)) {
            print(out, *error);
            return EXIT_FAILED;
        }
    }
    return respond(out, holdings_->list(account), [](const auto& items) { return toArray(items); });
}

int LedgerCommandHandler::handlePortfolio(const CommandArgs& args, std::ostream& out) {
    std::optional<std::string> account;
    if (args.positional.size() > 1) {
        account = args.positional[1];
        if (auto error = unknownAccount(*account)) {
            print(out, *error);
            return EXIT_FAILED;
        }
    }

    auto feed = prices_;
    auto lookup = [feed](const std::string& asset) { return feed->currentPrice(asset); };
    return respond(out, portfolio_->valuate(lookup, account),
                   [](const domain::PortfolioValuation& p) { return mapper::toJson(p); });
}

std::optional<nlohmann::json> LedgerCommandHandler::unknownAccount(const std::string& nameOrId) {
    if (accounts_->resolve(nameOrId)) {
        return std::nullopt;
    }

    nlohmann::json error = mapper::toJson(
        domain::LedgerError{domain::ErrorCode::NOT_FOUND, "Account not found: " + nameOrId});
    nlohmann::json names = nlohmann::json::array();
    for (const auto& account : accounts_->findAll()) {
        names.push_back(account.name);
    }
    error["valid_accounts"] = names;
    return error;
}

} // namespace ledger::adapters::primary
