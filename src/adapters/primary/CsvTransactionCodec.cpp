#include "adapters/primary/CsvTransactionCodec.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <stdexcept>

namespace ledger::adapters::primary {

using domain::Decimal;
using domain::ErrorCode;
using domain::LedgerException;

namespace {

const char* REQUIRED_COLUMNS[] = {"date", "type", "asset", "quantity"};

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/**
 * @brief Ошибка в одной строке файла, строка пропускается
 */
class RowError : public std::runtime_error {
public:
    explicit RowError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Доступ к полям строки по имени колонки
 */
class Row {
public:
    Row(const std::map<std::string, size_t>& columns, std::vector<std::string> fields)
        : columns_(columns), fields_(std::move(fields)) {}

    std::optional<std::string> get(const std::string& name) const {
        auto it = columns_.find(name);
        if (it == columns_.end() || it->second >= fields_.size()) {
            return std::nullopt;
        }
        auto value = trim(fields_[it->second]);
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }

    std::string require(const std::string& name) const {
        auto value = get(name);
        if (!value) {
            throw RowError("Missing " + name);
        }
        return *value;
    }

    std::optional<Decimal> decimal(const std::string& name) const {
        auto text = get(name);
        if (!text) {
            return std::nullopt;
        }
        auto value = Decimal::tryParse(*text);
        if (!value) {
            throw RowError("Invalid " + name + ": " + *text);
        }
        return value;
    }

    Decimal requireDecimal(const std::string& name) const {
        auto value = decimal(name);
        if (!value) {
            throw RowError("Missing " + name);
        }
        return *value;
    }

private:
    const std::map<std::string, size_t>& columns_;
    std::vector<std::string> fields_;
};

domain::TransactionRequest toRequest(const Row& row, const std::string& account) {
    auto dateText = row.require("date");
    auto timestamp = domain::Timestamp::parse(dateText);
    if (!timestamp) {
        throw RowError("Invalid date: " + dateText);
    }

    auto type = lower(row.require("type"));
    auto asset = row.require("asset");
    auto quantity = row.requireDecimal("quantity");

    auto price = row.decimal("price");
    auto priceCurrency = row.get("price_currency");
    if (!price) {
        price = row.decimal("price_usd");
        if (price && !priceCurrency) {
            priceCurrency = std::string("USD");
        }
    }

    domain::TransactionRequest request;
    if (type == "buy" || type == "sell") {
        if (!price) {
            throw RowError("Missing price for " + type);
        }
        if (type == "buy") {
            request.kind = domain::BuyRequest{account, asset, quantity, *price, priceCurrency};
        } else {
            request.kind = domain::SellRequest{account, asset, quantity, *price, priceCurrency};
        }
    } else if (type == "transfer") {
        domain::TransferRequest transfer;
        transfer.fromAccount = account;
        transfer.toAccount = row.require("to_account");
        transfer.asset = asset;
        transfer.quantity = quantity;
        transfer.fee = row.decimal("fee").value_or(Decimal::zero());
        request.kind = transfer;
        request.feeAsset = row.get("fee_asset");
    } else if (type == "swap") {
        domain::SwapRequest swap;
        swap.fromAccount = account;
        swap.fromAsset = asset;
        swap.fromQuantity = quantity;
        swap.toAccount = row.get("to_account").value_or(account);
        swap.toAsset = row.require("to_asset");
        swap.toQuantity = row.requireDecimal("to_quantity");
        swap.manualRate = row.decimal("rate");
        request.kind = swap;
    } else {
        throw RowError("Unknown transaction type: " + type);
    }

    request.timestamp = timestamp;
    request.notes = row.get("notes").value_or("");
    return request;
}

std::string field(const std::optional<std::string>& value) {
    return value ? CsvTransactionCodec::escape(*value) : std::string();
}

std::string field(const std::optional<Decimal>& value) {
    return value ? value->toString() : std::string();
}

} // namespace

std::vector<std::string> CsvTransactionCodec::splitLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (quoted) {
        throw std::invalid_argument("Unterminated quoted field");
    }
    fields.push_back(current);
    return fields;
}

std::string CsvTransactionCodec::escape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

CsvImport CsvTransactionCodec::read(std::istream& in, const std::string& account) {
    std::string line;
    size_t lineNumber = 0;

    // Заголовок: первая непустая строка
    std::map<std::string, size_t> columns;
    while (columns.empty() && std::getline(in, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        try {
            auto header = splitLine(line);
            for (size_t i = 0; i < header.size(); ++i) {
                columns[lower(trim(header[i]))] = i;
            }
        } catch (const std::invalid_argument& e) {
            throw LedgerException(ErrorCode::INVALID_INPUT, std::string("Invalid CSV header: ") + e.what());
        }
    }
    if (columns.empty()) {
        throw LedgerException(ErrorCode::INVALID_INPUT, "CSV file has no header");
    }
    for (const char* required : REQUIRED_COLUMNS) {
        if (columns.find(required) == columns.end()) {
            throw LedgerException(ErrorCode::INVALID_INPUT,
                std::string("CSV header is missing column: ") + required);
        }
    }

    CsvImport result;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        try {
            Row row(columns, splitLine(line));
            result.rows.push_back(domain::ImportRow{lineNumber, toRequest(row, account)});
        } catch (const RowError& e) {
            result.failures.push_back(domain::ImportFailure{
                lineNumber, domain::LedgerError{ErrorCode::INVALID_INPUT, e.what()}});
        } catch (const std::invalid_argument& e) {
            result.failures.push_back(domain::ImportFailure{
                lineNumber, domain::LedgerError{ErrorCode::INVALID_INPUT, e.what()}});
        }
    }
    return result;
}

void CsvTransactionCodec::write(std::ostream& out, const std::vector<domain::TransactionRecord>& records) {
    out << "id,date,type,from_account,from_asset,from_quantity,to_account,to_asset,to_quantity,"
           "price,price_currency,fee,fee_asset,rate,notes\n";
    for (const auto& record : records) {
        out << record.id << ','
            << record.timestamp.toString() << ','
            << domain::toString(record.type) << ','
            << field(record.fromAccountId) << ','
            << field(record.fromAsset) << ','
            << field(record.fromQuantity) << ','
            << field(record.toAccountId) << ','
            << field(record.toAsset) << ','
            << field(record.toQuantity) << ','
            << field(record.unitPrice) << ','
            << field(record.priceCurrency) << ','
            << field(record.fee) << ','
            << field(record.feeAsset) << ','
            << field(record.exchangeRate) << ','
            << escape(record.notes) << '\n';
    }
}

} // namespace ledger::adapters::primary
