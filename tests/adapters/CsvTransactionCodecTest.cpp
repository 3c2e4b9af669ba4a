#include <gtest/gtest.h>

#include "adapters/primary/CsvTransactionCodec.hpp"

#include <sstream>
#include <variant>

using namespace ledger;
using adapters::primary::CsvTransactionCodec;
using domain::Decimal;
using domain::ErrorCode;

namespace {

Decimal d(const std::string& text) {
    return Decimal::fromString(text);
}

adapters::primary::CsvImport readCsv(const std::string& text, const std::string& account = "Coinbase") {
    std::istringstream in(text);
    return CsvTransactionCodec::read(in, account);
}

} // namespace

// ============================================================================
// Разбор строк
// ============================================================================

TEST(CsvTransactionCodecTest, SplitLine_QuotedFields) {
    auto fields = CsvTransactionCodec::splitLine(R"(2024-01-15,buy,"DCA, weekly","say ""hi""",)");
    ASSERT_EQ(fields.size(), 5u);
    EXPECT_EQ(fields[2], "DCA, weekly");
    EXPECT_EQ(fields[3], R"(say "hi")");
    EXPECT_EQ(fields[4], "");

    EXPECT_THROW(CsvTransactionCodec::splitLine(R"(a,"open)"), std::invalid_argument);
}

TEST(CsvTransactionCodecTest, Escape_OnlyWhenNeeded) {
    EXPECT_EQ(CsvTransactionCodec::escape("plain"), "plain");
    EXPECT_EQ(CsvTransactionCodec::escape("a,b"), "\"a,b\"");
    EXPECT_EQ(CsvTransactionCodec::escape("5\" disk"), "\"5\"\" disk\"");
}

// ============================================================================
// Импорт
// ============================================================================

TEST(CsvTransactionCodecTest, Read_AllTypes_MappedToRequests) {
    auto parsed = readCsv(
        "Date,Type,Asset,Quantity,Price,Fee,To_Account,To_Asset,To_Quantity,Notes\r\n"
        "2024-01-15,buy,BTC,0.5,45000,,,,,First purchase\r\n"
        "2024-02-01T10:00:00Z,SELL,BTC,0.1,50000,,,,,\r\n"
        "2024-03-01,transfer,BTC,0.2,,0.001,Ledger,,,\r\n"
        "2024-04-01,swap,BTC,0.1,,,,ETH,2,\r\n");

    EXPECT_TRUE(parsed.failures.empty());
    ASSERT_EQ(parsed.rows.size(), 4u);
    EXPECT_EQ(parsed.rows[0].line, 2u);

    const auto& buy = std::get<domain::BuyRequest>(parsed.rows[0].request.kind);
    EXPECT_EQ(buy.account, "Coinbase");
    EXPECT_EQ(buy.quantity, d("0.5"));
    EXPECT_EQ(buy.unitPrice, d("45000"));
    EXPECT_FALSE(buy.priceCurrency.has_value());
    EXPECT_EQ(parsed.rows[0].request.notes, "First purchase");
    EXPECT_EQ(parsed.rows[0].request.timestamp, domain::Timestamp::parse("2024-01-15"));

    EXPECT_TRUE(std::holds_alternative<domain::SellRequest>(parsed.rows[1].request.kind));

    const auto& transfer = std::get<domain::TransferRequest>(parsed.rows[2].request.kind);
    EXPECT_EQ(transfer.fromAccount, "Coinbase");
    EXPECT_EQ(transfer.toAccount, "Ledger");
    EXPECT_EQ(transfer.fee, d("0.001"));

    const auto& swap = std::get<domain::SwapRequest>(parsed.rows[3].request.kind);
    EXPECT_EQ(swap.toAccount, "Coinbase");
    EXPECT_EQ(swap.toAsset, "ETH");
    EXPECT_EQ(swap.toQuantity, d("2"));
}

TEST(CsvTransactionCodecTest, Read_PriceUsdColumn_ImpliesUsd) {
    auto parsed = readCsv(
        "date,type,asset,quantity,price_usd\n"
        "2024-01-15,buy,ETH,1,2500\n");

    ASSERT_EQ(parsed.rows.size(), 1u);
    const auto& buy = std::get<domain::BuyRequest>(parsed.rows[0].request.kind);
    EXPECT_EQ(buy.unitPrice, d("2500"));
    EXPECT_EQ(buy.priceCurrency, std::optional<std::string>("USD"));
}

TEST(CsvTransactionCodecTest, Read_BadRows_ReportedWithLineNumbers) {
    auto parsed = readCsv(
        "date,type,asset,quantity,price\n"
        "2024-01-15,buy,BTC,0.5,45000\n"
        "\n"
        "yesterday,buy,BTC,0.5,45000\n"
        "2024-01-16,gift,BTC,0.5,45000\n"
        "2024-01-17,buy,BTC,lots,45000\n"
        "2024-01-18,sell,BTC,0.1,\n"
        "2024-01-19,transfer,BTC,0.1,\n"
        "2024-01-20,buy,BTC,0.1,\"45000\n");

    ASSERT_EQ(parsed.rows.size(), 1u);
    ASSERT_EQ(parsed.failures.size(), 6u);
    EXPECT_EQ(parsed.failures[0].line, 4u);
    EXPECT_EQ(parsed.failures[0].error.message, "Invalid date: yesterday");
    EXPECT_EQ(parsed.failures[1].line, 5u);
    EXPECT_EQ(parsed.failures[1].error.message, "Unknown transaction type: gift");
    EXPECT_EQ(parsed.failures[2].error.message, "Invalid quantity: lots");
    EXPECT_EQ(parsed.failures[3].error.message, "Missing price for sell");
    EXPECT_EQ(parsed.failures[4].error.message, "Missing to_account");
    EXPECT_EQ(parsed.failures[5].line, 9u);
    for (const auto& failure : parsed.failures) {
        EXPECT_EQ(failure.error.code, ErrorCode::INVALID_INPUT);
    }
}

TEST(CsvTransactionCodecTest, Read_MissingHeaderOrColumn_Throws) {
    try {
        readCsv("date,type,asset\n2024-01-15,buy,BTC\n");
        FAIL() << "Expected LedgerException";
    } catch (const domain::LedgerException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_INPUT);
        EXPECT_STREQ(e.what(), "CSV header is missing column: quantity");
    }

    EXPECT_THROW(readCsv(""), domain::LedgerException);
}

// ============================================================================
// Выгрузка
// ============================================================================

TEST(CsvTransactionCodecTest, Write_HeaderAndEscapedNotes) {
    domain::TransactionRecord record;
    record.id = 7;
    record.type = domain::TransactionType::BUY;
    record.toAccountId = "acc-coinbase";
    record.toAsset = "BTC";
    record.toQuantity = d("0.5");
    record.unitPrice = d("45000");
    record.priceCurrency = "USD";
    record.timestamp = *domain::Timestamp::parse("2024-01-15");
    record.notes = "DCA, weekly";

    std::ostringstream out;
    CsvTransactionCodec::write(out, {record});

    std::istringstream lines(out.str());
    std::string header;
    std::string row;
    std::getline(lines, header);
    std::getline(lines, row);

    EXPECT_EQ(header, "id,date,type,from_account,from_asset,from_quantity,to_account,to_asset,to_quantity,"
                      "price,price_currency,fee,fee_asset,rate,notes");
    EXPECT_EQ(row, "7," + record.timestamp.toString() + ",buy,,,,acc-coinbase,BTC,0.5,45000,USD,,,,\"DCA, weekly\"");
}
