#pragma once

#include "ports/output/IPriceFeed.hpp"
#include "settings/ILedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief Цены активов из JSON-файла
 *
 * Формат: {"BTC": "65000.50", "ETH": 3500}. Строки предпочтительнее чисел,
 * так как не теряют точность. Файл читается при первом обращении.
 * Отсутствующий файл означает, что цен нет.
 */
class JsonFilePriceFeed : public ports::output::IPriceFeed {
public:
    explicit JsonFilePriceFeed(std::shared_ptr<settings::ILedgerSettings> settings)
        : path_(settings->getPricesFile())
    {}

    /**
     * @throws domain::LedgerException(INVALID_INPUT) если файл не является JSON-объектом
     */
    std::optional<domain::Decimal> currentPrice(const std::string& asset) override {
        std::call_once(loaded_, [this] { load(); });

        std::string code = asset;
        std::transform(code.begin(), code.end(), code.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        auto it = prices_.find(code);
        if (it == prices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::string path_;
    std::once_flag loaded_;
    std::map<std::string, domain::Decimal> prices_;

    void load() {
        std::ifstream file(path_);
        if (!file.is_open()) {
            std::cerr << "[JsonFilePriceFeed] Prices file not found: " << path_ << std::endl;
            return;
        }

        nlohmann::json document;
        try {
            document = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT,
                "Invalid prices file " + path_ + ": " + e.what());
        }
        if (!document.is_object()) {
            throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT,
                "Prices file " + path_ + " must contain a JSON object");
        }

        for (const auto& [asset, value] : document.items()) {
            std::string text = value.is_string() ? value.get<std::string>() : value.dump();
            auto price = domain::Decimal::tryParse(text);
            if (!price || price->isNegative()) {
                std::cerr << "[JsonFilePriceFeed] Skipping invalid price for " << asset
                          << ": " << text << std::endl;
                continue;
            }
            std::string code = asset;
            std::transform(code.begin(), code.end(), code.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            prices_[code] = *price;
        }
        std::cout << "[JsonFilePriceFeed] Loaded " << prices_.size() << " prices from " << path_ << std::endl;
    }
};

} // namespace ledger::adapters::secondary
