#pragma once

#include "domain/Decimal.hpp"
#include "domain/Timestamp.hpp"
#include "domain/LedgerError.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <optional>
#include <string>

namespace ledger::adapters::secondary::postgres {

/**
 * @brief TIMESTAMPTZ в ISO 8601 (UTC, микросекунды) для разбора Timestamp::parse
 */
inline std::string isoColumn(const std::string& column) {
    return "to_char(" + column + " AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"')";
}

inline domain::Decimal toDecimal(const pqxx::field& field) {
    return domain::Decimal::fromString(field.as<std::string>());
}

inline std::optional<domain::Decimal> toOptionalDecimal(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return toDecimal(field);
}

inline std::optional<std::string> toOptionalString(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

/**
 * @throws domain::LedgerException(STORAGE_ERROR) если значение не разбирается
 */
inline domain::Timestamp toTimestamp(const pqxx::field& field) {
    auto text = field.as<std::string>();
    auto parsed = domain::Timestamp::parse(text);
    if (!parsed) {
        throw domain::LedgerException(domain::ErrorCode::STORAGE_ERROR, "Bad timestamp from database: " + text);
    }
    return *parsed;
}

inline std::optional<std::string> toParam(const std::optional<domain::Decimal>& value) {
    if (!value) {
        return std::nullopt;
    }
    return value->toString();
}

/**
 * @brief Выполнить запрос и перевести ошибки libpqxx в LedgerException
 *
 * serialization_failure / deadlock_detected → CONFLICT,
 * unique_violation → ALREADY_EXISTS, остальное → STORAGE_ERROR.
 */
template <typename Body>
auto pgCall(const char* component, const char* operation, Body&& body) -> decltype(body()) {
    using domain::ErrorCode;
    using domain::LedgerException;

    try {
        return body();
    } catch (const LedgerException&) {
        throw;
    } catch (const pqxx::serialization_failure& e) {
        std::cerr << "[" << component << "] " << operation << " conflict: " << e.what() << std::endl;
        throw LedgerException(ErrorCode::CONFLICT, std::string("Serialization failure: ") + e.what());
    } catch (const pqxx::deadlock_detected& e) {
        std::cerr << "[" << component << "] " << operation << " deadlock: " << e.what() << std::endl;
        throw LedgerException(ErrorCode::CONFLICT, std::string("Deadlock detected: ") + e.what());
    } catch (const pqxx::unique_violation& e) {
        std::cerr << "[" << component << "] " << operation << " duplicate: " << e.what() << std::endl;
        throw LedgerException(ErrorCode::ALREADY_EXISTS, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] " << operation << " failed: " << e.what() << std::endl;
        throw LedgerException(ErrorCode::STORAGE_ERROR, std::string(operation) + " failed: " + e.what());
    }
}

} // namespace ledger::adapters::secondary::postgres
