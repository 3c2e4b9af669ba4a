#pragma once

#include "LedgerError.hpp"
#include <optional>
#include <stdexcept>
#include <utility>

namespace ledger::domain {

/**
 * @brief Результат операции: значение или LedgerError
 *
 * Input-порты возвращают Result вместо исключений.
 */
template <typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result fail(ErrorCode code, std::string message) {
        Result r;
        r.error_ = LedgerError{code, std::move(message)};
        return r;
    }

    static Result fail(LedgerError error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool isOk() const { return value_.has_value(); }
    explicit operator bool() const { return isOk(); }

    /**
     * @throws std::logic_error если результат содержит ошибку
     */
    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.message);
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.message);
        }
        return *value_;
    }

    const LedgerError& error() const { return error_; }

private:
    Result() = default;

    std::optional<T> value_;
    LedgerError error_;
};

/**
 * @brief Пустое значение для операций без результата
 */
struct Unit {};

} // namespace ledger::domain
