#pragma once

#include "enums/ErrorCode.hpp"
#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Типизированная ошибка операции
 */
struct LedgerError {
    ErrorCode code = ErrorCode::STORAGE_ERROR;
    std::string message;
};

/**
 * @brief Исключение внутри ядра, на границе input-порта превращается в LedgerError
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    ErrorCode code() const { return code_; }

    LedgerError toError() const {
        return LedgerError{code_, what()};
    }

private:
    ErrorCode code_;
};

} // namespace ledger::domain
