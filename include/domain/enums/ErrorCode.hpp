#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Коды ошибок ядра учёта
 */
enum class ErrorCode {
    NOT_FOUND,             ///< Неизвестный счёт / актив / валюта / курс
    ALREADY_EXISTS,        ///< Дублирующийся код валюты
    INVALID_INPUT,         ///< Неположительное количество или цена, неверный идентификатор
    INSUFFICIENT_HOLDINGS, ///< Продажа или перевод больше доступного количества
    ARITHMETIC_ERROR,      ///< Деление на ноль, переполнение
    RATE_UNAVAILABLE,      ///< Нет курса для конвертации в пределах политики
    CONFLICT,              ///< Конкурентное изменение обнаружено при коммите
    STORAGE_ERROR          ///< Сбой подключения или запроса к хранилищу
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND:             return "NOT_FOUND";
        case ErrorCode::ALREADY_EXISTS:        return "ALREADY_EXISTS";
        case ErrorCode::INVALID_INPUT:         return "INVALID_INPUT";
        case ErrorCode::INSUFFICIENT_HOLDINGS: return "INSUFFICIENT_HOLDINGS";
        case ErrorCode::ARITHMETIC_ERROR:      return "ARITHMETIC_ERROR";
        case ErrorCode::RATE_UNAVAILABLE:      return "RATE_UNAVAILABLE";
        case ErrorCode::CONFLICT:              return "CONFLICT";
        case ErrorCode::STORAGE_ERROR:         return "STORAGE_ERROR";
    }
    return "UNKNOWN";
}

} // namespace ledger::domain
