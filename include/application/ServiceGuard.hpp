#pragma once

#include "domain/Result.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ledger::application {

/**
 * @brief Выполнить тело операции и превратить исключения в Result
 *
 * LedgerException → его код, overflow/domain_error → ARITHMETIC_ERROR,
 * прочие std::exception → STORAGE_ERROR. Ошибка пишется в std::cerr.
 */
template <typename Body>
auto guarded(const char* component, Body&& body) -> domain::Result<decltype(body())> {
    using Value = decltype(body());
    using domain::ErrorCode;

    try {
        return domain::Result<Value>::ok(body());
    } catch (const domain::LedgerException& e) {
        std::cerr << "[" << component << "] " << domain::toString(e.code())
                  << ": " << e.what() << std::endl;
        return domain::Result<Value>::fail(e.toError());
    } catch (const std::overflow_error& e) {
        std::cerr << "[" << component << "] Arithmetic overflow: " << e.what() << std::endl;
        return domain::Result<Value>::fail(ErrorCode::ARITHMETIC_ERROR, e.what());
    } catch (const std::domain_error& e) {
        std::cerr << "[" << component << "] Arithmetic error: " << e.what() << std::endl;
        return domain::Result<Value>::fail(ErrorCode::ARITHMETIC_ERROR, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] Storage error: " << e.what() << std::endl;
        return domain::Result<Value>::fail(ErrorCode::STORAGE_ERROR, e.what());
    }
}

} // namespace ledger::application
