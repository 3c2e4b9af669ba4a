#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

// Forward declarations
namespace ledger::ports::output {
    class ILedgerStore;
    class IAccountRegistry;
}

namespace ledger::settings {
    class LedgerSettings;
}

namespace ledger::adapters::primary {
    class LedgerCommandHandler;
}

/**
 * @class LedgerApp
 * @brief Приложение ledger-cli
 *
 * Template Method:
 * 1. loadEnvironment() - настройки из переменных окружения, выбор хранилища
 * 2. configureInjection() - Boost.DI контейнер и обработчик команд
 * 3. run() - выполнение одной команды, JSON в out
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapter: LedgerCommandHandler
 * - Secondary Adapters: PostgresLedgerStore / InMemoryLedgerStore, JsonFilePriceFeed
 */
class LedgerApp
{
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @return код возврата процесса
     */
    int run(int argc, char* argv[], std::ostream& out);

protected:
    void loadEnvironment(int argc, char* argv[]);

    /**
     * @brief Настроить Boost.DI контейнер
     *
     * 1. Output Ports: хранилище и реестр счетов (готовые экземпляры), цены
     * 2. Input Ports: сервисы приложения
     * 3. Primary Adapter: обработчик команд
     */
    void configureInjection();

private:
    std::vector<std::string> args_;
    std::shared_ptr<ledger::settings::LedgerSettings> settings_;
    std::shared_ptr<ledger::ports::output::ILedgerStore> store_;
    std::shared_ptr<ledger::ports::output::IAccountRegistry> registry_;
    std::shared_ptr<ledger::adapters::primary::LedgerCommandHandler> handler_;

    void createMemoryStorage();
    void createPostgresStorage();
};
