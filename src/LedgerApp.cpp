#include "LedgerApp.hpp"

// Primary Adapters
#include "adapters/primary/LedgerCommandHandler.hpp"

// Application Services
#include "application/CurrencyCatalog.hpp"
#include "application/ExchangeRateStore.hpp"
#include "application/HoldingsLedger.hpp"
#include "application/TransactionRecorder.hpp"
#include "application/PortfolioAggregator.hpp"
#include "application/RateConverter.hpp"

// Secondary Adapters
#include "adapters/secondary/memory/InMemoryLedgerStore.hpp"
#include "adapters/secondary/memory/InMemoryAccountRegistry.hpp"
#include "adapters/secondary/postgres/PostgresLedgerStore.hpp"
#include "adapters/secondary/postgres/PostgresAccountRegistry.hpp"
#include "adapters/secondary/prices/JsonFilePriceFeed.hpp"

// Settings
#include "settings/LedgerSettings.hpp"
#include "settings/DbSettings.hpp"

#include <boost/di.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace di = boost::di;

using namespace ledger;

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp()
{
    std::cout << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp()
{
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

int LedgerApp::run(int argc, char* argv[], std::ostream& out)
{
    loadEnvironment(argc, argv);
    configureInjection();
    return handler_->handle(args_, out);
}

void LedgerApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    args_.assign(argv + 1, argv + argc);
    settings_ = std::make_shared<settings::LedgerSettings>();

    const auto storage = settings_->getStorage();
    if (storage == "memory") {
        createMemoryStorage();
    } else if (storage == "postgres") {
        createPostgresStorage();
    } else {
        throw std::invalid_argument("Unknown LEDGER_STORAGE: " + storage);
    }

    std::cout << "[LedgerApp] Environment loaded: storage=" << storage
              << ", base currency=" << settings_->getBaseCurrency() << std::endl;
}

void LedgerApp::createMemoryStorage()
{
    store_ = std::make_shared<adapters::secondary::memory::InMemoryLedgerStore>();
    auto registry = std::make_shared<adapters::secondary::memory::InMemoryAccountRegistry>();

    // "Coinbase:Trading,Ledger Nano:Cold Storage"
    std::istringstream list(settings_->getMemoryAccounts());
    std::string entry;
    while (std::getline(list, entry, ',')) {
        if (entry.empty()) {
            continue;
        }
        domain::Account account;
        auto colon = entry.find(':');
        account.name = entry.substr(0, colon);
        account.category = colon == std::string::npos ? "Uncategorized" : entry.substr(colon + 1);
        account.id = account.name;
        if (!registry->add(account)) {
            std::cerr << "[LedgerApp] Duplicate account skipped: " << account.name << std::endl;
        }
    }

    registry_ = registry;
}

void LedgerApp::createPostgresStorage()
{
    auto db = std::make_shared<settings::DbSettings>();
    store_ = std::make_shared<adapters::secondary::postgres::PostgresLedgerStore>(db);
    registry_ = std::make_shared<adapters::secondary::postgres::PostgresAccountRegistry>(db);
}

void LedgerApp::configureInjection()
{
    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<settings::ILedgerSettings>().to(
            std::static_pointer_cast<settings::ILedgerSettings>(settings_)),

        di::bind<ports::output::ILedgerStore>().to(store_),

        di::bind<ports::output::IAccountRegistry>().to(registry_),

        // IPriceFeed ← JsonFilePriceFeed(ILedgerSettings)
        di::bind<ports::output::IPriceFeed>()
            .to<adapters::secondary::JsonFilePriceFeed>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<application::RateConverter>()
            .in(di::singleton),

        di::bind<ports::input::ICurrencyCatalog>()
            .to<application::CurrencyCatalog>()
            .in(di::singleton),

        // TransactionRecorder использует те же экземпляры напрямую
        di::bind<ports::input::IExchangeRateStore, application::ExchangeRateStore>()
            .to<application::ExchangeRateStore>()
            .in(di::singleton),

        di::bind<ports::input::IHoldingsLedger, application::HoldingsLedger>()
            .to<application::HoldingsLedger>()
            .in(di::singleton),

        di::bind<ports::input::ITransactionRecorder>()
            .to<application::TransactionRecorder>()
            .in(di::singleton),

        di::bind<ports::input::IPortfolioAggregator>()
            .to<application::PortfolioAggregator>()
            .in(di::singleton));

    // ========================================================================
    // Layer 3: Primary Adapter
    // ========================================================================

    handler_ = injector.create<std::shared_ptr<adapters::primary::LedgerCommandHandler>>();

    std::cout << "[LedgerApp] DI configuration completed" << std::endl;
}
