#include "ExecDbApp.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/TraderSettings.hpp"
#include "settings/DatabaseSettings.hpp"

// Application
#include "application/ExecutionDatabase.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/PostgresRecordStore.hpp"
#include "adapters/secondary/serialization/JsonCommandSerializer.hpp"
#include "adapters/secondary/serialization/JsonEventSerializer.hpp"

#include <iostream>

namespace di = boost::di;

// ============================================================================
// ExecDbApp Implementation
// ============================================================================

ExecDbApp::ExecDbApp()
{
    std::cout << "[ExecDbApp] Application created" << std::endl;
}

ExecDbApp::~ExecDbApp()
{
    std::cout << "[ExecDbApp] Application destroyed" << std::endl;
}

int ExecDbApp::run()
{
    configureInjection();
    return warmUp();
}

void ExecDbApp::stop()
{
    stopRequested_ = true;
}

bool ExecDbApp::stopped() const
{
    if (stopRequested_)
    {
        std::cout << "[ExecDbApp] Stop requested, warm-up interrupted" << std::endl;
    }
    return stopRequested_;
}

void ExecDbApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[ExecDbApp] Configuring Boost.DI injection..." << std::endl;

    auto traderSettings = std::make_shared<execdb::settings::TraderSettings>();
    databaseSettings_ = std::make_shared<execdb::settings::DatabaseSettings>();

    // ========================================================================
    // Boost.DI Injector Configuration
    // ========================================================================

    auto injector = di::make_injector(

        // ====================================================================
        // Settings (читаются из ENV)
        // ====================================================================

        di::bind<execdb::settings::DbSettings>()
            .to<execdb::settings::DbSettings>()
            .in(di::singleton),

        di::bind<execdb::domain::TraderId>()
            .to(traderSettings->getTraderId()),

        // ====================================================================
        // Secondary Adapters (Output Ports implementations)
        // ====================================================================

        // IRecordStore ← PostgresRecordStore(DbSettings)
        di::bind<execdb::ports::output::IRecordStore>()
            .to<execdb::adapters::secondary::PostgresRecordStore>()
            .in(di::singleton),

        di::bind<execdb::ports::output::ICommandSerializer>()
            .to<execdb::adapters::secondary::JsonCommandSerializer>()
            .in(di::singleton),

        di::bind<execdb::ports::output::IEventSerializer>()
            .to<execdb::adapters::secondary::JsonEventSerializer>()
            .in(di::singleton),

        // ====================================================================
        // Input Port ← Application
        // ====================================================================

        di::bind<execdb::ports::input::IExecutionDatabase>()
            .to<execdb::application::ExecutionDatabase>()
            .in(di::singleton)
    );

    database_ = injector.create<std::shared_ptr<execdb::ports::input::IExecutionDatabase>>();

    std::cout << "[ExecDbApp] Injection configured for trader "
              << traderSettings->getTraderId().value() << std::endl;
}

int ExecDbApp::warmUp()
{
    if (databaseSettings_->getFlushOnStart())
    {
        std::cout << "[ExecDbApp] Flushing trader namespace..." << std::endl;
        database_->flush();
    }
    if (stopped()) return 0;

    if (databaseSettings_->getLoadCaches())
    {
        auto accounts = database_->loadAccounts();
        if (stopped()) return 0;
        auto orders = database_->loadOrders();
        if (stopped()) return 0;
        auto positions = database_->loadPositions();

        std::cout << "[ExecDbApp] Cache warmed: "
                  << accounts.size() << " account(s), "
                  << orders.size() << " order(s), "
                  << positions.size() << " position(s)" << std::endl;
    }
    if (stopped()) return 0;

    if (!databaseSettings_->getCheckResiduals())
    {
        return 0;
    }

    auto report = database_->checkResiduals();
    if (report.clean())
    {
        std::cout << "[ExecDbApp] No residual state" << std::endl;
        return 0;
    }

    std::cerr << "[ExecDbApp] Residual state found: "
              << report.workingOrders.size() << " working order(s), "
              << report.openPositions.size() << " open position(s), "
              << report.brokenReferences.size() << " broken reference(s), "
              << report.errors.size() << " error(s)" << std::endl;
    return 2;
}

void ExecDbApp::printStartupBanner()
{
    std::cout << R"(
    ╔══════════════════════════════════════════════════════════════╗
    ║                 EXECUTION DATABASE WARM-UP                   ║
    ╠══════════════════════════════════════════════════════════════╣
    ║  Store:    PostgreSQL (libpqxx)                              ║
    ║  Codecs:   JSON (nlohmann::json)                             ║
    ║  DI:       Boost.DI                                          ║
    ╚══════════════════════════════════════════════════════════════╝
    )" << std::endl;
}
