/// @file main.cpp
/// @brief gec_maintenance entry point.
///
/// Hosts an economy engine and runs the inactivity-decay pass every
/// engine.maintenance_interval_s until SIGINT/SIGTERM. With the database
/// enabled, change sets are mirrored to SQL, the schema is created on
/// start-up and persisted state is loaded back before the first pass.
///
///   gec_maintenance [--config <path>] [--once] [--print-schema]

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "gec/foundation/config_manager.hpp"
#include "gec/foundation/game_database.hpp"
#include "gec/foundation/game_logger.hpp"
#include "gec/service/economy_engine.hpp"
#include "gec/service/engine_config.hpp"
#include "gec/service/persistence_sink.hpp"
#include "gec/service/service_runner.hpp"
#include "gec/service/sql_persistence_sink.hpp"
#include "gec/version.hpp"

int main(int argc, char* argv[]) {
    using gec::foundation::LogCategory;

    if (gec::service::hasFlag(argc, argv, "--print-schema")) {
        for (const auto& statement : gec::service::SqlPersistenceSink::schemaStatements()) {
            std::cout << statement << ";\n";
        }
        return EXIT_SUCCESS;
    }

    gec::service::SignalHandler signals;

    auto configPath = gec::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/gec/engine.yaml";
    }

    gec::foundation::ConfigManager config;
    auto loadResult = gec::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto engineConfig = gec::service::EngineConfig::fromConfig(config);
    if (!engineConfig) {
        std::cerr << "Invalid config: " << engineConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& settings = engineConfig.value();
    settings.applyLogging();

    // Persistence: SQL when enabled, otherwise discard.
    gec::foundation::GameDatabase database;
    std::unique_ptr<gec::service::IPersistenceSink> sink;
    if (settings.databaseEnabled) {
        auto connected = database.connect(settings.database);
        if (!connected) {
            std::cerr << "Failed to connect to database: " << connected.error().message() << "\n";
            return EXIT_FAILURE;
        }
        auto sqlSink = std::make_unique<gec::service::SqlPersistenceSink>(database);
        auto schema = sqlSink->createSchema();
        if (!schema) {
            std::cerr << "Failed to create schema: " << schema.error().message() << "\n";
            return EXIT_FAILURE;
        }
        sink = std::move(sqlSink);
    } else {
        sink = std::make_unique<gec::service::NullPersistenceSink>();
    }

    gec::service::EconomyEngine engine(settings, *sink);
    if (settings.catalogPath) {
        auto catalog = engine.catalog().loadFromFile(*settings.catalogPath);
        if (!catalog) {
            std::cerr << "Failed to load catalog: " << catalog.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto snapshot = sink->load();
    if (!snapshot) {
        std::cerr << "Failed to load persisted state: " << snapshot.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto restored = engine.restore(std::move(snapshot.value()));
    if (!restored) {
        std::cerr << "Failed to restore engine: " << restored.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "gec_maintenance " << GEC_VERSION_STRING << " started (items: "
              << engine.catalog().itemCount() << ", interval: "
              << settings.maintenanceInterval.count() << "s)\n";

    const bool once = gec::service::hasFlag(argc, argv, "--once");
    int status = EXIT_SUCCESS;
    do {
        auto report = engine.runMaintenance(engine.players().now());
        if (!report) {
            GEC_LOG_ERROR(LogCategory::Core, "maintenance pass failed: " +
                                                 std::string(report.error().message()));
            status = EXIT_FAILURE;
            if (once) {
                break;
            }
        }
    } while (!once && !signals.waitFor(settings.maintenanceInterval));

    std::cout << "Shutting down gec_maintenance...\n";
    if (auto flushed = gec::foundation::GameLogger::instance().flush(); !flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    database.disconnect();
    return status;
}
