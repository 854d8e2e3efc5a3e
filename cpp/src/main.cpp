#include "cardforge/config/AppConfig.hpp"
#include "cardforge/controller/BinController.hpp"
#include "cardforge/controller/CardController.hpp"
#include "cardforge/controller/QuotaController.hpp"
#include "cardforge/controller/RequestGuard.hpp"
#include "cardforge/io/JsonCatalog.hpp"
#include "cardforge/quota/MySqlQuotaStore.hpp"
#include "cardforge/repository/BinStore.hpp"
#include "cardforge/repository/MySqlBinRepository.hpp"
#include "cardforge/repository/MySqlConnectionPool.hpp"
#include "cardforge/server/HttpServer.hpp"
#include "cardforge/server/Router.hpp"
#include "cardforge/service/AdmissionController.hpp"
#include "cardforge/service/BinClassifier.hpp"
#include "cardforge/service/CardService.hpp"
#include "cardforge/service/RiskVerdictProvider.hpp"
#include "cardforge/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {
using namespace cardforge;

void startQuotaPurgeTick(boost::asio::io_context& io, service::AdmissionController& admission) {
    auto timer = std::make_shared<boost::asio::steady_timer>(io);
    auto handler = std::make_shared<std::function<void(const boost::system::error_code&)>>();
    *handler = [timer, &admission, handler](const boost::system::error_code& ec) {
        if (!ec) {
            admission.purgeExpired();
            timer->expires_after(std::chrono::seconds(30));
            timer->async_wait(*handler);
        }
    };
    timer->expires_after(std::chrono::seconds(30));
    timer->async_wait(*handler);
}

} // namespace

int main(int argc, char** argv) {
    using namespace cardforge;
    const std::string configPath = argc > 1 ? argv[1] : "data/cardforge.json";

    util::initLogging(util::LogLevel::info);
    auto appConfig = config::loadAppConfig(configPath);
    util::initLogging(appConfig.logLevel);

    std::unique_ptr<repository::MySqlConnectionPool> connectionPool;
    if (appConfig.storage.backend == "mysql" || appConfig.quotaBackend == "mysql") {
        util::log(util::LogLevel::info, "Connecting MySQL: " + appConfig.database.host + ":" +
                                            std::to_string(appConfig.database.port) + "/" + appConfig.database.database);
        connectionPool = std::make_unique<repository::MySqlConnectionPool>(appConfig.database);
    }

    std::unique_ptr<repository::BinStore> bins;
    std::unique_ptr<repository::BlocklistStore> configuredBlocklist;
    if (appConfig.storage.backend == "mysql") {
        bins = std::make_unique<repository::MySqlBinRepository>(*connectionPool);
        configuredBlocklist = std::make_unique<repository::MySqlBlocklistRepository>(*connectionPool);
    } else {
        bins = std::make_unique<repository::InMemoryBinStore>(io::loadBinCatalog(appConfig.storage.binCatalog));
        configuredBlocklist =
            std::make_unique<repository::InMemoryBlocklist>(io::loadBlocklist(appConfig.storage.blocklist));
    }
    repository::InMemoryBlocklist testRanges{repository::defaultTestRanges()};
    std::vector<std::reference_wrapper<repository::BlocklistStore>> blocklistLayers{testRanges, *configuredBlocklist};
    repository::LayeredBlocklist blocklist{std::move(blocklistLayers)};

    std::unique_ptr<quota::MySqlQuotaStore> sharedQuota;
    std::unique_ptr<service::AdmissionController> admission;
    if (appConfig.quotaBackend == "mysql") {
        sharedQuota = std::make_unique<quota::MySqlQuotaStore>(*connectionPool);
        admission = std::make_unique<service::AdmissionController>(*sharedQuota, appConfig.quota);
    } else {
        admission = std::make_unique<service::AdmissionController>(appConfig.quota);
    }

    service::BinClassifier classifier{*bins, blocklist};
    service::CardService cardService{classifier, appConfig.generation};
    service::PermissiveRiskVerdictProvider riskProvider;
    controller::RequestGuard guard{*admission, riskProvider};

    auto router = std::make_shared<server::Router>();
    controller::BinController binController{classifier, guard};
    binController.registerRoutes(*router);

    controller::CardController cardController{cardService, guard};
    cardController.registerRoutes(*router);

    controller::QuotaController quotaController{*admission};
    quotaController.registerRoutes(*router);

    boost::asio::io_context io;
    server::ServerOptions serverOptions;
    serverOptions.host = appConfig.server.host;
    serverOptions.port = appConfig.server.port;
    serverOptions.bodyLimit = appConfig.server.bodyLimitBytes;
    serverOptions.readTimeout = appConfig.server.readTimeout;
    auto httpServer = std::make_shared<server::HttpServer>(io, router, std::move(serverOptions));
    try {
        httpServer->start();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Server start failed: "} + ex.what());
        return 1;
    }

    startQuotaPurgeTick(io, *admission);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io, httpServer](const boost::system::error_code&, int signal) {
        util::log(util::LogLevel::info, "Received signal " + std::to_string(signal) + ", shutting down");
        httpServer->stop();
        io.stop();
    });

    unsigned int ioThreadsCount = appConfig.server.threads > 0
        ? appConfig.server.threads
        : std::max(2u, std::thread::hardware_concurrency());
    std::vector<std::thread> ioThreads;
    ioThreads.reserve(ioThreadsCount - 1);
    for (unsigned int i = 0; i + 1 < ioThreadsCount; ++i) {
        ioThreads.emplace_back([&io]() { io.run(); });
    }

    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    return 0;
}
