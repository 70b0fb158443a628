#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "kvs/sharded_map.hpp"
#include "metrics/metrics.hpp"
#include "server/constants.hpp"
#include "server/executor.hpp"
#include "server/resp_handler.hpp"
#include "server/server.hpp"
#include "env.hpp"

using namespace server;

int main() {
    try {
        // Threads spawned below inherit the mask, only the signal watcher receives shutdown signals
        blockShutdownSignals();

        ServerSettings serverSettings;
        serverSettings.address = getFromEnv<const char*>("SERVER_ADDRESS", false, "127.0.0.1:6399");
        serverSettings.maxConnections = getFromEnv<int>("MAX_CONNECTIONS", false, 1024);
        serverSettings.timeout = std::chrono::seconds(getFromEnv<int>("SHUTDOWN_TIMEOUT_SEC", false, 10));
        serverSettings.sockBuffer = getFromEnv<int>("SOCK_BUF_SIZE", false, 1048576);

        auto numShards = getFromEnv<int64_t>("NUM_SHARDS", false, 1024);
        auto enableCompression = getFromEnv<bool>("ENABLE_COMPRESSION", false, false);

        kvs::ShardedMap db { numShards };
        CommandExecutor executor { db, enableCompression };
        RespHandler handler { executor, serverSettings.timeout };
        std::cout << "Initialized " << db.getShardCount() << " shards, compression "
                  << (enableCompression ? "enabled" : "disabled") << std::endl;

        std::unique_ptr<metrics::MetricsServer> metricsServer;
        std::jthread metricsUpdaterThread;
        auto metricsPort = getFromEnv<int>("METRICS_PORT", false, 0);
        if (metricsPort > 0) {
            std::string metricsHost = getFromEnv<const char*>("METRICS_HOST", false, "0.0.0.0");
            metricsServer = std::make_unique<metrics::MetricsServer>(metricsHost + ":" + std::to_string(metricsPort));
            metricsUpdaterThread = std::jthread(
                [&handler, &db, &metricsServer](std::stop_token stopToken)
                {
                    std::cout << "Metrics updater thread is running!" << std::endl;
                    while (!stopToken.stop_requested())
                    {
                        metricsServer->UpdateMetrics(handler.getMetrics(), db.len());
                        std::this_thread::sleep_for(METRICS_UPDATE_FREQUENCY_SEC);
                    }
                    std::cout << "Exiting metrics updater thread..." << std::endl;
                }
            );
        }

        return listenAndServeWithSignal(serverSettings, handler) == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Server failed: " << e.what() << std::endl;
        return 1;
    }
}
