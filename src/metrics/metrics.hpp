#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <prometheus/exposer.h>
#include <prometheus/registry.h>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include "../server/resp_handler.hpp"

namespace metrics
{
    using namespace prometheus;

    class MetricsServer {
        private:
            std::string metrics_url;
            std::shared_ptr<Registry> registry;
            std::shared_ptr<Exposer> server;

            Gauge* server_num_active_connections = nullptr;
            Gauge* server_num_keys = nullptr;
            Counter* server_num_requests_total = nullptr;
            Counter* server_num_errors_total = nullptr;

            void RegisterMetrics();

        public:
            /// @param metrics_url host:port the exposer binds to
            MetricsServer(std::string metrics_url);

            /// @brief Publishes a snapshot, counters only move forward
            void UpdateMetrics(const server::HandlerMetrics& handlerMetrics, int64_t numKeys);
    };
}
