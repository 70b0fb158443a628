#include "metrics.hpp"
#include <iostream>

using namespace metrics;

void MetricsServer::RegisterMetrics()
{
    server_num_errors_total = &BuildCounter()
                        .Name("server_num_errors_total")
                        .Help("Total number of error replies")
                        .Register(*registry)
                        .Add({});

    server_num_active_connections = &BuildGauge()
                        .Name("server_num_active_connections")
                        .Help("Number of active connections")
                        .Register(*registry)
                        .Add({});

    server_num_keys = &BuildGauge()
                        .Name("server_num_keys")
                        .Help("Number of stored keys")
                        .Register(*registry)
                        .Add({});

    server_num_requests_total = &BuildCounter()
                        .Name("server_num_requests_total")
                        .Help("Total number of server requests")
                        .Register(*registry)
                        .Add({});
}

MetricsServer::MetricsServer(std::string metrics_url): metrics_url(std::move(metrics_url))
{
    registry = std::make_shared<Registry>();
    server = std::make_shared<Exposer>(this->metrics_url);
    RegisterMetrics();
    server->RegisterCollectable(registry);
    std::cout << "Metrics server started on " << this->metrics_url << std::endl;
}

void MetricsServer::UpdateMetrics(const server::HandlerMetrics& handlerMetrics, int64_t numKeys)
{
    server_num_active_connections->Set(handlerMetrics.numActiveConnections);
    server_num_keys->Set(static_cast<double>(numKeys));

    auto numErrorsInc = static_cast<double>(handlerMetrics.numErrors) - server_num_errors_total->Value();
    if (numErrorsInc > 0) {
        server_num_errors_total->Increment(numErrorsInc);
    }

    auto numRequestsInc = static_cast<double>(handlerMetrics.numRequests) - server_num_requests_total->Value();
    if (numRequestsInc > 0) {
        server_num_requests_total->Increment(numRequestsInc);
    }
}
