#ifndef CUTOUT_ROUTES_HPP
#define CUTOUT_ROUTES_HPP

#include <string>

#include "cutout/WorkerPool.hpp"
#include "Pipeline.hpp"
#include "ServiceConfig.hpp"

namespace httplib {
class Server;
}

namespace cutout {

/**
 * @brief Everything a request handler needs, owned by main()
 */
struct ServiceContext {
    const ServiceConfig& config;
    const Pipeline& pipeline;
    WorkerPool& pool;
    std::string model_name;
};

/**
 * @brief Register all routes with the HTTP server
 */
void register_routes(httplib::Server& server, ServiceContext& context);

} // namespace cutout

#endif // CUTOUT_ROUTES_HPP
