#pragma once

#include <streamrpc/core/admission/method_registry.hpp>
#include <streamrpc/microservice/grpc_gateway.hpp>

#include <grpcpp/generic/async_generic_service.h>

namespace streamrpc::microservice {

/**
 * @brief Callback generic service: creates one reactor per incoming call
 *
 * All three call shapes ride on the generic bidi reactor; the reactor kind
 * decides how many messages are read and written.
 */
class GatewayService : public grpc::CallbackGenericService {
public:
    GatewayService(ServiceHandlers handlers, const StreamRpc::MethodRegistry& registry);

    grpc::ServerGenericBidiReactor* CreateReactor(grpc::GenericCallbackServerContext* ctx) override;

private:
    ServiceHandlers handlers_;
    const StreamRpc::MethodRegistry& registry_;
};

} // namespace streamrpc::microservice
