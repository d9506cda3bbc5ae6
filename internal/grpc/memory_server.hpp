#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "projmem/v1/memory_service.grpc.pb.h"
#include "internal/service/protocol_handler.hpp"

namespace projmem::grpc {

class MemoryServer final : public projmem::v1::ProjectMemoryService::Service {
public:
  explicit MemoryServer(std::shared_ptr<projmem::service::ProtocolHandler> handler);

  ::grpc::Status Execute(::grpc::ServerContext*,
                         const projmem::v1::OperationRequest*,
                         projmem::v1::OperationResponse*) override;

private:
  std::shared_ptr<projmem::service::ProtocolHandler> handler_;
};

}
