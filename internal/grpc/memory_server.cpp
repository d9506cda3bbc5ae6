#include "memory_server.hpp"

#include "grpc_error.hpp"

namespace projmem::grpc {

MemoryServer::MemoryServer(std::shared_ptr<projmem::service::ProtocolHandler> handler) : handler_(std::move(handler)) {
}

::grpc::Status MemoryServer::Execute(::grpc::ServerContext*, const projmem::v1::OperationRequest* req, projmem::v1::OperationResponse* resp) {
  try {
    *resp = handler_->Handle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace projmem::grpc
