#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "projmem/v1.hpp"
#include "projmem/v1/memory_service.grpc.pb.h"

namespace projmem::client {

// The RPC itself failed (server down, deadline, ...).
class TransportError : public std::runtime_error {
 public:
  TransportError(::grpc::StatusCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ::grpc::StatusCode code() const {
    return code_;
  }

 private:
  ::grpc::StatusCode code_;
};

// The RPC succeeded but the operation was rejected.
class OperationFailed : public std::runtime_error {
 public:
  explicit OperationFailed(projmem::v1::OperationError error) : std::runtime_error(error.message()), error_(std::move(error)) {
  }

  const projmem::v1::OperationError& error() const {
    return error_;
  }

 private:
  projmem::v1::OperationError error_;
};

class MemoryClient {
 public:
  explicit MemoryClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline = std::chrono::seconds(10));

  // Raw envelope; errors stay in-band. Throws TransportError.
  projmem::v1::OperationResponse Execute(const projmem::v1::OperationRequest& request) const;

  // Typed helpers throw OperationFailed for in-band errors.
  projmem::v1::RememberDecisionResult RememberDecision(const std::string& decision, const std::string& rationale, const std::string& context = {},
                                                       const std::string& alternatives = {}) const;

  projmem::v1::RecallDecisionsResult RecallDecisions(const std::string& keyword = {}, uint32_t limit = 0) const;

  projmem::v1::StorePatternResult StorePattern(const std::string& name, const std::string& description, const std::string& example = {},
                                               const std::string& when_to_use = {}) const;

  projmem::v1::GetPatternsResult GetPatterns() const;

  projmem::v1::SetContextResult SetContext(const std::string& key, const std::string& value) const;

  projmem::v1::GetContextResult GetContext() const;

  projmem::v1::MemoryStats Stats() const;

  projmem::v1::ExportMemoryResult Export() const;

  projmem::v1::ImportSummary Import(const std::string& json) const;

  projmem::v1::HealthReport Health() const;

  projmem::v1::PurgeSummary Purge(const std::string& confirm) const;

 private:
  projmem::v1::OperationResponse Checked(const projmem::v1::OperationRequest& request) const;

  std::unique_ptr<projmem::v1::ProjectMemoryService::Stub> stub_;
  std::chrono::milliseconds                                deadline_;
};

} // namespace projmem::client
