#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/memory_client.h"

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:50061";

  projmem::client::MemoryClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  try {
    // Record a decision plus the context it was made in, then read both back.
    const auto remembered = client.RememberDecision("Store project memory in SQLite", "single file, survives restarts, no server to run",
                                                    "persistence layer", "flat JSON files");
    std::cout << "Remembered decision id=" << remembered.id() << '\n';

    client.SetContext("tech_stack", "C++20, gRPC, SQLite");

    const auto recalled = client.RecallDecisions("sqlite", 5);
    for (const auto& d : recalled.decisions()) {
      std::cout << "[" << d.timestamp() << "] " << d.decision() << " -- " << d.rationale() << '\n';
    }

    for (const auto& [key, value] : client.GetContext().context()) {
      std::cout << key << " = " << value << '\n';
    }

    const auto stats = client.Stats();
    std::cout << "decisions=" << stats.decisions() << "/" << stats.limits().max_decisions() << " patterns=" << stats.patterns()
              << " context=" << stats.context_keys() << " bytes=" << stats.approximate_size_bytes() << '\n';
  } catch (const projmem::client::OperationFailed& e) {
    std::cerr << "Operation rejected: " << e.what() << '\n';
    return 1;
  } catch (const projmem::client::TransportError& e) {
    std::cerr << "RPC failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
