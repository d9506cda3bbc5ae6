#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "client/cpp/memory_client.h"
#include "internal/service/operation_error.hpp"
#include "internal/service/operation_names.hpp"
#include "internal/util/errors.hpp"

using namespace projmem::v1;
using projmem::client::MemoryClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  memoryctl <addr> remember <decision> <rationale> [context] [alternatives]\n"
            << "  memoryctl <addr> recall [keyword] [limit]\n"
            << "  memoryctl <addr> pattern <name> <description> [example] [when_to_use]\n"
            << "  memoryctl <addr> patterns\n"
            << "  memoryctl <addr> set <key> <value>\n"
            << "  memoryctl <addr> context\n"
            << "  memoryctl <addr> stats\n"
            << "  memoryctl <addr> export [file]\n"
            << "  memoryctl <addr> import <file>\n"
            << "  memoryctl <addr> health\n"
            << "  memoryctl <addr> purge <CONFIRM_PURGE>\n"
            << "  memoryctl <addr> call <operation> [json-args]\n"
            << "\nExit codes: 0 ok, 1 usage, 2 transport failure, 3 operation rejected\n";
}

static std::string Arg(int argc, char** argv, int idx) {
  return idx < argc ? argv[idx] : std::string();
}

static void PrintJson(const google::protobuf::Message& msg) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(msg, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot print response: " + std::string(status.message()));
  }
  std::cout << out;
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

static int Run(const MemoryClient& client, const std::string& cmd, int argc, char** argv) {
  if (cmd == "remember") {
    if (argc < 5) return 1;
    PrintJson(client.RememberDecision(argv[3], argv[4], Arg(argc, argv, 5), Arg(argc, argv, 6)));
    return 0;
  }

  if (cmd == "recall") {
    const auto limit = argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 0u;
    PrintJson(client.RecallDecisions(Arg(argc, argv, 3), limit));
    return 0;
  }

  if (cmd == "pattern") {
    if (argc < 5) return 1;
    PrintJson(client.StorePattern(argv[3], argv[4], Arg(argc, argv, 5), Arg(argc, argv, 6)));
    return 0;
  }

  if (cmd == "patterns") {
    PrintJson(client.GetPatterns());
    return 0;
  }

  if (cmd == "set") {
    if (argc < 5) return 1;
    PrintJson(client.SetContext(argv[3], argv[4]));
    return 0;
  }

  if (cmd == "context") {
    PrintJson(client.GetContext());
    return 0;
  }

  if (cmd == "stats") {
    PrintJson(client.Stats());
    return 0;
  }

  if (cmd == "export") {
    auto result = client.Export();
    if (argc >= 4) {
      std::ofstream out(argv[3], std::ios::binary | std::ios::trunc);
      if (!out) throw std::runtime_error(std::string("cannot write ") + argv[3]);
      out << result.json();
      std::cout << "exported " << result.snapshot().stats().decisions() << " decisions to " << argv[3] << "\n";
    } else {
      std::cout << result.json();
    }
    return 0;
  }

  if (cmd == "import") {
    if (argc < 4) return 1;
    PrintJson(client.Import(ReadFile(argv[3])));
    return 0;
  }

  if (cmd == "health") {
    PrintJson(client.Health());
    return 0;
  }

  if (cmd == "purge") {
    PrintJson(client.Purge(Arg(argc, argv, 3)));
    return 0;
  }

  if (cmd == "call") {
    if (argc < 4) return 1;
    const auto op = projmem::service::OperationFromName(argv[3]);
    if (!op) {
      std::cerr << "unknown operation: " << argv[3] << "\n";
      return 1;
    }
    auto response = client.Execute(projmem::service::BuildRequest(*op, Arg(argc, argv, 4)));
    PrintJson(response);
    return response.has_error() ? 3 : 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  MemoryClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  try {
    const int rc = Run(client, cmd, argc, argv);
    if (rc == 1) Usage();
    return rc;
  } catch (const projmem::client::OperationFailed& e) {
    std::cerr << projmem::service::ErrorKindName(e.error().kind()) << ": " << e.what();
    if (e.error().kind() == ERROR_KIND_RATE_LIMIT_EXCEEDED) {
      std::cerr << " (retry after " << e.error().retry_after_ms() << "ms)";
    }
    std::cerr << "\n";
    return 3;
  } catch (const projmem::client::TransportError& e) {
    std::cerr << e.what() << "\n";
    return 2;
  } catch (const projmem::util::ValidationError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
}
