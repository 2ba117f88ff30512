#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/artscan_client.h"
#include "internal/model/enums.hpp"

namespace {

// Smallest valid PNG signature plus IHDR chunk header; enough for the
// server's format sniffing and the fake embedding model.
std::string TinyPng(char salt) {
  std::string png("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16);
  png.append(16, salt);
  return png;
}

} // namespace

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  artscan::client::ArtScanClient client(::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials()));

  // Register a museum, then scan twice from inside its geofence. The first
  // scan catalogs the unknown piece, the second one recognizes it.
  auto museum = client.CreateMuseum("Example Gallery", 48.8606, 2.3376, 200.0);
  if (!museum.ok()) {
    std::cerr << "CreateMuseum failed: " << museum.status().ToString() << '\n';
    return 1;
  }

  const auto image = TinyPng('a');
  for (int round = 1; round <= 2; ++round) {
    auto scan = client.SubmitScan(image, 48.8607, 2.3377, "example-user");
    if (!scan.ok()) {
      std::cerr << "SubmitScan failed: " << scan.status().ToString() << '\n';
      return 1;
    }
    const auto& result = scan.ValueOrDie();
    std::cout << "scan " << round << ": status=" << artscan::model::ToString(result.status()) << " artwork=" << result.artwork().id()
              << " cataloged=" << (result.cataloged() ? "true" : "false") << '\n';
  }

  auto history = client.ListScans("example-user", 10);
  if (!history.ok()) {
    std::cerr << "ListScans failed: " << history.status().ToString() << '\n';
    return 1;
  }
  std::cout << "history entries=" << history.ValueOrDie().events_size() << '\n';
  return 0;
}
