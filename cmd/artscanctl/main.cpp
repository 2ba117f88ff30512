#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

#include "artscan/v1.hpp"
#include "internal/model/enums.hpp"

using namespace artscan::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  artscanctl <addr> scan <image_path> <lat> <lon> [user_id]\n"
            << "  artscanctl <addr> report <artwork_id> <wrong_title|wrong_artist|not_artwork> [user_id] [note]\n"
            << "  artscanctl <addr> add-museum <name> <lat> <lon> [radius_m]\n"
            << "  artscanctl <addr> museums\n"
            << "  artscanctl <addr> add-artwork <title> <artist> <image_path> [museum_id] [source=admin|museum_api]\n"
            << "  artscanctl <addr> artwork <id>\n"
            << "  artscanctl <addr> issues [open|resolved|dismissed]\n"
            << "  artscanctl <addr> resolve <report_id> <dismiss|apply_correction|delete_artwork|verify> [title] [artist]\n"
            << "  artscanctl <addr> scans <user_id> [limit]\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot open " << path << "\n";
    std::exit(1);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                               out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    return message.ShortDebugString();
  }
  return out;
}

static int Fail(const ::grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = ::grpc::CreateChannel(addr, ::grpc::InsecureChannelCredentials());

  auto scan_stub  = ScanService::NewStub(channel);
  auto admin_stub = CatalogAdminService::NewStub(channel);

  ::grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "scan") {
    if (argc < 6) return 1;

    SubmitScanRequest req;
    req.set_image(ReadFile(argv[3]));
    req.set_latitude(std::stod(argv[4]));
    req.set_longitude(std::stod(argv[5]));
    if (argc >= 7) req.set_user_id(argv[6]);

    SubmitScanResponse resp;
    auto               status = scan_stub->SubmitScan(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << artscan::model::ToString(resp.status()) << " cataloged=" << (resp.cataloged() ? "true" : "false");
    if (resp.has_distance()) std::cout << " distance=" << resp.distance();
    std::cout << "\n";
    if (resp.has_artwork()) std::cout << ToJson(resp.artwork());
    if (!resp.message().empty()) std::cout << resp.message() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "report") {
    if (argc < 5) return 1;

    auto kind = artscan::model::ParseIssueKind(argv[4]);
    if (!kind) {
      std::cerr << "unsupported issue kind: " << argv[4] << "\n";
      return 1;
    }

    ReportIssueRequest req;
    req.set_artwork_id(std::stoll(argv[3]));
    req.set_kind(*kind);
    if (argc >= 6) req.set_user_id(argv[5]);
    if (argc >= 7) req.set_note(argv[6]);

    ReportIssueResponse resp;
    auto                status = scan_stub->ReportIssue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "report=" << resp.report().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-museum") {
    if (argc < 6) return 1;

    CreateMuseumRequest req;
    req.set_name(argv[3]);
    req.mutable_location()->set_latitude(std::stod(argv[4]));
    req.mutable_location()->set_longitude(std::stod(argv[5]));
    if (argc >= 7) req.set_geofence_radius_meters(std::stod(argv[6]));

    CreateMuseumResponse resp;
    auto                 status = admin_stub->CreateMuseum(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "museum=" << resp.museum().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "museums") {
    ListMuseumsResponse resp;
    auto                status = admin_stub->ListMuseums(&ctx, ListMuseumsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& museum : resp.museums()) {
      std::cout << museum.id() << "\t" << museum.name() << "\t" << museum.location().latitude() << "," << museum.location().longitude()
                << "\t" << museum.geofence_radius_meters() << "m\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-artwork") {
    if (argc < 6) return 1;

    CreateArtworkRequest req;
    req.set_title(argv[3]);
    req.set_artist(argv[4]);
    req.set_image(ReadFile(argv[5]));
    if (argc >= 7) req.set_museum_id(std::stoll(argv[6]));

    req.set_source(ARTWORK_SOURCE_ADMIN);
    if (argc >= 8) {
      auto source = artscan::model::ParseArtworkSource(argv[7]);
      if (!source) {
        std::cerr << "unsupported source: " << argv[7] << "\n";
        return 1;
      }
      req.set_source(*source);
    }

    CreateArtworkResponse resp;
    auto                  status = admin_stub->CreateArtwork(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "artwork=" << resp.artwork().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "artwork") {
    if (argc < 4) return 1;

    GetArtworkRequest req;
    req.set_id(std::stoll(argv[3]));

    GetArtworkResponse resp;
    auto               status = admin_stub->GetArtwork(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp.artwork());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "issues") {
    ListIssuesRequest req;
    if (argc >= 4) {
      auto state = artscan::model::ParseIssueState(argv[3]);
      if (!state) {
        std::cerr << "unsupported state: " << argv[3] << "\n";
        return 1;
      }
      req.set_state(*state);
    }

    ListIssuesResponse resp;
    auto               status = admin_stub->ListIssues(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& report : resp.reports()) {
      std::cout << report.id() << "\tartwork=" << report.artwork_id() << "\t" << artscan::model::ToString(report.kind()) << "\t"
                << artscan::model::ToString(report.state()) << "\t" << report.note() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resolve") {
    if (argc < 5) return 1;

    auto outcome = artscan::model::ParseResolveOutcome(argv[4]);
    if (!outcome) {
      std::cerr << "unsupported outcome: " << argv[4] << "\n";
      return 1;
    }

    ResolveIssueRequest req;
    req.set_report_id(std::stoll(argv[3]));
    req.set_outcome(*outcome);
    if (argc >= 6 && argv[5][0] != '\0') req.mutable_correction()->set_title(argv[5]);
    if (argc >= 7 && argv[6][0] != '\0') req.mutable_correction()->set_artist(argv[6]);

    ResolveIssueResponse resp;
    auto                 status = admin_stub->ResolveIssue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "state=" << artscan::model::ToString(resp.report().state()) << (resp.artwork_deleted() ? " artwork_deleted" : "") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scans") {
    if (argc < 4) return 1;

    ListScansRequest req;
    req.set_user_id(argv[3]);
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    ListScansResponse resp;
    auto              status = admin_stub->ListScans(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.id() << "\t" << event.timestamp().seconds() << "\t" << artscan::model::ToString(event.status()) << "\t"
                << (event.has_artwork_id() ? std::to_string(event.artwork_id()) : "-") << "\t" << event.image_url() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
