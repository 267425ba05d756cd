#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "woki/v1/services.grpc.pb.h"
#include "woki/v1.hpp"

using namespace woki::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  wokictl <addr> discover <restaurant> <sector> <date> <party> <minutes> [start|-] [end|-] [limit]\n"
            << "  wokictl <addr> book <idempotency_key> <restaurant> <sector> <date> <party> <minutes> [start|-] [end|-]\n"
            << "  wokictl <addr> cancel <booking_id>\n"
            << "  wokictl <addr> bookings <restaurant> <sector> <date>\n"
            << "  wokictl <addr> blackout <restaurant> <sector> <start_rfc3339> <end_rfc3339> <maintenance|private_event|other> [T1,T2|-] [notes]\n"
            << "  wokictl <addr> blackouts <restaurant> <sector> <date>\n"
            << "  wokictl <addr> unblackout <blackout_id>\n"
            << "  wokictl <addr> metrics\n"
            << "\n"
            << "Times of day are HH:mm in the restaurant timezone, dates are YYYY-MM-DD.\n";
}

static std::string OptionalArg(int argc, char** argv, int index) {
  if (index >= argc) return {};
  std::string value = argv[index];
  return value == "-" ? std::string() : value;
}

static uint32_t ParseCount(const char* value, const char* what) {
  try {
    const auto parsed = std::stoul(value);
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    std::cerr << "invalid " << what << ": " << value << "\n";
    std::exit(1);
  }
}

static google::protobuf::Timestamp ParseTimestamp(const std::string& value) {
  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(value, &ts)) {
    std::cerr << "invalid timestamp (want RFC 3339, e.g. 2025-10-22T20:00:00Z): " << value << "\n";
    std::exit(1);
  }
  return ts;
}

static std::optional<BlackoutReason> ParseReason(const std::string& value) {
  if (value == "maintenance") {
    return BLACKOUT_REASON_MAINTENANCE;
  }
  if (value == "private_event") {
    return BLACKOUT_REASON_PRIVATE_EVENT;
  }
  if (value == "other") {
    return BLACKOUT_REASON_OTHER;
  }
  return std::nullopt;
}

static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  std::string json;
  const auto  converted = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!converted.ok()) {
    std::cerr << "cannot render response: " << converted.ToString() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto booking_stub  = BookingService::NewStub(channel);
  auto blackout_stub = BlackoutService::NewStub(channel);
  auto admin_stub    = AdminService::NewStub(channel);

  grpc::ClientContext ctx;
  if (const char* request_id = std::getenv("WOKI_REQUEST_ID")) {
    ctx.AddMetadata("x-request-id", request_id);
  }

  // ------------------------------------------------------------

  if (cmd == "discover") {
    if (argc < 8) {
      Usage();
      return 1;
    }

    DiscoverSeatsRequest req;
    req.set_restaurant_id(argv[3]);
    req.set_sector_id(argv[4]);
    req.set_date(argv[5]);
    req.set_party_size(ParseCount(argv[6], "party size"));
    req.set_duration_minutes(ParseCount(argv[7], "duration"));
    req.mutable_window()->set_start(OptionalArg(argc, argv, 8));
    req.mutable_window()->set_end(OptionalArg(argc, argv, 9));
    if (argc >= 11) {
      req.set_limit(ParseCount(argv[10], "limit"));
    }

    DiscoverSeatsResponse resp;
    return Print(booking_stub->Discover(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "book") {
    if (argc < 9) {
      Usage();
      return 1;
    }

    CreateBookingRequest req;
    req.set_idempotency_key(argv[3]);
    req.set_restaurant_id(argv[4]);
    req.set_sector_id(argv[5]);
    req.set_date(argv[6]);
    req.set_party_size(ParseCount(argv[7], "party size"));
    req.set_duration_minutes(ParseCount(argv[8], "duration"));
    req.mutable_window()->set_start(OptionalArg(argc, argv, 9));
    req.mutable_window()->set_end(OptionalArg(argc, argv, 10));

    CreateBookingResponse resp;
    return Print(booking_stub->CreateBooking(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    CancelBookingRequest req;
    req.set_id(argv[3]);

    google::protobuf::Empty resp;
    auto status = booking_stub->CancelBooking(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    std::cout << "cancelled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "bookings") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    ListBookingsRequest req;
    req.set_restaurant_id(argv[3]);
    req.set_sector_id(argv[4]);
    req.set_date(argv[5]);

    ListBookingsResponse resp;
    return Print(booking_stub->ListBookings(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "blackout") {
    if (argc < 8) {
      Usage();
      return 1;
    }

    auto reason = ParseReason(argv[7]);
    if (!reason) {
      std::cerr << "unsupported reason: " << argv[7] << "\n";
      return 1;
    }

    CreateBlackoutRequest req;
    req.set_restaurant_id(argv[3]);
    req.set_sector_id(argv[4]);
    *req.mutable_start() = ParseTimestamp(argv[5]);
    *req.mutable_end()   = ParseTimestamp(argv[6]);
    req.set_reason(*reason);

    std::stringstream tables(OptionalArg(argc, argv, 8));
    std::string       table;
    while (std::getline(tables, table, ',')) {
      if (!table.empty()) req.add_table_ids(table);
    }
    req.set_notes(OptionalArg(argc, argv, 9));

    CreateBlackoutResponse resp;
    return Print(blackout_stub->CreateBlackout(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "blackouts") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    ListBlackoutsRequest req;
    req.set_restaurant_id(argv[3]);
    req.set_sector_id(argv[4]);
    req.set_date(argv[5]);

    ListBlackoutsResponse resp;
    return Print(blackout_stub->ListBlackouts(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "unblackout") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    DeleteBlackoutRequest req;
    req.set_id(argv[3]);

    google::protobuf::Empty resp;
    auto status = blackout_stub->DeleteBlackout(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "metrics") {
    GetMetricsRequest req;
    GetMetricsResponse resp;
    return Print(admin_stub->GetMetrics(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
