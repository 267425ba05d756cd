#include "blackout_service.hpp"

#include "internal/core/blackout_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "proto_mapping.hpp"

namespace woki::service {

using namespace woki::v1;

BlackoutService::BlackoutService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateBlackoutResponse BlackoutService::CreateBlackout(const CreateBlackoutRequest& req, const std::string& request_id) {
  if (!req.has_start() || !req.has_end()) {
    throw util::InvalidInput("blackout start and end are required");
  }

  core::CreateBlackoutCommand command;
  command.restaurant_id = req.restaurant_id();
  command.sector_id     = req.sector_id();
  command.table_ids.assign(req.table_ids().begin(), req.table_ids().end());
  command.start      = util::FromProto(req.start());
  command.end        = util::FromProto(req.end());
  command.reason     = FromProto(req.reason());
  command.notes      = req.notes();
  command.request_id = request_id;

  const auto result = ctx_.blackouts->CreateBlackout(command);

  CreateBlackoutResponse resp;
  *resp.mutable_blackout() = ToProto(result.blackout);
  for (const auto& id : result.cancelled_booking_ids) {
    resp.add_cancelled_booking_ids(id);
  }
  return resp;
}

ListBlackoutsResponse BlackoutService::ListBlackouts(const ListBlackoutsRequest& req) {
  ListBlackoutsResponse resp;
  resp.set_date(req.date());
  for (const auto& blackout : ctx_.blackouts->ListBlackouts(req.restaurant_id(), req.sector_id(), req.date())) {
    *resp.add_items() = ToProto(blackout);
  }
  return resp;
}

void BlackoutService::DeleteBlackout(const DeleteBlackoutRequest& req, const std::string& request_id) {
  ctx_.blackouts->DeleteBlackout(req.id(), request_id);
}

} // namespace woki::service
