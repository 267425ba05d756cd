#include "proto_mapping.hpp"

#include "internal/util/time.hpp"

namespace woki::service {

using namespace woki::v1;

namespace {

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  return util::ToProto(util::FromUnixMillis(ms));
}

} // namespace

woki::v1::Candidate ToProto(const woki::model::Candidate& candidate) {
  woki::v1::Candidate out;
  out.set_kind(candidate.kind == woki::model::CandidateKind::kSingle ? CANDIDATE_KIND_SINGLE : CANDIDATE_KIND_COMBO);
  for (const auto& id : candidate.table_ids) {
    out.add_table_ids(id);
  }
  *out.mutable_start() = util::ToProto(candidate.interval.start);
  *out.mutable_end()   = util::ToProto(candidate.interval.end);
  out.set_min_capacity(candidate.min_capacity);
  out.set_max_capacity(candidate.max_capacity);
  return out;
}

woki::v1::Booking ToProto(const db::model::BookingRecord& booking) {
  woki::v1::Booking out;
  out.set_id(booking.id);
  out.set_restaurant_id(booking.restaurant_id);
  out.set_sector_id(booking.sector_id);
  for (const auto& id : booking.table_ids) {
    out.add_table_ids(id);
  }
  out.set_party_size(booking.party_size);
  *out.mutable_start() = MillisToProto(booking.start_ms);
  *out.mutable_end()   = MillisToProto(booking.end_ms);
  out.set_duration_minutes(booking.duration_minutes);
  out.set_status(ToProto(booking.status));
  *out.mutable_created_at() = MillisToProto(booking.created_at_ms);
  *out.mutable_updated_at() = MillisToProto(booking.updated_at_ms);
  return out;
}

woki::v1::Blackout ToProto(const db::model::BlackoutRecord& blackout) {
  woki::v1::Blackout out;
  out.set_id(blackout.id);
  out.set_restaurant_id(blackout.restaurant_id);
  out.set_sector_id(blackout.sector_id);
  for (const auto& id : blackout.table_ids) {
    out.add_table_ids(id);
  }
  *out.mutable_start() = MillisToProto(blackout.start_ms);
  *out.mutable_end()   = MillisToProto(blackout.end_ms);
  out.set_reason(ToProto(blackout.reason));
  out.set_notes(blackout.notes);
  *out.mutable_created_at() = MillisToProto(blackout.created_at_ms);
  *out.mutable_updated_at() = MillisToProto(blackout.updated_at_ms);
  return out;
}

woki::v1::BookingStatus ToProto(woki::model::BookingStatus status) {
  switch (status) {
    case woki::model::BookingStatus::kConfirmed:
      return BOOKING_STATUS_CONFIRMED;
    case woki::model::BookingStatus::kCancelled:
      return BOOKING_STATUS_CANCELLED;
    default:
      return BOOKING_STATUS_UNSPECIFIED;
  }
}

woki::v1::BlackoutReason ToProto(db::model::BlackoutReason reason) {
  switch (reason) {
    case db::model::BlackoutReason::kMaintenance:
      return BLACKOUT_REASON_MAINTENANCE;
    case db::model::BlackoutReason::kPrivateEvent:
      return BLACKOUT_REASON_PRIVATE_EVENT;
    case db::model::BlackoutReason::kOther:
      return BLACKOUT_REASON_OTHER;
    default:
      return BLACKOUT_REASON_UNSPECIFIED;
  }
}

db::model::BlackoutReason FromProto(woki::v1::BlackoutReason reason) {
  switch (reason) {
    case BLACKOUT_REASON_MAINTENANCE:
      return db::model::BlackoutReason::kMaintenance;
    case BLACKOUT_REASON_PRIVATE_EVENT:
      return db::model::BlackoutReason::kPrivateEvent;
    case BLACKOUT_REASON_OTHER:
      return db::model::BlackoutReason::kOther;
    default:
      return db::model::BlackoutReason::kUnspecified;
  }
}

} // namespace woki::service
