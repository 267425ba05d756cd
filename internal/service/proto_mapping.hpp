#pragma once

#include "internal/db/model/blackout_record.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/model/candidate.hpp"
#include "woki/v1.hpp"

namespace woki::service {

// Internal records <-> wire messages.

woki::v1::Candidate ToProto(const woki::model::Candidate& candidate);
woki::v1::Booking   ToProto(const db::model::BookingRecord& booking);
woki::v1::Blackout  ToProto(const db::model::BlackoutRecord& blackout);

woki::v1::BookingStatus  ToProto(woki::model::BookingStatus status);
woki::v1::BlackoutReason ToProto(db::model::BlackoutReason reason);

// Unknown wire values map to kUnspecified and are rejected downstream.
db::model::BlackoutReason FromProto(woki::v1::BlackoutReason reason);

} // namespace woki::service
