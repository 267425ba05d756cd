#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace woki::core {

struct CreateBlackoutCommand {
  std::string                   restaurant_id;
  std::string                   sector_id;
  std::vector<std::string>      table_ids;  // empty = whole sector
  util::TimePoint               start;
  util::TimePoint               end;
  db::model::BlackoutReason     reason = db::model::BlackoutReason::kUnspecified;
  std::string                   notes;
  std::string                   request_id;
};

struct CreateBlackoutResult {
  db::model::BlackoutRecord blackout;
  std::vector<std::string>  cancelled_booking_ids;
};

/*
  Declared unavailability of tables or a whole sector.

  Creating a blackout cancels, in the same transaction, every confirmed
  booking it overlaps on an affected table.
*/
class BlackoutManager {
 public:
  explicit BlackoutManager(std::shared_ptr<db::Repository> repository, int max_commit_attempts = 3);

  CreateBlackoutResult CreateBlackout(const CreateBlackoutCommand& command);

  // Overlapping the restaurant-local day, ordered by start.
  std::vector<db::model::BlackoutRecord> ListBlackouts(const std::string& restaurant_id, const std::string& sector_id, const std::string& date);

  // NotFound when unknown.
  void DeleteBlackout(const std::string& blackout_id, const std::string& request_id = {});

 private:
  std::shared_ptr<db::Repository> repository_;
  int                             max_commit_attempts_;
};

} // namespace woki::core
