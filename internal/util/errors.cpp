#include "errors.hpp"

namespace woki::util {

std::string_view ErrorCodeName(const std::exception& e) {
  if (dynamic_cast<const InvalidInput*>(&e)) {
    return "invalid_input";
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return "not_found";
  }
  if (dynamic_cast<const NoCapacity*>(&e)) {
    return "no_capacity";
  }
  if (dynamic_cast<const TableLocked*>(&e)) {
    return "table_locked";
  }
  if (dynamic_cast<const OutsideServiceWindow*>(&e)) {
    return "outside_service_window";
  }
  return "internal";
}

} // namespace woki::util
