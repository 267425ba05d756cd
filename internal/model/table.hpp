#pragma once

#include <cstdint>
#include <string>

namespace woki::model {

// A seatable unit as the allocation engine sees it.
struct Table {
  std::string   id;
  std::uint32_t min_capacity = 0;
  std::uint32_t max_capacity = 0;
};

} // namespace woki::model
