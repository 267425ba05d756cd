#include "internal/core/combo_generator.hpp"

#include <algorithm>

namespace woki::core {

namespace {

struct Search {
  const std::vector<model::Table>&        sorted;
  const std::vector<std::uint64_t>&       suffix_max;  // suffix_max[i] = sum of max over [i, n)
  std::uint32_t                           party_size;
  std::size_t                             max_size;
  std::vector<model::Table>               current;
  std::vector<std::vector<model::Table>>  out;

  void Run(std::size_t start, std::uint64_t min_sum, std::uint64_t max_sum) {
    if (current.size() >= 2 && min_sum <= party_size && party_size <= max_sum) {
      out.push_back(current);
    }
    if (current.size() == max_size) {
      return;
    }

    for (std::size_t i = start; i < sorted.size(); ++i) {
      const auto& table = sorted[i];
      if (max_sum + suffix_max[i] < party_size) {
        // later indices only have less capacity left
        return;
      }
      const std::uint64_t next_min = min_sum + table.min_capacity;
      if (next_min > party_size) {
        continue;
      }
      current.push_back(table);
      Run(i + 1, next_min, max_sum + table.max_capacity);
      current.pop_back();
    }
  }
};

} // namespace

std::vector<std::vector<model::Table>> ComboGenerator::Generate(const std::vector<model::Table>& tables, std::uint32_t party_size,
                                                                std::size_t max_size) {
  std::vector<model::Table> useful;
  for (const auto& table : tables) {
    if (table.max_capacity > 0) useful.push_back(table);
  }
  if (useful.size() < 2 || max_size < 2 || party_size == 0) {
    return {};
  }

  std::stable_sort(useful.begin(), useful.end(), [](const auto& a, const auto& b) {
    if (a.max_capacity != b.max_capacity) return a.max_capacity > b.max_capacity;
    return a.id < b.id;
  });

  std::vector<std::uint64_t> suffix_max(useful.size() + 1, 0);
  for (std::size_t i = useful.size(); i-- > 0;) {
    suffix_max[i] = suffix_max[i + 1] + useful[i].max_capacity;
  }

  Search search{useful, suffix_max, party_size, std::min(max_size, kMaxComboSize), {}, {}};
  search.Run(0, 0, 0);
  return std::move(search.out);
}

} // namespace woki::core
