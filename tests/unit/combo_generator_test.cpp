#include "internal/core/combo_generator.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/core/capacity_calculator.hpp"

namespace {

using woki::core::CapacityCalculator;
using woki::core::ComboGenerator;
using woki::model::Table;

using IdSet = std::vector<std::string>;

const std::vector<Table> kFloor = {
    {"T1", 2, 2}, {"T2", 2, 4}, {"T3", 2, 4}, {"T4", 4, 6}, {"T5", 2, 2}, {"T6", 1, 2}, {"T7", 6, 8},
};

IdSet Ids(const std::vector<Table>& members) {
  IdSet ids;
  for (const auto& t : members) ids.push_back(t.id);
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::set<IdSet> BruteForce(const std::vector<Table>& tables, std::uint32_t party, std::size_t max_size) {
  std::set<IdSet> out;
  const auto      n = tables.size();
  for (unsigned mask = 0; mask < (1u << n); ++mask) {
    std::vector<Table> members;
    for (std::size_t i = 0; i < n; ++i) {
      if (mask & (1u << i)) members.push_back(tables[i]);
    }
    if (members.size() < 2 || members.size() > max_size) continue;
    if (CapacityCalculator::Calculate(members).Admits(party)) out.insert(Ids(members));
  }
  return out;
}

void TestEveryComboRespectsBounds() {
  for (std::uint32_t party = 1; party <= 30; ++party) {
    for (const auto& members : ComboGenerator::Generate(kFloor, party)) {
      assert(members.size() >= 2);
      assert(members.size() <= ComboGenerator::kMaxComboSize);

      const auto ids = Ids(members);
      assert(std::adjacent_find(ids.begin(), ids.end()) == ids.end());

      const auto range = CapacityCalculator::Calculate(members);
      assert(range.min <= party);
      assert(party <= range.max);
    }
  }
}

void TestSearchFindsEveryAdmissibleSubset() {
  for (std::uint32_t party = 2; party <= 24; ++party) {
    std::set<IdSet> generated;
    for (const auto& members : ComboGenerator::Generate(kFloor, party)) {
      generated.insert(Ids(members));
    }
    assert(generated == BruteForce(kFloor, party, ComboGenerator::kMaxComboSize));
  }
}

void TestMaxSizeIsHonoured() {
  const auto combos = ComboGenerator::Generate(kFloor, 8, 2);
  assert(!combos.empty());
  for (const auto& members : combos) {
    assert(members.size() == 2);
  }
  assert(ComboGenerator::Generate(kFloor, 8, 1).empty());
}

void TestUnreachablePartyYieldsNothing() {
  // sum of every max is 28
  assert(ComboGenerator::Generate(kFloor, 29).empty());
}

void TestZeroCapacityTablesAreSkipped() {
  const std::vector<Table> tables = {{"A", 0, 0}, {"B", 2, 4}, {"C", 2, 4}};
  for (const auto& members : ComboGenerator::Generate(tables, 4)) {
    for (const auto& t : members) {
      assert(t.id != "A");
    }
  }
}

void TestSingleFitsForPartyOfOne() {
  assert(CapacityCalculator::SingleFits({"T1", 2, 2}, 1));
  assert(!CapacityCalculator::SingleFits({"T0", 0, 0}, 1));
  assert(CapacityCalculator::SingleFits({"T2", 2, 4}, 4));
  assert(!CapacityCalculator::SingleFits({"T2", 2, 4}, 5));
  assert(!CapacityCalculator::SingleFits({"T4", 4, 6}, 3));
}

} // namespace

int main() {
  TestEveryComboRespectsBounds();
  TestSearchFindsEveryAdmissibleSubset();
  TestMaxSizeIsHonoured();
  TestUnreachablePartyYieldsNothing();
  TestZeroCapacityTablesAreSkipped();
  TestSingleFitsForPartyOfOne();

  std::cout << "woki_unit_combo_generator: pass\n";
  return 0;
}
