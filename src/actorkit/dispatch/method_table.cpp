#include "actorkit/dispatch/method_table.hpp"

#include <algorithm>
#include <vector>

namespace actorkit::dispatch {

auto MethodTable::Find(MethodNumber selector) const -> const MethodEntry* {
  auto it = entries_.find(selector);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto MethodTable::Selectors() const -> std::vector<MethodNumber> {
  std::vector<MethodNumber> selectors;
  selectors.reserve(entries_.size());
  for (const auto& [selector, entry] : entries_) {
    selectors.push_back(selector);
  }
  std::ranges::sort(selectors);
  return selectors;
}

}  // namespace actorkit::dispatch
