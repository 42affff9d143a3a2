#include <algorithm>
#include <iostream>
#include <utility>

#include "CGMap_Lib/attribute.h"
#include "CGMap_Lib/merge_chains.h"

namespace cgmap {

using std::cerr;

absl::btree_set<std::string>
ChainsOf(const MolecularGraph& m) {
  absl::btree_set<std::string> result;

  for (const auto& [id, attributes] : m.nodes()) {
    result.insert(AttributeAsString(attributes, kChain));
  }

  return result;
}

absl::Status
MergeChains(System& system,
            const std::vector<std::string>& chains,
            bool all_chains) {
  absl::btree_set<std::string> selected;

  if (! all_chains && ! chains.empty()) {
    selected.insert(chains.begin(), chains.end());
  } else if (all_chains && chains.empty()) {
    for (const MolecularGraph& m : system.molecules()) {
      const absl::btree_set<std::string> c = ChainsOf(m);
      selected.insert(c.begin(), c.end());
    }
  } else {
    return absl::InvalidArgumentError("MergeChains:specify either chains or all chains, not both");
  }

  if (selected.contains("")) {
    cerr << "MergeChains:one or more chains do not have a chain identifier\n";
  }

  std::vector<MolecularGraph> result;
  // Index in `result` of the merged molecule, -1 until one is found.
  int merged = -1;

  for (MolecularGraph& m : system.molecules()) {
    const absl::btree_set<std::string> c = ChainsOf(m);
    const bool subset = std::all_of(c.begin(), c.end(),
                                    [&selected](const std::string& s) { return selected.contains(s);});
    if (! subset) {
      result.push_back(std::move(m));
    } else if (merged < 0) {
      merged = result.size();
      result.push_back(std::move(m));
    } else if (! result[merged].Append(m)) {
      return absl::InternalError("MergeChains:cannot append molecule");
    }
  }

  system.molecules() = std::move(result);

  return absl::OkStatus();
}

}  // namespace cgmap
