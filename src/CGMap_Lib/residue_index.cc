#include <tuple>

#include "absl/container/btree_map.h"
#include "absl/strings/str_cat.h"

#include "CGMap_Lib/residue_index.h"

namespace cgmap {

std::string
ResidueLabel(const AttributeMap& attributes) {
  std::string result = absl::StrCat(AttributeAsString(attributes, kResName), " ",
                                    AttributeAsString(attributes, kResId));
  const std::string chain = AttributeAsString(attributes, kChain);
  if (! chain.empty()) {
    absl::StrAppend(&result, " chain ", chain);
  }

  return result;
}

ResidueIndex::ResidueIndex() {
}

ResidueIndex::ResidueIndex(const MolecularGraph& graph) {
  Build(graph);
}

int
ResidueIndex::Build(const MolecularGraph& graph) {
  _residue.clear();
  _members.clear();
  _label.clear();

  using ResidueKey = std::tuple<std::string, std::string, std::string>;
  absl::btree_map<ResidueKey, int> seen;

  for (const auto& [id, attributes] : graph.nodes()) {
    ResidueKey key(AttributeAsString(attributes, kChain),
                   AttributeAsString(attributes, kResId),
                   AttributeAsString(attributes, kResName));
    auto iter = seen.find(key);
    int r;
    if (iter == seen.end()) {
      r = _members.size();
      seen.emplace(key, r);
      _members.emplace_back();
      _label.push_back(ResidueLabel(attributes));
    } else {
      r = iter->second;
    }

    _residue[id] = r;
    _members[r].push_back(id);
  }

  return _members.size();
}

int
ResidueIndex::residue(node_id_t id) const {
  auto iter = _residue.find(id);
  if (iter == _residue.end()) {
    return -1;
  }

  return iter->second;
}

std::string
ResidueIndex::LabelOf(node_id_t id) const {
  const int r = residue(id);
  if (r < 0) {
    return "?";
  }

  return _label[r];
}

}  // namespace cgmap
