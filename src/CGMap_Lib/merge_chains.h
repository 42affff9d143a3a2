#ifndef CGMAP_LIB_MERGE_CHAINS_H_
#define CGMAP_LIB_MERGE_CHAINS_H_

#include <string>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/status/status.h"

#include "CGMap_Lib/molecular_graph.h"

namespace cgmap {

// Combine into a single, possibly disconnected, molecule every molecule
// of `system` all of whose chains are in `chains`. With `all_chains`
// every chain is selected. Exactly one of `chains` and `all_chains`
// must be given, otherwise InvalidArgument.
// The merged molecule takes the place of the first molecule merged.
// Atoms without a chain identifier count as chain "".
absl::Status MergeChains(System& system,
                         const std::vector<std::string>& chains,
                         bool all_chains);

// The chain identifiers of the atoms of `m`.
absl::btree_set<std::string> ChainsOf(const MolecularGraph& m);

}  // namespace cgmap

#endif  // CGMAP_LIB_MERGE_CHAINS_H_
