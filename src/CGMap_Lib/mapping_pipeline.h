#ifndef CGMAP_LIB_MAPPING_PIPELINE_H_
#define CGMAP_LIB_MAPPING_PIPELINE_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "CGMap_Lib/cgmap.pb.h"
#include "CGMap_Lib/graph_transformer.h"
#include "CGMap_Lib/molecular_graph.h"
#include "CGMap_Lib/rule_records.h"

namespace cgmap {

// Maps every molecule of a System with one set of rules.
// For each molecule
//   modifications are applied to a copy of the input,
//   blocks are matched and the output molecule built,
//   links are applied to the output.
// Molecules are independent of each other and may be processed in
// parallel. Output atom ids of molecule i start at
// first_node_id + i * node_id_stride, so results do not depend on
// the order in which molecules are processed.
class MappingPipeline {
  private:
    int _verbose;

    RuleSet _rules;

    bool _apply_modifications;
    bool _apply_links;

    node_id_t _first_node_id;
    node_id_t _node_id_stride;

    std::vector<std::string> _merge_chain;
    bool _merge_all_chains;

    bool _parallel;

    GraphTransformer _transformer;

  public:
    MappingPipeline();

    // Take settings from `options`. Rule files are not read.
    int Initialise(const cgmap_data::MappingOptions& options);

    void set_verbose(int s);

    GraphTransformer& transformer() { return _transformer;}

    RuleSet& rules() { return _rules;}
    const RuleSet& rules() const { return _rules;}

    // Each file is parsed with its own macro table.
    absl::Status ReadRules(const std::string& fname);

    absl::Status ReadRules(const cgmap_data::MappingOptions& options);

    absl::StatusOr<MolecularGraph> MapMolecule(const MolecularGraph& input,
                                               node_id_t first_node_id,
                                               MappingReport& report) const;

    // Chains are merged, if requested, before mapping.
    absl::StatusOr<System> Map(const System& input, MappingReport& report) const;
};

}  // namespace cgmap

#endif  // CGMAP_LIB_MAPPING_PIPELINE_H_
