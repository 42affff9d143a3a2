#include <iostream>
#include <optional>
#include <utility>

#include "tbb/blocked_range.h"
#include "tbb/parallel_for.h"

#include "CGMap_Lib/macro_table.h"
#include "CGMap_Lib/mapping_pipeline.h"
#include "CGMap_Lib/merge_chains.h"
#include "CGMap_Lib/rule_parser.h"

namespace cgmap {

using std::cerr;

MappingPipeline::MappingPipeline() {
  _verbose = 0;
  _apply_modifications = true;
  _apply_links = true;
  _first_node_id = 0;
  _node_id_stride = 0;
  _merge_all_chains = false;
  _parallel = false;
}

void
MappingPipeline::set_verbose(int s) {
  _verbose = s;
  _transformer.set_verbose(s);
}

int
MappingPipeline::Initialise(const cgmap_data::MappingOptions& options) {
  if (options.has_verbose()) {
    set_verbose(options.verbose());
  }

  if (options.has_apply_modifications()) {
    _apply_modifications = options.apply_modifications();
  }
  if (options.has_apply_links()) {
    _apply_links = options.apply_links();
  }

  _first_node_id = options.first_node_id();
  _node_id_stride = options.node_id_stride();

  _merge_chain.assign(options.merge_chain().begin(), options.merge_chain().end());
  _merge_all_chains = options.merge_all_chains();

  _parallel = options.parallel();

  _transformer.set_require_unique(options.require_unique());
  if (options.has_skip_inconsistent_residues()) {
    _transformer.set_skip_inconsistent_residues(options.skip_inconsistent_residues());
  }
  _transformer.set_fail_on_unmapped(options.fail_on_unmapped());

  if (options.aggregate_attribute_size() > 0) {
    std::vector<std::string> aggregate(options.aggregate_attribute().begin(),
                                       options.aggregate_attribute().end());
    _transformer.set_aggregate_attributes(aggregate);
  }

  PatternMatcher& matcher = _transformer.matcher();
  matcher.set_keep_symmetric_permutations(options.keep_symmetric_permutations());
  matcher.set_max_matches(options.max_matches());

  return 1;
}

absl::Status
MappingPipeline::ReadRules(const std::string& fname) {
  MacroTable macros;
  RuleParser parser(macros);
  parser.set_verbose(_verbose);

  absl::Status status = parser.ParseFile(fname, _rules);
  if (! status.ok()) {
    return status;
  }

  if (_verbose) {
    cerr << "MappingPipeline::ReadRules:after '" << fname << "' " << _rules.number_blocks()
         << " blocks " << _rules.number_modifications() << " modifications "
         << _rules.number_links() << " links\n";
  }

  return absl::OkStatus();
}

absl::Status
MappingPipeline::ReadRules(const cgmap_data::MappingOptions& options) {
  for (const std::string& fname : options.rule_file()) {
    absl::Status status = ReadRules(fname);
    if (! status.ok()) {
      return status;
    }
  }

  return absl::OkStatus();
}

absl::StatusOr<MolecularGraph>
MappingPipeline::MapMolecule(const MolecularGraph& input,
                             node_id_t first_node_id,
                             MappingReport& report) const {
  std::optional<MolecularGraph> modified;
  if (_apply_modifications && _rules.number_modifications() > 0) {
    modified = input;
    absl::Status status = _transformer.ApplyModifications(*modified, _rules.modifications(), report);
    if (! status.ok()) {
      return status;
    }
  }

  const MolecularGraph& target = modified ? *modified : input;

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(target, _rules.blocks(),
                                                                 first_node_id, report);
  if (! output.ok()) {
    return output;
  }

  if (_apply_links) {
    absl::Status status = _transformer.ApplyLinks(*output, _rules.links(), report);
    if (! status.ok()) {
      return status;
    }
  }

  return output;
}

namespace {

// Maps a range of molecules, each result in its own slot.
class TBB_Map_Molecules {
  private:
    const MappingPipeline& _pipeline;
    const std::vector<MolecularGraph>& _input;
    node_id_t _first_node_id;
    node_id_t _stride;

    std::vector<absl::StatusOr<MolecularGraph>>& _output;
    std::vector<MappingReport>& _report;

  public:
    TBB_Map_Molecules(const MappingPipeline& pipeline,
                      const std::vector<MolecularGraph>& input,
                      node_id_t first_node_id, node_id_t stride,
                      std::vector<absl::StatusOr<MolecularGraph>>& output,
                      std::vector<MappingReport>& report) :
        _pipeline(pipeline), _input(input), _first_node_id(first_node_id),
        _stride(stride), _output(output), _report(report) {
    }

    void operator()(const tbb::blocked_range<int>& r) const;
};

void
TBB_Map_Molecules::operator()(const tbb::blocked_range<int>& r) const {
  for (int i = r.begin(); i != r.end(); ++i) {
    _output[i] = _pipeline.MapMolecule(_input[i], _first_node_id + i * _stride, _report[i]);
  }
}

}  // namespace

absl::StatusOr<System>
MappingPipeline::Map(const System& input, MappingReport& report) const {
  System merged;
  const System* source = &input;
  if (_merge_all_chains || ! _merge_chain.empty()) {
    merged = input;
    absl::Status status = MergeChains(merged, _merge_chain, _merge_all_chains);
    if (! status.ok()) {
      return status;
    }
    source = &merged;
  }

  const int n = source->number_molecules();

  std::vector<absl::StatusOr<MolecularGraph>> output(n);
  std::vector<MappingReport> reports(n);

  TBB_Map_Molecules map_molecules(*this, source->molecules(), _first_node_id, _node_id_stride,
                                  output, reports);
  if (_parallel) {
    tbb::parallel_for(tbb::blocked_range<int>(0, n), map_molecules);
  } else {
    map_molecules(tbb::blocked_range<int>(0, n));
  }

  System result;
  for (int i = 0; i < n; ++i) {
    if (! output[i].ok()) {
      return output[i].status();
    }
    report.Add(reports[i]);
    result.Add(*std::move(output[i]));
  }

  if (_verbose) {
    report.Report(cerr);
  }

  return result;
}

}  // namespace cgmap
