// Map an atomistic System to a coarse grained one, using rules in the
// block/modification/link grammar.

#include <stdlib.h>

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Foundational/cmdline/cmdline.h"
#include "Foundational/iwmisc/proto_support.h"

#include "CGMap_Lib/cgmap.pb.h"
#include "CGMap_Lib/mapping_pipeline.h"

namespace cgmap_main {

using std::cerr;

void
Usage(int rc) {
// clang-format off
#if defined(GIT_HASH) && defined(TODAY)
  cerr << __FILE__ << " compiled " << TODAY << " git hash " << GIT_HASH << '\n';
#else
  cerr << __FILE__ << " compiled " << __DATE__ << " " << __TIME__ << '\n';
#endif
  // clang-format on
  // clang-format off
  cerr << "Maps a cgmap_data.System textproto using mapping rules, writes the result to stdout\n";
  cerr << " -r <fname>  rule file, may be repeated\n";
  cerr << " -C <fname>  cgmap_data.MappingOptions textproto\n";
  cerr << " -u          equally ranked competing matches are an error\n";
  cerr << " -m <chain>  merge molecules of <chain> before mapping, may be repeated\n";
  cerr << " -m all      merge all chains\n";
  cerr << " -p          process molecules in parallel\n";
  cerr << " -v          verbose output\n";
  // clang-format on

  ::exit(rc);
}

int
Main(int argc, char** argv) {
  Command_Line cl(argc, argv, "vr:C:um:p");
  if (cl.unrecognised_options_encountered()) {
    cerr << "unrecognised_options_encountered\n";
    Usage(1);
  }

  const int verbose = cl.option_count('v');

  cgmap_data::MappingOptions options;
  if (cl.option_present('C')) {
    const std::string fname = cl.string_value('C');
    std::optional<cgmap_data::MappingOptions> maybe_options =
        iwmisc::ReadTextProto<cgmap_data::MappingOptions>(fname);
    if (! maybe_options) {
      cerr << "Cannot read options '" << fname << "'\n";
      return 1;
    }
    options = std::move(*maybe_options);
  }

  if (cl.option_present('r')) {
    std::vector<std::string> rule_files;
    cl.all_values('r', rule_files);
    for (const std::string& fname : rule_files) {
      options.add_rule_file(fname);
    }
  }

  if (cl.option_present('u')) {
    options.set_require_unique(true);
  }

  if (cl.option_present('m')) {
    std::vector<std::string> chains;
    cl.all_values('m', chains);
    for (const std::string& chain : chains) {
      if (chain == "all") {
        options.set_merge_all_chains(true);
      } else {
        options.add_merge_chain(chain);
      }
    }
  }

  if (cl.option_present('p')) {
    options.set_parallel(true);
  }

  if (verbose) {
    options.set_verbose(verbose);
  }

  if (options.rule_file_size() == 0) {
    cerr << "Must specify one or more rule files via the -r option\n";
    Usage(1);
  }

  if (cl.number_elements() != 1) {
    cerr << "Must specify a single input file\n";
    Usage(1);
  }

  cgmap::MappingPipeline pipeline;
  if (! pipeline.Initialise(options)) {
    cerr << "Cannot initialise mapping\n";
    return 1;
  }

  absl::Status status = pipeline.ReadRules(options);
  if (! status.ok()) {
    cerr << status.message() << '\n';
    return 1;
  }

  std::optional<cgmap_data::System> proto = iwmisc::ReadTextProto<cgmap_data::System>(cl[0]);
  if (! proto) {
    cerr << "Cannot read system '" << cl[0] << "'\n";
    return 1;
  }

  cgmap::System input;
  if (! input.BuildFromProto(*proto)) {
    cerr << "Invalid system '" << cl[0] << "'\n";
    return 1;
  }

  if (verbose) {
    cerr << "Read " << input.number_molecules() << " molecules with " << input.number_nodes()
         << " atoms\n";
  }

  cgmap::MappingReport report;
  absl::StatusOr<cgmap::System> output = pipeline.Map(input, report);
  if (! output.ok()) {
    cerr << output.status().message() << '\n';
    return 1;
  }

  cgmap_data::System result;
  output->ToProto(result);
  if (! iwmisc::WriteTextProto(result, std::cout)) {
    cerr << "Cannot write result\n";
    return 1;
  }

  if (verbose) {
    cerr << "Wrote " << output->number_molecules() << " molecules with " << output->number_nodes()
         << " atoms\n";
  }

  return 0;
}

}  // namespace cgmap_main

int
main(int argc, char** argv) {
  int rc = cgmap_main::Main(argc, argv);

  return rc;
}
