#include "tpltypes.h"
#include "tplsystem.h"
#include "tploptions.h"
#include "tplsearch.h"
#include "tplpipeline.h"

using namespace TPL;

int main(int argc, char *argv[]) {
  TplOptions op;
  op.setTitle("Projects the contact maps of template structures onto query sequences through search-hit alignments. Options:");
  op.addOption("hits", "tab-separated search results with a header row; must include the qaln and taln columns.", true);
  op.addOption("pdbdir", "directory with the target structures, as <id>.pdb, <id>.ent or <id>, where <id> is the target name without its last extension.", true);
  op.addOption("out", "output directory. One <query>.<target>.cmap file is written per projected hit, plus skipped.tsv listing the hits that failed.", true);
  op.addOption("dcut", "CA-CA distance cutoff for template contacts (default 6.0).");
  op.addOption("maxlen", "maximum number of template residues considered (default 1000).");
  op.addOption("gen", "radius of generated contacts around query residues without a template residue (default 2).");
  op.addOption("topk", "only project the best this many hits (by sequence identity) of each query.");
  op.addOption("minid", "only project hits with at least this sequence identity (0 to 1).");
  op.addOption("nthreads", "number of threads (default 1).");
  op.addOption("verbose", "report progress.");

  try {
    op.setOptions(argc, argv);
    projectionParams params;
    params.setDistanceCutoff(op.getReal("dcut", params.getDistanceCutoff()));
    params.setMaxLength(op.getInt("maxlen", params.getMaxLength()));
    params.setGeneratedRadius(op.getInt("gen", params.getGeneratedRadius()));
    params.setVerbose(op.isGiven("verbose"));
    params.validate();

    TplTimer timer; timer.start();
    searchResult hits = searchResult::readTSV(op.getString("hits"));
    if (op.isGiven("minid")) hits = hits.filter(op.getReal("minid"));
    if (op.isGiven("topk")) hits = hits.topK(op.getInt("topk"));
    if (params.isVerbose()) cout << "projecting " << hits.size() << " hits for " << hits.queries().size() << " queries" << endl;

    string outDir = op.getString("out");
    TplSys::cmkdir(outDir, true);
    PDBDirectorySource source(op.getString("pdbdir"));
    HitProjector projector(&source, params);
    vector<projectionOutcome> outcomes = projector.projectAll(hits, op.getInt("nthreads", 1));
    int nOK = HitProjector::writeOutcomes(outcomes, outDir);
    cout << nOK << " of " << outcomes.size() << " hits projected in " << timer.getDuration(TplTimer::msec)/1000.0 << " s" << endl;
  } catch (const Error& e) {
    cerr << e.what() << endl;
    return 1;
  }
  return 0;
}
