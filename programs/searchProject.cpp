#include "tpltypes.h"
#include "tplsystem.h"
#include "tploptions.h"
#include "tplsequence.h"
#include "tplsearch.h"
#include "tplexternal.h"
#include "tplpipeline.h"

using namespace TPL;

int main(int argc, char *argv[]) {
  TplOptions op;
  op.setTitle("Searches query sequences against a template database with MMseqs2 and projects the template contact maps onto the queries. Options:");
  op.addOption("query", "FASTA file with the query sequences.", true);
  op.addOption("db", "MMseqs2 database of template sequences, or a FASTA file to build one from.", true);
  op.addOption("pdbdir", "directory with the template structures, named after the template sequences.", true);
  op.addOption("out", "output directory. Receives the filtered queries, the search results, one <query>.<target>.cmap file per projected hit, skipped.tsv for hits that failed and skipped_queries.tsv for queries outside the length range.", true);
  op.addOption("mmseqs", "path to the mmseqs binary (default: mmseqs on the PATH).");
  op.addOption("sens", "search sensitivity, between 1.0 and 7.5 (default 5.7).");
  op.addOption("eval", "maximum e-value of reported hits (default 1e-4).");
  op.addOption("noindex", "do not index a target database built from FASTA.");
  op.addOption("minlen", "queries shorter than this are skipped (default 60).");
  op.addOption("maxlen-seq", "queries longer than this are skipped (default 1000).");
  op.addOption("dcut", "CA-CA distance cutoff for template contacts (default 6.0).");
  op.addOption("maxlen", "maximum number of template residues considered (default 1000).");
  op.addOption("gen", "radius of generated contacts (default 2).");
  op.addOption("topk", "project only the best this many hits of each query (default 1).");
  op.addOption("nthreads", "number of threads for the search and the projection (default 1).");
  op.addOption("verbose", "report progress.");

  try {
    op.setOptions(argc, argv);
    bool verbose = op.isGiven("verbose");
    int nThreads = op.getInt("nthreads", 1);

    searchParams sp;
    sp.setSensitivity(op.getReal("sens", sp.getSensitivity()));
    sp.setMaxEvalue(op.getReal("eval", sp.getMaxEvalue()));
    sp.setThreads(nThreads);
    sp.setIndexTarget(!op.isGiven("noindex"));
    sp.setVerbose(verbose);
    sp.validate();

    projectionParams pp;
    pp.setDistanceCutoff(op.getReal("dcut", pp.getDistanceCutoff()));
    pp.setMaxLength(op.getInt("maxlen", pp.getMaxLength()));
    pp.setGeneratedRadius(op.getInt("gen", pp.getGeneratedRadius()));
    pp.setVerbose(verbose);
    pp.validate();

    string outDir = op.getString("out");
    TplSys::cmkdir(outDir, true);

    // length-filter the queries; the search runs on the survivors only
    map<string, int> skippedQueries;
    vector<Sequence> queries = SeqTools::filterByLength(SeqTools::readFasta(op.getString("query")), op.getInt("minlen", 60), op.getInt("maxlen-seq", 1000), &skippedQueries);
    for (map<string, int>::iterator it = skippedQueries.begin(); it != skippedQueries.end(); ++it) {
      TplUtils::warn("query " + it->first + " of length " + TplUtils::toString(it->second) + " is outside the allowed length range and is skipped", "searchProject");
    }
    if (!skippedQueries.empty()) SeqTools::writeSkipped(TplSys::joinPath(outDir, "skipped_queries.tsv"), skippedQueries);
    string filteredFasta = TplSys::joinPath(outDir, "filtered_query.fasta");
    SeqTools::writeFasta(filteredFasta, queries);

    string db = op.getString("db");
    if (!mmseqsInterface::isFasta(db) && !mmseqsInterface::isValidDatabase(db)) {
      TplUtils::error("'" + db + "' is neither a FASTA file nor a complete MMseqs2 database", "searchProject");
    }

    TplTimer timer; timer.start();
    mmseqsInterface mmseqs(op.getString("mmseqs", "mmseqs"));
    searchResult hits = mmseqs.search(filteredFasta, db, sp, TplSys::joinPath(outDir, "search_results.tsv"));
    hits = hits.topK(op.getInt("topk", 1));
    if (verbose) cout << hits.size() << " hits kept for projection" << endl;

    PDBDirectorySource source(op.getString("pdbdir"));
    HitProjector projector(&source, pp);
    vector<projectionOutcome> outcomes = projector.projectAll(hits, nThreads);

    int nOK = HitProjector::writeOutcomes(outcomes, outDir);

    vector<string> withHits = hits.queries();
    cout << nOK << " of " << outcomes.size() << " hits projected for " << withHits.size() << " of " << queries.size() << " queries in " << timer.getDuration() << " s" << endl;
  } catch (const Error& e) {
    cerr << e.what() << endl;
    return 1;
  }
  return 0;
}
