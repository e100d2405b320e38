#ifndef _TPLPIPELINE_H
#define _TPLPIPELINE_H

#include "tpltypes.h"
#include "tplcontacts.h"
#include "tplalign.h"
#include "tplsearch.h"
#include "tplsequence.h"
#include "tplsystem.h"

namespace TPL {

/* Where target structures come from. getStructure() fills S (resetting it
 * first) or throws if the identifier is unknown. */
class StructureSource {
  public:
    virtual ~StructureSource() {}
    virtual void getStructure(const string& id, Structure& S) = 0;
    virtual bool hasStructure(const string& id) const = 0;

    // if false, callers serialize getStructure() calls
    virtual bool concurrentReadsSafe() const { return false; }
};

/* Structures stored one per file in a directory, looked up as <id>.pdb,
 * <id>.ent and finally <id>. */
class PDBDirectorySource : public StructureSource {
  public:
    PDBDirectorySource(const string& _dir, const string& _readOptions = "SKIPHETERO QUIET");

    void getStructure(const string& id, Structure& S);
    bool hasStructure(const string& id) const { return !resolve(id).empty(); }
    bool concurrentReadsSafe() const { return true; }

    // path of the structure file, or an empty string if there is none
    string resolve(const string& id) const;
    string getDirectory() const { return dir; }

  private:
    string dir, readOptions;
};

/* Structures kept in memory, keyed by identifier. */
class InMemorySource : public StructureSource {
  public:
    InMemorySource() {}

    void addStructure(const string& id, const Structure& S) { structures[id] = S; }
    void addPDBString(const string& id, const string& pdbText, const string& readOptions = "SKIPHETERO QUIET");
    int size() const { return structures.size(); }

    void getStructure(const string& id, Structure& S);
    bool hasStructure(const string& id) const { return structures.find(id) != structures.end(); }
    bool concurrentReadsSafe() const { return true; }

  private:
    map<string, Structure> structures;
};

/* Result of projecting one hit. On failure, cmap is empty and errorKind and
 * message describe what went wrong. */
struct projectionOutcome {
  projectionOutcome() { ok = false; }

  searchHit hit;
  bool ok;
  ContactMap cmap;
  string errorKind;
  string message;
};

/* Projects the contact map of each hit's target structure onto its query. */
class HitProjector {
  public:
    // the source is not owned and must outlive the projector
    HitProjector(StructureSource* _source, const projectionParams& _params = projectionParams());

    /* Retrieves hit.targetStructureId(), builds its sparse contact graph and
     * projects it through the hit's alignment. The alignment strings are
     * local: the target side starts at residue tstart, so template contacts
     * are shifted by tstart - 1 first, and the map has one row per query
     * residue of the alignment (query residues qstart through qend). Throws EmptyStructureError for
     * a structure with no residues, AlignmentLengthMismatchError for unequal
     * alignment strings, and Error for a hit without alignment strings or a
     * structure that cannot be retrieved or is shorter than the aligned
     * target window. */
    ContactMap project(const searchHit& hit) const;

    /* One outcome per hit, in input order. A failed hit does not stop the
     * others. Hits are spread over nThreads threads when built with OpenMP. */
    vector<projectionOutcome> projectAll(const vector<searchHit>& hits, int nThreads = 1) const;
    vector<projectionOutcome> projectAll(const searchResult& result, int nThreads = 1) const { return projectAll(result.getHits(), nThreads); }

    const projectionParams& getParams() const { return params; }

    /* Writes <query>.<target structure>.cmap into outDir for every successful
     * outcome and lists the failed ones (query, target, error kind, message)
     * in outDir/skipped.tsv. Returns the number of maps written. */
    static int writeOutcomes(const vector<projectionOutcome>& outcomes, const string& outDir);

  protected:
    void retrieve(const string& id, Structure& S) const;

  private:
    StructureSource* source;
    projectionParams params;
    ContactMapBuilder builder;
    ContactMapProjector projector;
};

}

#endif
