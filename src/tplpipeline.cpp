#include "tplpipeline.h"

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace TPL;

/* ------------ PDBDirectorySource ------------ */

PDBDirectorySource::PDBDirectorySource(const string& _dir, const string& _readOptions) {
  if (!TplSys::isDir(_dir)) TplUtils::error("'" + _dir + "' is not a directory", "PDBDirectorySource::PDBDirectorySource");
  dir = _dir;
  readOptions = _readOptions;
}

string PDBDirectorySource::resolve(const string& id) const {
  string cands[] = {id + ".pdb", id + ".ent", id};
  for (int i = 0; i < 3; i++) {
    string path = TplSys::joinPath(dir, cands[i]);
    if (TplSys::fileExists(path) && !TplSys::isDir(path)) return path;
  }
  return "";
}

void PDBDirectorySource::getStructure(const string& id, Structure& S) {
  string path = resolve(id);
  if (path.empty()) TplUtils::error("no structure file for '" + id + "' in " + dir, "PDBDirectorySource::getStructure");
  S.reset();
  S.readPDB(path, readOptions);
}

/* ------------ InMemorySource ------------ */

void InMemorySource::addPDBString(const string& id, const string& pdbText, const string& readOptions) {
  Structure S = Structure::fromPDBString(pdbText, readOptions);
  S.setName(id);
  structures[id] = S;
}

void InMemorySource::getStructure(const string& id, Structure& S) {
  map<string, Structure>::const_iterator it = structures.find(id);
  if (it == structures.end()) TplUtils::error("no structure named '" + id + "'", "InMemorySource::getStructure");
  S = it->second;
}

/* ------------ HitProjector ------------ */

HitProjector::HitProjector(StructureSource* _source, const projectionParams& _params) : builder(_params), projector(_params) {
  if (_source == NULL) TplUtils::error("no structure source given", "HitProjector::HitProjector");
  source = _source;
  params = _params;
}

void HitProjector::retrieve(const string& id, Structure& S) const {
  if (source->concurrentReadsSafe()) {
    source->getStructure(id, S);
    return;
  }

  // exceptions may not leave the critical section, so carry kind and message out of it
  bool failed = false;
  string kind, message;
  #pragma omp critical(structureRetrieval)
  {
    try {
      source->getStructure(id, S);
    } catch (const Error& e) {
      failed = true;
      kind = e.kind();
      message = e.what();
    } catch (const exception& e) {
      failed = true;
      message = e.what();
    }
  }
  if (!failed) return;
  if (kind == "EmptyStructureError") throw EmptyStructureError(message);
  if (kind == "AlignmentLengthMismatchError") throw AlignmentLengthMismatchError(message);
  if (kind == "ConfigurationError") throw ConfigurationError(message);
  if (kind.empty()) throw runtime_error(message);
  throw Error(message);
}

ContactMap HitProjector::project(const searchHit& hit) const {
  string from = "HitProjector::project";
  if (!hit.hasAlignment()) TplUtils::error("hit " + hit.query + " -> " + hit.target + " carries no alignment strings", from);
  if (hit.qaln.size() != hit.taln.size()) {
    throw AlignmentLengthMismatchError(TplUtils::errorMessage("hit " + hit.query + " -> " + hit.target + " has a query alignment of " + TplUtils::toString(hit.qaln.size()) + " columns and a target alignment of " + TplUtils::toString(hit.taln.size()), from));
  }

  string id = hit.targetStructureId();
  Structure S;
  retrieve(id, S);
  if (S.residueSize() == 0) throw EmptyStructureError(TplUtils::errorMessage("structure '" + id + "' has no residues", from));

  // alignment strings are local: target residue tstart - 1 is the first column's residue
  int offset = hit.targetOffset();
  int aligned = Sequence(hit.taln).ungappedLength();
  if (offset + aligned > S.residueSize()) {
    TplUtils::error("hit " + hit.query + " -> " + hit.target + " aligns target residues " + TplUtils::toString(offset + 1) + " to " + TplUtils::toString(offset + aligned) + ", but the structure has " + TplUtils::toString(S.residueSize()), from);
  }
  sparseContacts contacts = ContactMapProjector::shiftContacts(builder.buildSparse(S), offset);
  return projector.project(hit.qaln, hit.taln, contacts);
}

vector<projectionOutcome> HitProjector::projectAll(const vector<searchHit>& hits, int nThreads) const {
  if (nThreads < 1) throw ConfigurationError(TplUtils::errorMessage("number of threads must be at least 1, got " + TplUtils::toString(nThreads), "HitProjector::projectAll"));
  vector<projectionOutcome> outcomes(hits.size());
  int N = hits.size();
  int done = 0;
#ifdef _OPENMP
  if (nThreads > omp_get_num_procs()) TplUtils::warn("using " + TplUtils::toString(nThreads) + " threads on " + TplUtils::toString(omp_get_num_procs()) + " processors", "HitProjector::projectAll");
#else
  if (nThreads > 1) TplUtils::warn("built without OpenMP, hits will be projected serially", "HitProjector::projectAll");
#endif

  #pragma omp parallel for schedule(dynamic) num_threads(nThreads)
  for (int i = 0; i < N; i++) {
    projectionOutcome& out = outcomes[i];
    out.hit = hits[i];
    try {
      out.cmap = project(hits[i]);
      out.ok = true;
    } catch (const Error& e) {
      out.errorKind = e.kind();
      out.message = e.what();
    } catch (const exception& e) {
      out.errorKind = "std::exception";
      out.message = e.what();
    }
    if (params.isVerbose()) {
      #pragma omp critical(projectionProgress)
      {
        done++;
        cout << "[" << done << "/" << N << "] " << hits[i].query << " -> " << hits[i].target << (out.ok ? "" : " failed (" + out.errorKind + ")") << endl;
      }
    }
  }
  return outcomes;
}

int HitProjector::writeOutcomes(const vector<projectionOutcome>& outcomes, const string& outDir) {
  int nOK = 0;
  fstream skipped;
  TplUtils::openFile(skipped, TplSys::joinPath(outDir, "skipped.tsv"), fstream::out, "HitProjector::writeOutcomes");
  skipped << "query\ttarget\terror\tmessage" << endl;
  for (int i = 0; i < outcomes.size(); i++) {
    const projectionOutcome& out = outcomes[i];
    if (out.ok) {
      out.cmap.write(TplSys::joinPath(outDir, out.hit.query + "." + out.hit.targetStructureId() + ".cmap"));
      nOK++;
      continue;
    }
    // one line per hit
    string message = out.message;
    replace(message.begin(), message.end(), '\n', ' ');
    replace(message.begin(), message.end(), '\t', ' ');
    skipped << out.hit.query << "\t" << out.hit.target << "\t" << out.errorKind << "\t" << message << endl;
  }
  skipped.close();
  return nOK;
}
