#include <unistd.h>
#include "tpltypes.h"
#include "tplsystem.h"
#include "tplcontacts.h"
#include "tplsearch.h"
#include "tplpipeline.h"

using namespace std;
using namespace TPL;

// true if f raises an error of type E
template <class E, class F>
bool raises(F f) {
  try {
    f();
  } catch (const E&) {
    return true;
  } catch (const exception&) {
    return false;
  }
  return false;
}

// a straight CA trace along x with the given spacing, plus an optional water
Structure straightTrace(int n, tplreal spacing, bool water = false) {
  Structure S;
  Chain* C = S.appendChain("A", false);
  for (int i = 0; i < n; i++) {
    Residue* R = new Residue("ALA", i + 1);
    C->appendResidue(R);
    R->appendAtom(new Atom(i + 1, "CA", spacing*i, 0, 0, 0, 1, false));
  }
  if (water) {
    Chain* W = S.appendChain("W", false);
    Residue* R = new Residue("HOH", 1);
    W->appendResidue(R);
    R->appendAtom(new Atom(n + 1, "O", 0, 5, 5, 0, 1, true));
  }
  return S;
}

// a single-chain CA trace through the given points
Structure traceThrough(const vector<CartesianPoint>& pts) {
  Structure S;
  Chain* C = S.appendChain("A", false);
  for (int i = 0; i < pts.size(); i++) {
    Residue* R = new Residue("ALA", i + 1);
    C->appendResidue(R);
    R->appendAtom(new Atom(i + 1, "CA", pts[i][0], pts[i][1], pts[i][2], 0, 1, false));
  }
  return S;
}

searchHit makeHit(const string& query, const string& target, const string& qaln, const string& taln, tplreal fident = 0.5) {
  searchHit hit;
  hit.query = query; hit.target = target;
  hit.qaln = qaln; hit.taln = taln;
  hit.fident = fident;
  return hit;
}

// serializes nothing by itself and records any overlapping reads
class SerialSource : public InMemorySource {
  public:
    SerialSource() { inside = false; overlapped = false; calls = 0; }
    void getStructure(const string& id, Structure& S) {
      if (inside) overlapped = true;
      inside = true;
      usleep(500);
      calls++;
      inside = false;
      if (id == "hollow") throw EmptyStructureError("no residues recorded for 'hollow'");
      InMemorySource::getStructure(id, S);
    }
    bool concurrentReadsSafe() const { return false; }

    bool inside, overlapped;
    int calls;
};

int main(int argc, char** argv) {
  string dir;
  try {
    projectionParams params;
    ContactMapBuilder builder(params);

    InMemorySource mem;
    mem.addStructure("T1", straightTrace(5, 3.8));
    mem.addStructure("empty", Structure());
    TplUtils::assertCond(mem.size() == 2 && mem.hasStructure("T1") && !mem.hasStructure("T9"), "failed on 'in-memory source': lookups");

    // a full-length identical alignment gives the template map itself
    HitProjector hp(&mem, params);
    {
      ContactMap cm = hp.project(makeHit("q1", "T1.A", "ACDEF", "ACDEF"));
      TplUtils::assertCond(cm == builder.buildDense(straightTrace(5, 3.8)), "failed on 'project': map differs from the template map");
      ContactMap gapped = hp.project(makeHit("q1", "T1.A", "ACDEFG", "AC-DEF"));
      TplUtils::assertCond(gapped.size() == 6 && gapped.isSymmetric() && gapped.diagonalSet(), "failed on 'project': malformed map for a gapped alignment");
      TplUtils::assertCond(gapped(2, 0) && gapped(2, 4), "failed on 'project': uncovered residue 2 should get generated contacts");
    }

    // failures carry their kind
    {
      TplUtils::assertCond(raises<EmptyStructureError>([&]() { hp.project(makeHit("q1", "empty", "AC", "AC")); }), "failed on 'empty structure': expected EmptyStructureError");
      TplUtils::assertCond(raises<AlignmentLengthMismatchError>([&]() { hp.project(makeHit("q1", "T1", "ACD", "AC")); }), "failed on 'length mismatch': expected AlignmentLengthMismatchError");
      TplUtils::assertCond(raises<Error>([&]() { hp.project(makeHit("q1", "T9", "AC", "AC")); }), "failed on 'missing structure': expected an error");
      TplUtils::assertCond(raises<Error>([&]() { hp.project(makeHit("q1", "T1", "", "")); }), "failed on 'no alignment': expected an error");
      TplUtils::assertCond(raises<Error>([]() { HitProjector p(NULL); }), "failed on 'no source': expected an error");
    }

    // batch projection keeps input order and isolates failures
    vector<searchHit> hits;
    for (int i = 0; i < 24; i++) {
      string q = "q" + TplUtils::toString(i);
      if (i % 6 == 3) hits.push_back(makeHit(q, "empty", "AC", "AC"));
      else if (i % 6 == 5) hits.push_back(makeHit(q, "T1", "ACD", "AC"));
      else hits.push_back(makeHit(q, "T1.B", "ACDEF", "AC-DE"));
    }
    vector<projectionOutcome> outcomes = hp.projectAll(hits, 4);
    {
      TplUtils::assertCond(outcomes.size() == hits.size(), "failed on 'batch': one outcome per hit expected");
      for (int i = 0; i < hits.size(); i++) {
        const projectionOutcome& out = outcomes[i];
        TplUtils::assertCond(out.hit.query == hits[i].query, "failed on 'batch': outcome " + TplUtils::toString(i) + " is out of order");
        if (i % 6 == 3) {
          TplUtils::assertCond(!out.ok && (out.errorKind == "EmptyStructureError"), "failed on 'batch': hit " + TplUtils::toString(i) + " should fail on an empty structure");
        } else if (i % 6 == 5) {
          TplUtils::assertCond(!out.ok && (out.errorKind == "AlignmentLengthMismatchError"), "failed on 'batch': hit " + TplUtils::toString(i) + " should fail on a length mismatch");
        } else {
          TplUtils::assertCond(out.ok && (out.cmap.size() == 5), "failed on 'batch': hit " + TplUtils::toString(i) + " should give a 5 x 5 map");
        }
      }
      vector<projectionOutcome> serial = hp.projectAll(hits, 1);
      for (int i = 0; i < hits.size(); i++) {
        TplUtils::assertCond(serial[i].cmap == outcomes[i].cmap, "failed on 'batch': threaded and serial maps differ for hit " + TplUtils::toString(i));
      }
      TplUtils::assertCond(raises<ConfigurationError>([&]() { hp.projectAll(hits, 0); }), "failed on 'batch': zero threads accepted");
      TplUtils::assertCond(hp.projectAll(vector<searchHit>(), 2).empty(), "failed on 'batch': no hits should give no outcomes");
    }

    // a source that is not safe for concurrent reads is read one call at a time
    {
      SerialSource serial;
      serial.addStructure("T1", straightTrace(5, 3.8));
      HitProjector sp(&serial, params);
      vector<searchHit> many(16, makeHit("q", "T1", "ACDEF", "ACDEF"));
      vector<projectionOutcome> res = sp.projectAll(many, 4);
      TplUtils::assertCond(serial.calls == 16, "failed on 'serial source': expected one read per hit");
      TplUtils::assertCond(!serial.overlapped, "failed on 'serial source': reads overlapped");
      for (int i = 0; i < res.size(); i++) TplUtils::assertCond(res[i].ok, "failed on 'serial source': hit " + TplUtils::toString(i) + " failed");

      // errors raised by the source keep their kind through the serialized read
      vector<searchHit> mixed;
      mixed.push_back(makeHit("q", "hollow", "AC", "AC"));
      mixed.push_back(makeHit("q", "T1", "ACDEF", "ACDEF"));
      mixed.push_back(makeHit("q", "T9", "AC", "AC"));
      vector<projectionOutcome> kinds = sp.projectAll(mixed, 2);
      TplUtils::assertCond(!kinds[0].ok && (kinds[0].errorKind == "EmptyStructureError"), "failed on 'serial source': expected EmptyStructureError, got " + kinds[0].errorKind);
      TplUtils::assertCond(kinds[1].ok, "failed on 'serial source': a good hit after a failed one should succeed");
      TplUtils::assertCond(!kinds[2].ok && (kinds[2].errorKind == "Error"), "failed on 'serial source': a missing structure should be a plain Error, got " + kinds[2].errorKind);
      TplUtils::assertCond(raises<EmptyStructureError>([&]() { sp.project(mixed[0]); }), "failed on 'serial source': project should rethrow EmptyStructureError");
    }

    // local alignments start at tstart: only the aligned target window contributes contacts
    {
      // only residues 0 and 4 are within the cutoff of each other
      vector<CartesianPoint> pts;
      for (int i = 0; i < 10; i++) pts.push_back(CartesianPoint(10.0*i, 0, 0));
      pts[4] = CartesianPoint(0, 3, 0);
      InMemorySource local;
      local.addStructure("L", traceThrough(pts));
      HitProjector lp(&local, params);

      searchHit fromStart = makeHit("q", "L", "AAAAA", "AAAAA");
      fromStart.qstart = 1; fromStart.tstart = 1;
      ContactMap cm = lp.project(fromStart);
      TplUtils::assertCond((cm.size() == 5) && cm(0, 4) && cm(4, 0) && (cm.numContacts() == 7), "failed on 'local alignment': the window at residue 1 should carry the (0, 4) contact");

      searchHit shifted = makeHit("q", "L", "AAAAA", "AAAAA");
      shifted.qstart = 1; shifted.tstart = 4;
      cm = lp.project(shifted);
      TplUtils::assertCond(cm.size() == 5, "failed on 'local alignment': map should have one row per aligned query residue");
      TplUtils::assertCond(cm.numContacts() == 5, "failed on 'local alignment': target residues 4 to 8 have no contacts, but the map has off-diagonal cells");

      // the (0, 4) contact shifts to (-1, 3) and falls outside the window
      shifted.tstart = 2;
      TplUtils::assertCond(lp.project(shifted).numContacts() == 5, "failed on 'local alignment': a contact starting before the window should be dropped");

      // the query start does not change the map, only which query residues its rows stand for
      fromStart.qstart = 12;
      TplUtils::assertCond(lp.project(fromStart)(0, 4), "failed on 'local alignment': the query start should not move template contacts");

      searchHit pastEnd = makeHit("q", "L", "AAAAA", "AAAAA");
      pastEnd.tstart = 7;
      TplUtils::assertCond(raises<Error>([&]() { lp.project(pastEnd); }), "failed on 'local alignment': a window past the end of the structure should be an error");
    }

    // structures from a directory, and writing the outcomes
    {
      dir = TplSys::makeTempDir("tpl-test-pipeline");
      string pdbDir = TplSys::joinPath(dir, "pdb");
      TplSys::cmkdir(pdbDir);
      straightTrace(5, 3.8, true).writePDB(TplSys::joinPath(pdbDir, "T1.pdb"));
      straightTrace(3, 3.8).writePDB(TplSys::joinPath(pdbDir, "T2.ent"));
      straightTrace(4, 3.8).writePDB(TplSys::joinPath(pdbDir, "T3"));

      TplUtils::assertCond(raises<Error>([&]() { PDBDirectorySource bad(TplSys::joinPath(dir, "nothing")); }), "failed on 'directory source': a missing directory accepted");
      PDBDirectorySource src(pdbDir);
      TplUtils::assertCond(src.resolve("T1") == TplSys::joinPath(pdbDir, "T1.pdb"), "failed on 'directory source': T1 not resolved to T1.pdb");
      TplUtils::assertCond(src.resolve("T2") == TplSys::joinPath(pdbDir, "T2.ent"), "failed on 'directory source': T2 not resolved to T2.ent");
      TplUtils::assertCond(src.resolve("T3") == TplSys::joinPath(pdbDir, "T3"), "failed on 'directory source': T3 not resolved");
      TplUtils::assertCond(!src.hasStructure("T4"), "failed on 'directory source': T4 should not exist");

      // waters are skipped on reading, so they do not count as residues without a CA
      Structure S;
      src.getStructure("T1", S);
      TplUtils::assertCond(S.residueSize() == 5, "failed on 'directory source': expected 5 residues in T1");
      src.getStructure("T2", S);
      TplUtils::assertCond(S.residueSize() == 3, "failed on 'directory source': a reused structure should be reset");

      vector<searchHit> dirHits;
      dirHits.push_back(makeHit("qa", "T1.A", "ACDEF", "ACDEF"));
      dirHits.push_back(makeHit("qb", "T2.A", "ACD", "A-D"));
      dirHits.push_back(makeHit("qc", "T4.A", "AC", "AC"));
      HitProjector dp(&src, params);
      vector<projectionOutcome> dirOut = dp.projectAll(dirHits, 2);
      string outDir = TplSys::joinPath(dir, "out");
      TplSys::cmkdir(outDir);
      int nOK = HitProjector::writeOutcomes(dirOut, outDir);
      TplUtils::assertCond(nOK == 2, "failed on 'write outcomes': expected 2 maps written, got " + TplUtils::toString(nOK));

      ContactMap back;
      back.read(TplSys::joinPath(outDir, "qa.T1.cmap"));
      TplUtils::assertCond(back == dirOut[0].cmap, "failed on 'write outcomes': map read back differs");
      TplUtils::assertCond(TplSys::fileExists(TplSys::joinPath(outDir, "qb.T2.cmap")), "failed on 'write outcomes': qb.T2.cmap missing");
      TplUtils::assertCond(!TplSys::fileExists(TplSys::joinPath(outDir, "qc.T4.cmap")), "failed on 'write outcomes': a failed hit got a map");

      vector<string> skipped = TplUtils::fileToArray(TplSys::joinPath(outDir, "skipped.tsv"));
      TplUtils::assertCond(skipped.size() == 2, "failed on 'write outcomes': expected a header and one skipped hit");
      TplUtils::assertCond(skipped[0] == "query\ttarget\terror\tmessage", "failed on 'write outcomes': unexpected header " + skipped[0]);
      vector<string> fields = TplUtils::split(skipped[1], "\t", false);
      TplUtils::assertCond((fields.size() == 4) && (fields[0] == "qc") && (fields[1] == "T4.A") && (fields[2] == "Error"), "failed on 'write outcomes': unexpected skipped line " + skipped[1]);

      TplSys::crmdir(dir, true);
      dir.clear();
    }
  } catch (const Error& e) {
    cerr << e.what() << endl;
    if (!dir.empty() && TplSys::isDir(dir)) TplSys::crmdir(dir, true);
    return 1;
  }
  cout << "all pipeline tests passed" << endl;
  return 0;
}
