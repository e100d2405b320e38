#include "tpltypes.h"
#include "tplsystem.h"

using namespace std;
using namespace TPL;

// a fixed-column ATOM/HETATM record
string atomRecord(bool het, int index, const string& atom, char alt, const string& resname, char chain, int resnum, char icode, tplreal x, tplreal y, tplreal z) {
  char line[100];
  string atomname = (atom.length() < 4) ? " " + atom : atom;
  snprintf(line, sizeof(line), "%-6s%5d %-4s%c%-3s %c%4d%c   %8.3f%8.3f%8.3f%6.2f%6.2f           %c",
           het ? "HETATM" : "ATOM", index, atomname.c_str(), alt, resname.c_str(), chain, resnum, icode, x, y, z, 1.0, 20.0, atom[0]);
  return string(line);
}

void countFailure(const string& testName, const string& what, int expected, int observed) {
  TplUtils::error("failed on '" + testName + "': expected " + TplUtils::toString(expected) + " " + what + " but found " + TplUtils::toString(observed));
}

void expectCounts(const string& testName, const Structure& S, int nChains, int nResidues, int nAtoms) {
  if (S.chainSize() != nChains) countFailure(testName, "chains", nChains, S.chainSize());
  if (S.residueSize() != nResidues) countFailure(testName, "residues", nResidues, S.residueSize());
  if (S.atomSize() != nAtoms) countFailure(testName, "atoms", nAtoms, S.atomSize());
}

int main(int argc, char** argv) {
  try {
    stringstream pdb;
    pdb << "HEADER    TEST STRUCTURE" << endl;
    pdb << "REMARK   1 nothing to see here" << endl;
    pdb << atomRecord(false, 1, "N", ' ', "MET", 'A', 1, ' ', 0.0, 0.0, 0.0) << endl;
    pdb << atomRecord(false, 2, "CA", ' ', "MET", 'A', 1, ' ', 1.458, 0.0, 0.0) << endl;
    // alternative locations: the first one is kept
    pdb << atomRecord(false, 3, "CA", 'A', "SER", 'A', 2, ' ', 3.8, 0.0, 0.0) << endl;
    pdb << atomRecord(false, 4, "CA", 'B', "SER", 'A', 2, ' ', 3.9, 0.5, 0.0) << endl;
    // insertion code starts a new residue
    pdb << atomRecord(false, 5, "CA", ' ', "GLY", 'A', 2, 'A', 7.6, 0.0, 0.0) << endl;
    pdb << "TER" << endl;
    // the same chain ID after TER opens a new chain
    pdb << atomRecord(false, 6, "CA", ' ', "LYS", 'A', 10, ' ', 0.0, 10.0, 0.0) << endl;
    pdb << atomRecord(false, 7, "CA", ' ', "LEU", 'B', 1, ' ', 0.0, 20.0, 0.0) << endl;
    pdb << atomRecord(true, 8, "O", ' ', "HOH", 'B', 101, ' ', 5.0, 5.0, 5.0) << endl;
    pdb << "END" << endl;
    pdb << atomRecord(false, 9, "CA", ' ', "ALA", 'C', 1, ' ', 9.0, 9.0, 9.0) << endl;
    string text = pdb.str();

    {
      Structure S = Structure::fromPDBString(text, "QUIET");
      expectCounts("full parse", S, 3, 6, 7);
      TplUtils::assertCond(S[0].getID() == "A", "failed on 'full parse': first chain should be A");
      // the repeated A takes the first free name, which pushes the real B along
      TplUtils::assertCond(S[1].getID() == "B", "failed on 'full parse': repeated chain A should have been renamed to B");
      TplUtils::assertCond(S[2].getID() == "C", "failed on 'full parse': chain B should have been renamed to C");
      Residue& ser = S.getResidue(1);
      TplUtils::assertCond(ser.isNamed("SER") && (ser.atomSize() == 1), "failed on 'full parse': the SER residue should keep one CA");
      TplUtils::assertCond(TplUtils::closeEnough(ser[0].getX(), 3.8, 1e-6), "failed on 'full parse': the first alternative location should be kept");
      Residue& gly = S.getResidue(2);
      TplUtils::assertCond((gly.getNum() == 2) && (gly.getIcode() == 'A'), "failed on 'full parse': insertion code not read");
      TplUtils::assertCond(S.getResidue(5).isNamed("HOH") && S.getResidue(5)[0].isHetero(), "failed on 'full parse': water should be the last residue");
    }

    {
      Structure S = Structure::fromPDBString(text, "SKIPHETERO QUIET");
      expectCounts("skip hetero", S, 3, 5, 6);
      vector<CartesianPoint> ca = S.getAtomCoordinates("CA");
      TplUtils::assertCond(ca.size() == 5, "failed on 'skip hetero': expected five CA positions");
      TplUtils::assertCond(TplUtils::closeEnough(ca[4].getY(), 20.0, 1e-6), "failed on 'skip hetero': CA positions out of chain order");
    }

    {
      Structure S = Structure::fromPDBString(text, "IGNORE-TER QUIET");
      expectCounts("ignore TER", S, 2, 6, 7);
    }

    // file round trip through a temporary directory
    {
      string dir = TplSys::makeTempDir("tpl-test-parsing");
      string file = TplSys::joinPath(dir, "test.pdb");
      Structure S = Structure::fromPDBString(text, "SKIPHETERO QUIET");
      S.writePDB(file);
      Structure T(file, "QUIET");
      expectCounts("round trip", T, 3, 5, 6);
      TplUtils::assertCond(T.getName() == file, "failed on 'round trip': structure should be named after its file");
      vector<CartesianPoint> a = S.getAtomCoordinates("CA"), b = T.getAtomCoordinates("CA");
      for (int i = 0; i < a.size(); i++) {
        TplUtils::assertCond(a[i].distance(b[i]) < 1e-3, "failed on 'round trip': coordinates changed");
      }
      TplSys::crmdir(dir, true);
    }

    // missing CA: strict coordinate retrieval errors, lenient skips
    {
      Structure S = Structure::fromPDBString(atomRecord(false, 1, "N", ' ', "ALA", 'A', 1, ' ', 0, 0, 0) + "\n" + atomRecord(false, 2, "CA", ' ', "ALA", 'A', 2, ' ', 1, 0, 0) + "\n");
      bool threw = false;
      try {
        S.getAtomCoordinates("CA", true);
      } catch (const Error& e) {
        threw = true;
      }
      TplUtils::assertCond(threw, "failed on 'missing CA': strict retrieval should fail");
      TplUtils::assertCond(S.getAtomCoordinates("CA", false).size() == 1, "failed on 'missing CA': lenient retrieval should skip the residue");
    }

    // utilities used by the parsers
    {
      vector<string> f = TplUtils::split("a\t\tb\t", "\t", false);
      TplUtils::assertCond((f.size() == 4) && (f[1] == "") && (f[2] == "b") && (f[3] == ""), "failed on 'split': empty fields should be kept");
      vector<string> w = TplUtils::split("a  b c", " ");
      TplUtils::assertCond(w.size() == 3, "failed on 'split': repeated delimiters should collapse");
      TplUtils::assertCond(TplUtils::trim("  x y \t") == "x y", "failed on 'trim'");
      TplUtils::assertCond(TplUtils::isReal("6.5") && !TplUtils::isInt("abc"), "failed on 'number checks'");
    }
  } catch (const Error& e) {
    cerr << e.what() << endl;
    return 1;
  }
  cout << "all parsing tests passed" << endl;
  return 0;
}
