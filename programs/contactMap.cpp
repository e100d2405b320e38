#include "tpltypes.h"
#include "tplcontacts.h"
#include "tploptions.h"

using namespace TPL;

int main(int argc, char *argv[]) {
  TplOptions op;
  op.setTitle("Computes the CA contact map of a structure. Options:");
  op.addOption("pdb", "input PDB file.", true);
  op.addOption("out", "output file. If not given, the map is written to standard output.");
  op.addOption("dcut", "CA-CA distance cutoff in Angstrom; residues closer than this are in contact (default 6.0).");
  op.addOption("maxlen", "only the first this many residues are considered (default 1000).");
  op.addOption("sparse", "write the contacts as 'i j' pairs, one per line, rather than as a 0/1 matrix.");
  op.addOption("grid", "find neighbors with a spatial grid rather than by comparing all pairs.");
  op.addOption("atom", "name of the atom representing each residue (default CA).");

  try {
    op.setOptions(argc, argv);
    projectionParams params;
    params.setDistanceCutoff(op.getReal("dcut", params.getDistanceCutoff()));
    params.setMaxLength(op.getInt("maxlen", params.getMaxLength()));
    params.setProximityGrid(op.isGiven("grid"));
    params.setRepresentativeAtom(op.getString("atom", params.getRepresentativeAtom()));

    Structure S(op.getString("pdb"), "SKIPHETERO");
    if (S.residueSize() == 0) throw EmptyStructureError(TplUtils::errorMessage("no residues in '" + op.getString("pdb") + "'", "contactMap"));
    if (S.residueSize() > params.getMaxLength()) {
      TplUtils::warn("structure has " + TplUtils::toString(S.residueSize()) + " residues, only the first " + TplUtils::toString(params.getMaxLength()) + " are used", "contactMap");
    }
    ContactMapBuilder builder(params);

    fstream ofs;
    if (op.isGiven("out")) TplUtils::openFile(ofs, op.getString("out"), fstream::out, "contactMap");
    ostream& os = op.isGiven("out") ? ofs : cout;
    if (op.isGiven("sparse")) ContactMap::writeSparse(os, builder.buildSparse(S));
    else builder.buildDense(S).write(os);
    if (op.isGiven("out")) ofs.close();
  } catch (const Error& e) {
    cerr << e.what() << endl;
    return 1;
  }
  return 0;
}
