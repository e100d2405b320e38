#ifndef _TPLCONTACTS_H
#define _TPLCONTACTS_H

#include "tpltypes.h"

namespace TPL {

// residue index pair; sparse lists may hold both orders and repeats
typedef pair<int, int> contactPair;
typedef vector<contactPair> sparseContacts;

/* Dense square contact matrix over residue indices. A cell is either in
 * contact or not; nothing here forces symmetry, the builder and projector
 * maintain it. */
class ContactMap {
  public:
    ContactMap(int _N = 0);
    ContactMap(const ContactMap& other) { N = other.N; cells = other.cells; }

    int size() const { return N; }
    bool operator()(int i, int j) const { return cells[i*N + j] != 0; }
    bool inContact(int i, int j) const;
    void set(int i, int j, bool val = true) { cells[i*N + j] = val ? 1 : 0; }
    void setSymmetric(int i, int j, bool val = true) { set(i, j, val); set(j, i, val); }

    bool isSymmetric() const;
    bool diagonalSet() const;
    int numContacts() const;

    // all cells in contact, row-major
    sparseContacts toSparse() const;

    // the top-left n x n block; n larger than the map is an error
    ContactMap subMap(int n) const;

    /* N rows of space-separated 0/1 values. read() accepts what write()
     * produces and errors on a ragged or non-square matrix. */
    void write(ostream& os) const;
    void write(const string& file) const;
    void read(istream& is);
    void read(const string& file);
    static void writeSparse(ostream& os, const sparseContacts& contacts);

    ContactMap& operator=(const ContactMap& other) { N = other.N; cells = other.cells; return *this; }
    bool operator==(const ContactMap& other) const { return (N == other.N) && (cells == other.cells); }
    bool operator!=(const ContactMap& other) const { return !(*this == other); }
    friend ostream & operator<<(ostream &_os, const ContactMap& _cm) {
      _cm.write(_os);
      return _os;
    }

  private:
    int N;
    vector<unsigned char> cells;
};

/* Parameters of contact-map construction and projection. Defaults are a 6 A
 * CA-CA cutoff, a 1000 residue cap and a generated-contact radius of 2. */
class projectionParams {
  public:
    projectionParams() {
      dcut = 6.0;
      maxLen = 1000;
      genRadius = 2;
      repAtom = "CA";
      useGrid = false;
      verbose = false;
    }

    tplreal getDistanceCutoff() const { return dcut; }
    int getMaxLength() const { return maxLen; }
    int getGeneratedRadius() const { return genRadius; }
    string getRepresentativeAtom() const { return repAtom; }
    bool useProximityGrid() const { return useGrid; }
    bool isVerbose() const { return verbose; }

    void setDistanceCutoff(tplreal _dcut) { dcut = _dcut; }
    void setMaxLength(int _maxLen) { maxLen = _maxLen; }
    void setGeneratedRadius(int _genRadius) { genRadius = _genRadius; }
    void setRepresentativeAtom(const string& _repAtom) { repAtom = _repAtom; }
    void setProximityGrid(bool _useGrid) { useGrid = _useGrid; }
    void setVerbose(bool _verbose) { verbose = _verbose; }

    // throws ConfigurationError naming the first out-of-range parameter
    void validate() const;

  private:
    tplreal dcut;
    int maxLen, genRadius;
    string repAtom;
    bool useGrid, verbose;
};

/* Contact graph of an ordered list of residue positions: residues i and j are
 * in contact if their distance is strictly below the cutoff (so every residue
 * contacts itself). Inputs longer than the length cap are truncated from the
 * end. An empty input gives an empty graph. */
class ContactMapBuilder {
  public:
    ContactMapBuilder(tplreal _dcut = 6.0, int _maxLen = 1000, bool _useGrid = false);
    ContactMapBuilder(const projectionParams& params);

    ContactMap buildDense(const vector<CartesianPoint>& coords) const;

    /* Every (i, j) in contact, in row-major order: both (i, j) and (j, i)
     * appear for i != j, along with every (i, i). */
    sparseContacts buildSparse(const vector<CartesianPoint>& coords) const;

    // representative atom of every residue up to the length cap; a residue without one is an error
    ContactMap buildDense(const Structure& S) const;
    sparseContacts buildSparse(const Structure& S) const;
    ContactMap buildDenseFromPDBString(const string& pdbText) const;
    sparseContacts buildSparseFromPDBString(const string& pdbText) const;

    tplreal getDistanceCutoff() const { return dcut; }
    int getMaxLength() const { return maxLen; }
    string getRepresentativeAtom() const { return repAtom; }
    void setRepresentativeAtom(const string& _repAtom) { repAtom = _repAtom; }
    bool usesProximityGrid() const { return useGrid; }

  protected:
    int effectiveLength(const vector<CartesianPoint>& coords) const;

    // row-major neighbor lists; neighbors[i] is sorted and includes i itself
    void neighbors(const vector<CartesianPoint>& coords, vector<vector<int> >& nbrs) const;
    void bruteForceNeighbors(const vector<CartesianPoint>& coords, int L, vector<vector<int> >& nbrs) const;
    void gridNeighbors(const vector<CartesianPoint>& coords, int L, vector<vector<int> >& nbrs) const;

  private:
    tplreal dcut;
    int maxLen;
    bool useGrid;
    string repAtom;
};

}

#endif
