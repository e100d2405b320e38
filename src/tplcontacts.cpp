#include "tplcontacts.h"
using namespace TPL;

/* ------------ ContactMap ------------ */

ContactMap::ContactMap(int _N) {
  if (_N < 0) TplUtils::error("negative contact map size " + TplUtils::toString(_N), "ContactMap::ContactMap(int)");
  N = _N;
  cells.assign((size_t) N * N, 0);
}

bool ContactMap::inContact(int i, int j) const {
  if ((i < 0) || (i >= N) || (j < 0) || (j >= N)) TplUtils::error("index pair (" + TplUtils::toString(i) + ", " + TplUtils::toString(j) + ") out of range for a map of size " + TplUtils::toString(N), "ContactMap::inContact");
  return (*this)(i, j);
}

bool ContactMap::isSymmetric() const {
  for (int i = 0; i < N; i++) {
    for (int j = i + 1; j < N; j++) {
      if ((*this)(i, j) != (*this)(j, i)) return false;
    }
  }
  return true;
}

bool ContactMap::diagonalSet() const {
  for (int i = 0; i < N; i++) {
    if (!(*this)(i, i)) return false;
  }
  return true;
}

int ContactMap::numContacts() const {
  int n = 0;
  for (int k = 0; k < cells.size(); k++) n += cells[k];
  return n;
}

sparseContacts ContactMap::toSparse() const {
  sparseContacts contacts;
  for (int i = 0; i < N; i++) {
    for (int j = 0; j < N; j++) {
      if ((*this)(i, j)) contacts.push_back(contactPair(i, j));
    }
  }
  return contacts;
}

ContactMap ContactMap::subMap(int n) const {
  if ((n < 0) || (n > N)) TplUtils::error("requested block size " + TplUtils::toString(n) + " for a map of size " + TplUtils::toString(N), "ContactMap::subMap");
  ContactMap sub(n);
  for (int i = 0; i < n; i++) {
    for (int j = 0; j < n; j++) sub.set(i, j, (*this)(i, j));
  }
  return sub;
}

void ContactMap::write(ostream& os) const {
  for (int i = 0; i < N; i++) {
    for (int j = 0; j < N; j++) {
      os << ((*this)(i, j) ? 1 : 0);
      if (j < N - 1) os << " ";
    }
    os << endl;
  }
}

void ContactMap::write(const string& file) const {
  fstream ofs;
  TplUtils::openFile(ofs, file, fstream::out, "ContactMap::write");
  write(ofs);
  ofs.close();
}

void ContactMap::read(istream& is) {
  vector<vector<unsigned char> > rows;
  string line;
  while (getline(is, line)) {
    line = TplUtils::trim(line);
    if (line.empty()) continue;
    vector<string> vals = TplUtils::split(line, " \t");
    vector<unsigned char> row(vals.size(), 0);
    for (int j = 0; j < vals.size(); j++) {
      if (vals[j] == "1") row[j] = 1;
      else if (vals[j] != "0") TplUtils::error("unexpected value '" + vals[j] + "' on row " + TplUtils::toString(rows.size() + 1), "ContactMap::read");
    }
    rows.push_back(row);
  }
  int n = rows.size();
  for (int i = 0; i < n; i++) {
    if (rows[i].size() != n) TplUtils::error("row " + TplUtils::toString(i + 1) + " has " + TplUtils::toString(rows[i].size()) + " values, expected " + TplUtils::toString(n), "ContactMap::read");
  }
  N = n;
  cells.assign((size_t) N * N, 0);
  for (int i = 0; i < N; i++) {
    for (int j = 0; j < N; j++) cells[i*N + j] = rows[i][j];
  }
}

void ContactMap::read(const string& file) {
  fstream ifs;
  TplUtils::openFile(ifs, file, fstream::in, "ContactMap::read");
  read(ifs);
  ifs.close();
}

void ContactMap::writeSparse(ostream& os, const sparseContacts& contacts) {
  for (int k = 0; k < contacts.size(); k++) {
    os << contacts[k].first << " " << contacts[k].second << endl;
  }
}

/* ------------ projectionParams ------------ */

void projectionParams::validate() const {
  string from = "projectionParams::validate";
  // written so that a NaN cutoff fails too
  if (!(dcut > 0)) throw ConfigurationError(TplUtils::errorMessage("distance cutoff must be positive, got " + TplUtils::toString(dcut), from));
  if (maxLen < 1) throw ConfigurationError(TplUtils::errorMessage("maximum structure length must be at least 1, got " + TplUtils::toString(maxLen), from));
  if (genRadius < 0) throw ConfigurationError(TplUtils::errorMessage("generated-contact radius cannot be negative, got " + TplUtils::toString(genRadius), from));
  if (TplUtils::trim(repAtom).empty()) throw ConfigurationError(TplUtils::errorMessage("representative atom name is empty", from));
}

/* ------------ ContactMapBuilder ------------ */

ContactMapBuilder::ContactMapBuilder(tplreal _dcut, int _maxLen, bool _useGrid) {
  projectionParams params;
  params.setDistanceCutoff(_dcut);
  params.setMaxLength(_maxLen);
  params.setProximityGrid(_useGrid);
  params.validate();
  dcut = _dcut; maxLen = _maxLen; useGrid = _useGrid;
  repAtom = params.getRepresentativeAtom();
}

ContactMapBuilder::ContactMapBuilder(const projectionParams& params) {
  params.validate();
  dcut = params.getDistanceCutoff();
  maxLen = params.getMaxLength();
  useGrid = params.useProximityGrid();
  repAtom = params.getRepresentativeAtom();
}

int ContactMapBuilder::effectiveLength(const vector<CartesianPoint>& coords) const {
  return min((int) coords.size(), maxLen);
}

void ContactMapBuilder::bruteForceNeighbors(const vector<CartesianPoint>& coords, int L, vector<vector<int> >& nbrs) const {
  for (int i = 0; i < L; i++) {
    nbrs[i].push_back(i);
    for (int j = i + 1; j < L; j++) {
      if (coords[i].distance(coords[j]) < dcut) {
        nbrs[i].push_back(j);
        nbrs[j].push_back(i);
      }
    }
  }
  for (int i = 0; i < L; i++) sort(nbrs[i].begin(), nbrs[i].end());
}

void ContactMapBuilder::gridNeighbors(const vector<CartesianPoint>& coords, int L, vector<vector<int> >& nbrs) const {
  vector<CartesianPoint> pts(coords.begin(), coords.begin() + L);
  ProximitySearch ps(pts, dcut);
  for (int i = 0; i < L; i++) {
    vector<int> close = ps.getPointsWithin(pts[i], 0, dcut, true);
    // the grid query is inclusive of the cutoff, the contact predicate is not
    for (int k = 0; k < close.size(); k++) {
      int j = close[k];
      if ((j == i) || (pts[i].distance(pts[j]) < dcut)) nbrs[i].push_back(j);
    }
    sort(nbrs[i].begin(), nbrs[i].end());
  }
}

void ContactMapBuilder::neighbors(const vector<CartesianPoint>& coords, vector<vector<int> >& nbrs) const {
  int L = effectiveLength(coords);
  for (int i = 0; i < L; i++) {
    if (coords[i].size() != 3) TplUtils::error("point " + TplUtils::toString(i) + " has " + TplUtils::toString(coords[i].size()) + " coordinates, expected 3", "ContactMapBuilder::neighbors");
  }
  nbrs.clear();
  nbrs.resize(L);
  if (L == 0) return;
  if (useGrid) gridNeighbors(coords, L, nbrs);
  else bruteForceNeighbors(coords, L, nbrs);
}

ContactMap ContactMapBuilder::buildDense(const vector<CartesianPoint>& coords) const {
  vector<vector<int> > nbrs;
  neighbors(coords, nbrs);
  ContactMap cm(nbrs.size());
  for (int i = 0; i < nbrs.size(); i++) {
    for (int k = 0; k < nbrs[i].size(); k++) cm.set(i, nbrs[i][k]);
  }
  return cm;
}

sparseContacts ContactMapBuilder::buildSparse(const vector<CartesianPoint>& coords) const {
  vector<vector<int> > nbrs;
  neighbors(coords, nbrs);
  sparseContacts contacts;
  for (int i = 0; i < nbrs.size(); i++) {
    for (int k = 0; k < nbrs[i].size(); k++) contacts.push_back(contactPair(i, nbrs[i][k]));
  }
  return contacts;
}

ContactMap ContactMapBuilder::buildDense(const Structure& S) const {
  return buildDense(S.getAtomCoordinates(repAtom, true, maxLen));
}

sparseContacts ContactMapBuilder::buildSparse(const Structure& S) const {
  return buildSparse(S.getAtomCoordinates(repAtom, true, maxLen));
}

ContactMap ContactMapBuilder::buildDenseFromPDBString(const string& pdbText) const {
  return buildDense(Structure::fromPDBString(pdbText));
}

sparseContacts ContactMapBuilder::buildSparseFromPDBString(const string& pdbText) const {
  return buildSparse(Structure::fromPDBString(pdbText));
}
