#include "tpltypes.h"

using namespace TPL;

/* --------- Structure --------- */
Structure::Structure() {
  numResidues = numAtoms = 0;
}

Structure::Structure(const string& pdbFile, string options) {
  numResidues = numAtoms = 0;
  readPDB(pdbFile, options);
}

Structure::Structure(istream& is, string options) {
  numResidues = numAtoms = 0;
  readPDB(is, options);
}

Structure::Structure(const Structure& S) {
  numResidues = numAtoms = 0;
  copy(S);
}

/* The assumption is that if a Structure is deleted, all of its children
 * objects are no longer needed and should go away. */
Structure::~Structure() {
  deletePointers();
}

Structure Structure::fromPDBString(const string& pdbText, string options) {
  stringstream ss(pdbText);
  Structure S(ss, options);
  return S;
}

void Structure::copy(const Structure& S) {
  name = S.name;
  for (int i = 0; i < S.chainSize(); i++) {
    appendChain(new Chain(S[i]), false);
  }
}

void Structure::deletePointers() {
  for (int i = 0; i < chains.size(); i++) delete(chains[i]);
}

void Structure::reset() {
  deletePointers();
  chains.resize(0);
  chainsByID.clear();
  name = "";
  numResidues = numAtoms = 0;
}

Structure& Structure::operator=(const Structure& A) {
  if (this == &A) return *this;
  reset();
  copy(A);
  return *this;
}

void Structure::readPDB(const string& pdbFile, string options) {
  fstream ifh; TplUtils::openFile(ifh, pdbFile, fstream::in, "Structure::readPDB");
  name = pdbFile;
  readPDB(ifh, options);
  ifh.close();
}

void Structure::readPDB(istream& ifh, string options) {
  int lastresnum = -999999;
  string lastresname = "XXXXXX";
  string lasticode = "";
  string lastchainID = "";
  Chain* chain = NULL;
  Residue* residue = NULL;

  bool ter = true;                   // chain terminus reached; true so that the first atom opens a chain
  bool skipHetero = false;           // skip hetero-atoms?
  bool ignoreTER = false;            // if true, TER lines do not end chains
  bool verbose = true;               // report renamed chains?

  options = TplUtils::uc(options);
  if (options.find("SKIPHETERO") != string::npos) skipHetero = true;
  if (options.find("IGNORE-TER") != string::npos) ignoreTER = true;
  if (options.find("QUIET") != string::npos) verbose = false;

  string line;
  while (getline(ifh, line)) {
    if (line.find("END") == 0) break;
    if ((line.find("TER") == 0) && !ignoreTER) { ter = true; continue; }
    if ((skipHetero && (line.find("ATOM") != 0)) || (!skipHetero && (line.find("ATOM") != 0) && (line.find("HETATM") != 0))) continue;

    // optional trailing columns are often missing, so pad before slicing
    line += string(100, ' ');
    int atominx = TplUtils::toInt(TplUtils::trim(line.substr(6, 5)), false);
    string atomname = TplUtils::trim(line.substr(12, 4));
    string alt = line.substr(16, 1);
    string resname = TplUtils::trim(line.substr(17, 4));
    string chainID = TplUtils::trim(line.substr(21, 1));
    int resnum = TplUtils::toInt(TplUtils::trim(line.substr(22, 4)));
    string icode = line.substr(26, 1);
    tplreal x = TplUtils::toReal(TplUtils::trim(line.substr(30, 8)));
    tplreal y = TplUtils::toReal(TplUtils::trim(line.substr(38, 8)));
    tplreal z = TplUtils::toReal(TplUtils::trim(line.substr(46, 8)));
    string segID = TplUtils::trim(line.substr(72, 4));
    tplreal B = TplUtils::toReal(TplUtils::trim(line.substr(60, 6)), false);
    tplreal occ = TplUtils::toReal(TplUtils::trim(line.substr(54, 6)), false);
    bool het = (line.find("HETATM") == 0);

    if (chainID.empty() && (segID.size() > 0) && (isalnum(segID[0]))) chainID = segID.substr(0, 1);

    if ((chainID.compare(lastchainID) != 0) || ter) {
      chain = new Chain(chainID, segID);
      appendChain(chain, true);
      if (verbose && chainID.compare(chain->getID())) {
        TplUtils::warn("chain name '" + chainID + "' was repeated in '" + name + "', renaming the chain to '" + chain->getID() + "'", "Structure::readPDB");
      }
      lastresnum = -999999;
      lastresname = "";
      ter = false;
    }

    if ((resnum != lastresnum) || resname.compare(lastresname) || icode.compare(lasticode)) {
      residue = new Residue(resname, resnum, icode[0]);
      chain->appendResidue(residue);
    } else if (alt.compare(" ") && (residue->findAtom(atomname, false) != NULL)) {
      // alternative location of an atom already read; the first one is kept
      continue;
    }
    residue->appendAtom(new Atom(atominx, atomname, x, y, z, B, occ, het, alt[0]));

    lastresnum = resnum;
    lasticode = icode;
    lastresname = resname;
    lastchainID = chainID;
  }
}

void Structure::writePDB(const string& pdbFile) const {
  fstream ofs; TplUtils::openFile(ofs, pdbFile, fstream::out, "Structure::writePDB");
  writePDB(ofs);
  ofs.close();
}

void Structure::writePDB(ostream& ofs) const {
  int atomIndex = 1;
  for (int ci = 0; ci < chainSize(); ci++) {
    Chain& C = (*this)[ci];
    for (int ri = 0; ri < C.residueSize(); ri++) {
      Residue& R = C[ri];
      for (int ai = 0; ai < R.atomSize(); ai++) {
        ofs << R[ai].pdbLine(R.getNum(), atomIndex++) << endl;
      }
    }
    ofs << "TER" << endl;
  }
  ofs << "END" << endl;
}

Residue& Structure::getResidue(int i) const {
  TplUtils::assertCond((i >= 0) && (i < numResidues), "residue index " + TplUtils::toString(i) + " out of range", "Structure::getResidue");
  for (int ci = 0; ci < chainSize(); ci++) {
    if (i < chains[ci]->residueSize()) return (*chains[ci])[i];
    i -= chains[ci]->residueSize();
  }
  TplUtils::error("inconsistent residue count", "Structure::getResidue");
  return (*chains[0])[0]; // never reached
}

vector<Residue*> Structure::getResidues() const {
  vector<Residue*> residues;
  residues.reserve(numResidues);
  for (int ci = 0; ci < chainSize(); ci++) {
    vector<Residue*> chainResidues = chains[ci]->getResidues();
    residues.insert(residues.end(), chainResidues.begin(), chainResidues.end());
  }
  return residues;
}

vector<Atom*> Structure::getAtoms() const {
  vector<Atom*> atoms;
  atoms.reserve(numAtoms);
  for (int ci = 0; ci < chainSize(); ci++) {
    Chain& C = (*this)[ci];
    for (int ri = 0; ri < C.residueSize(); ri++) {
      vector<Atom*> resAtoms = C[ri].getAtoms();
      atoms.insert(atoms.end(), resAtoms.begin(), resAtoms.end());
    }
  }
  return atoms;
}

vector<CartesianPoint> Structure::getAtomCoordinates(const string& atomName, bool strict, int maxResidues) const {
  vector<Residue*> residues = getResidues();
  int L = residues.size();
  if ((maxResidues >= 0) && (maxResidues < L)) L = maxResidues;
  vector<CartesianPoint> coords;
  coords.reserve(L);
  for (int i = 0; i < L; i++) {
    Atom* a = residues[i]->findAtom(atomName, false);
    if (a == NULL) {
      if (strict) TplUtils::error("residue " + TplUtils::toString(*(residues[i])) + " in '" + name + "' has no atom named '" + atomName + "'", "Structure::getAtomCoordinates");
      continue;
    }
    coords.push_back(a->getCoor());
  }
  return coords;
}

bool Structure::appendChain(Chain* C, bool allowRename) {
  bool renamed = false;
  if (chainsByID.find(C->getID()) != chainsByID.end()) {
    if (!allowRename) {
      TplUtils::warn("chain ID '" + C->getID() + "' is repeated", "Structure::appendChain");
    } else {
      // pick the first unused single-character name
      string cands = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789abcdefghijklmnopqrstuvwxyz";
      for (int i = 0; i < cands.size(); i++) {
        string cid(1, cands[i]);
        if (chainsByID.find(cid) == chainsByID.end()) { C->setID(cid); renamed = true; break; }
      }
      if (!renamed) TplUtils::error("ran out of single-character chain names", "Structure::appendChain");
    }
  }
  chains.push_back(C);
  C->setParent(this);
  chainsByID[C->getID()] = C;
  numResidues += C->residueSize();
  numAtoms += C->atomSize();
  return !renamed;
}

Chain* Structure::appendChain(const string& cid, bool allowRename) {
  Chain* C = new Chain(cid, "");
  appendChain(C, allowRename);
  return C;
}

/* --------- Chain --------- */
Chain::Chain() {
  numAtoms = 0;
  parent = NULL;
}

Chain::Chain(const Chain& C) {
  numAtoms = 0;
  parent = NULL;
  cid = C.cid;
  sid = C.sid;
  for (int i = 0; i < C.residueSize(); i++) appendResidue(new Residue(C[i]));
}

Chain::Chain(const string& chainID, const string& segID) {
  numAtoms = 0;
  parent = NULL;
  cid = chainID;
  sid = segID;
}

Chain::~Chain() {
  for (int i = 0; i < residues.size(); i++) delete(residues[i]);
}

void Chain::appendResidue(Residue* R) {
  residues.push_back(R);
  R->setParent(this);
  numAtoms += R->atomSize();
  if (parent != NULL) {
    parent->incrementNumResidues();
    parent->incrementNumAtoms(R->atomSize());
  }
}

void Chain::incrementNumAtoms(int delta) {
  numAtoms += delta;
  if (parent != NULL) parent->incrementNumAtoms(delta);
}

/* --------- Residue --------- */
Residue::Residue() {
  parent = NULL;
  resnum = 1;
  icode = ' ';
}

Residue::Residue(const Residue& R) {
  parent = NULL;
  resname = R.resname;
  resnum = R.resnum;
  icode = R.icode;
  for (int i = 0; i < R.atomSize(); i++) appendAtom(new Atom(R[i]));
}

Residue::Residue(const string& _resname, int _resnum, char _icode) {
  parent = NULL;
  resname = _resname;
  resnum = _resnum;
  icode = _icode;
}

Residue::~Residue() {
  for (int i = 0; i < atoms.size(); i++) delete(atoms[i]);
}

string Residue::getChainID() const {
  if (parent == NULL) TplUtils::error("residue " + TplUtils::toString(*this) + " has no parent chain", "Residue::getChainID");
  return parent->getID();
}

Atom* Residue::findAtom(const string& _name, bool strict) const {
  for (int i = 0; i < atoms.size(); i++) {
    if (atoms[i]->isNamed(_name)) return atoms[i];
  }
  if (strict) TplUtils::error("could not find atom named '" + _name + "' in residue " + TplUtils::toString(*this), "Residue::findAtom");
  return NULL;
}

void Residue::appendAtom(Atom* A) {
  atoms.push_back(A);
  A->setParent(this);
  if (parent != NULL) parent->incrementNumAtoms();
}

/* --------- Atom --------- */
Atom::Atom() {
  x = y = z = B = 0;
  occ = 1.0;
  alt = ' ';
  het = false;
  index = 0;
  parent = NULL;
}

Atom::Atom(const Atom& A) {
  x = A.x; y = A.y; z = A.z;
  B = A.B; occ = A.occ;
  name = A.name;
  alt = A.alt;
  het = A.het;
  index = A.index;
  parent = NULL;
}

Atom::Atom(int _index, const string& _name, tplreal _x, tplreal _y, tplreal _z, tplreal _B, tplreal _occ, bool _het, char _alt) {
  index = _index;
  name = _name;
  x = _x; y = _y; z = _z;
  B = _B; occ = _occ;
  het = _het;
  alt = _alt;
  parent = NULL;
}

CartesianPoint Atom::getCoor() const {
  return CartesianPoint(x, y, z);
}

string Atom::pdbLine(int resIndex, int atomIndex) const {
  char line[100];
  string resname = (parent == NULL) ? "UNK" : parent->getName();
  string chainID = ((parent == NULL) || (parent->getParent() == NULL)) ? "A" : parent->getParent()->getID();
  char icode = (parent == NULL) ? ' ' : parent->getIcode();

  // atom names shorter than four characters start in the second column of the field
  string atomname = (name.length() < 4) ? " " + name : name;
  snprintf(line, sizeof(line), "%-6s%5d %-4s%c%-4s%1s%4d%c   %8.3f%8.3f%8.3f%6.2f%6.2f",
           het ? "HETATM" : "ATOM", atomIndex, atomname.c_str(), alt, resname.c_str(), chainID.substr(0, 1).c_str(),
           resIndex, icode, x, y, z, occ, B);
  return string(line);
}

/* --------- CartesianPoint --------- */
CartesianPoint::CartesianPoint(const Atom& A) : vector<tplreal>(3, 0) {
  (*this)[0] = A.getX(); (*this)[1] = A.getY(); (*this)[2] = A.getZ();
}

tplreal CartesianPoint::distance(const CartesianPoint& another) const {
  return sqrt(distance2(another));
}

tplreal CartesianPoint::distance2(const CartesianPoint& another) const {
  if (size() != another.size()) TplUtils::error("vector size mismatch (" + TplUtils::toString(size()) + " vs " + TplUtils::toString(another.size()) + ")", "CartesianPoint::distance2");
  return distance2nc(another);
}

tplreal CartesianPoint::distance2nc(const CartesianPoint& another) const {
  tplreal d2 = 0, dd;
  for (int i = 0; i < size(); i++) {
    dd = (*this)[i] - another[i];
    d2 += dd*dd;
  }
  return d2;
}

/* --------- ProximitySearch --------- */
ProximitySearch::ProximitySearch(const vector<CartesianPoint>& points, tplreal characteristicDistance, tplreal pad) {
  if (points.empty()) TplUtils::error("empty point set passed", "ProximitySearch::ProximitySearch");
  if (!(characteristicDistance > 0)) TplUtils::error("characteristic distance must be positive", "ProximitySearch::ProximitySearch");
  calculateExtent(points, xlo, ylo, zlo, xhi, yhi, zhi);
  if (xlo == xhi) { xlo -= characteristicDistance/2; xhi += characteristicDistance/2; }
  if (ylo == yhi) { ylo -= characteristicDistance/2; yhi += characteristicDistance/2; }
  if (zlo == zhi) { zlo -= characteristicDistance/2; zhi += characteristicDistance/2; }
  xlo -= pad; ylo -= pad; zlo -= pad;
  xhi += pad; yhi += pad; zhi += pad;
  int _N = int(ceil(max(max((xhi - xlo), (yhi - ylo)), (zhi - zlo))/characteristicDistance));
  reinitBuckets(max(_N, 2));
  setBinWidths();
  for (int i = 0; i < points.size(); i++) addPoint(points[i], i);
}

void ProximitySearch::calculateExtent(const vector<CartesianPoint>& points, tplreal& _xlo, tplreal& _ylo, tplreal& _zlo, tplreal& _xhi, tplreal& _yhi, tplreal& _zhi) {
  if (points.empty()) TplUtils::error("empty point set passed", "ProximitySearch::calculateExtent");
  _xlo = _xhi = points[0].getX();
  _ylo = _yhi = points[0].getY();
  _zlo = _zhi = points[0].getZ();
  for (int i = 1; i < points.size(); i++) {
    _xlo = min(_xlo, points[i].getX()); _xhi = max(_xhi, points[i].getX());
    _ylo = min(_ylo, points[i].getY()); _yhi = max(_yhi, points[i].getY());
    _zlo = min(_zlo, points[i].getZ()); _zhi = max(_zhi, points[i].getZ());
  }
}

void ProximitySearch::reinitBuckets(int _N) {
  N = _N;
  buckets.assign(N, vector<vector<vector<int> > >(N, vector<vector<int> >(N)));
  pointList.resize(0);
  pointTags.resize(0);
}

void ProximitySearch::setBinWidths() {
  xbw = (xhi - xlo)/(N - 1);
  ybw = (yhi - ylo)/(N - 1);
  zbw = (zhi - zlo)/(N - 1);
}

void ProximitySearch::pointBucket(tplreal px, tplreal py, tplreal pz, int* i, int* j, int* k) const {
  *i = int((px - xlo)/xbw + 0.5);
  *j = int((py - ylo)/ybw + 0.5);
  *k = int((pz - zlo)/zbw + 0.5);
}

void ProximitySearch::addPoint(const CartesianPoint& _p, int tag) {
  int i, j, k;
  pointBucket(_p[0], _p[1], _p[2], &i, &j, &k);
  if ((i < 0) || (j < 0) || (k < 0) || (i > N-1) || (j > N-1) || (k > N-1)) {
    TplUtils::error("point " + TplUtils::toString(_p) + " out of range for the grid", "ProximitySearch::addPoint");
  }
  buckets[i][j][k].push_back(pointList.size());
  pointList.push_back(_p);
  pointTags.push_back(tag);
}

bool ProximitySearch::pointsWithin(const CartesianPoint& c, tplreal dmin, tplreal dmax, vector<int>* list, bool byTag) const {
  if (list != NULL) list->clear();
  tplreal cx = c.getX(); tplreal cy = c.getY(); tplreal cz = c.getZ();
  // nothing to find if the point is farther than dmax from the bounding box
  if ((cx < xlo - dmax) || (cy < ylo - dmax) || (cz < zlo - dmax) || (cx > xhi + dmax) || (cy > yhi + dmax) || (cz > zhi + dmax)) return false;

  int iLo, jLo, kLo, iHi, jHi, kHi;
  pointBucket(limitX(cx - dmax), limitY(cy - dmax), limitZ(cz - dmax), &iLo, &jLo, &kLo);
  pointBucket(limitX(cx + dmax), limitY(cy + dmax), limitZ(cz + dmax), &iHi, &jHi, &kHi);

  bool found = false;
  tplreal dmin2 = dmin*dmin, dmax2 = dmax*dmax;
  for (int i = iLo; i <= iHi; i++) {
    for (int j = jLo; j <= jHi; j++) {
      for (int k = kLo; k <= kHi; k++) {
        const vector<int>& Bijk = buckets[i][j][k];
        for (int ii = 0; ii < Bijk.size(); ii++) {
          int pi = Bijk[ii];
          tplreal d2 = c.distance2nc(pointList[pi]);
          if ((d2 >= dmin2) && (d2 <= dmax2)) {
            if (list == NULL) return true;
            list->push_back(byTag ? pointTags[pi] : pi);
            found = true;
          }
        }
      }
    }
  }
  return found;
}

vector<int> ProximitySearch::getPointsWithin(const CartesianPoint& c, tplreal dmin, tplreal dmax, bool byTag) const {
  vector<int> closeOnes;
  pointsWithin(c, dmin, dmax, &closeOnes, byTag);
  return closeOnes;
}

/* --------- TplUtils --------- */
vector<string> TplUtils::fileToArray(const string& _filename) {
  vector<string> lines;
  fstream inp;
  string line;
  TplUtils::openFile(inp, _filename, fstream::in, "TplUtils::fileToArray");
  while (true) {
    getline(inp, line);
    // if the last line ends with a newline, the last line read will be empty, so drop it
    if (inp.eof()) {
      if (!line.empty()) lines.push_back(line);
      break;
    }
    lines.push_back(line);
  }
  inp.close();
  return lines;
}

string TplUtils::trim(const string& str, string delimiters) {
  if (str.empty()) return str;
  size_t beg = str.find_first_not_of(delimiters);
  if (beg == string::npos) return "";
  size_t end = str.find_last_not_of(delimiters);
  return str.substr(beg, end - beg + 1);
}

void TplUtils::warn(const string& message, string from) {
  string head = from.empty() ? "Warning: " : "Warning in " + from + ": ";
  cerr << head << wrapText(message, 100, 0, head.length()) << endl;
}

string TplUtils::errorMessage(const string& message, string from) {
  string head = from.empty() ? "Error: " : "Error in " + from + ": ";
  return head + wrapText(message, 100, 0, head.length());
}

void TplUtils::error(const string& message, string from) {
  throw TPL::Error(errorMessage(message, from));
}

void TplUtils::assertCond(bool condition, string message, string from) {
  if (!condition) TplUtils::error(message, from);
}

string TplUtils::uc(const string& str) {
  string ret = str;
  for (int i = 0; i < ret.size(); i++) ret[i] = toupper(ret[i]);
  return ret;
}

string TplUtils::wrapText(const string& message, int width, int leftSkip, int startingOffset) {
  string wrapped = "";
  // first break up the message into words
  vector<string> words = TplUtils::split(message, " ");
  int lineLen = startingOffset;
  for (int i = 0; i < words.size(); i++) {
    if ((lineLen > leftSkip) && (lineLen + (int) words[i].length() + 1 > width)) {
      wrapped += "\n" + string(leftSkip, ' ');
      lineLen = leftSkip;
    } else if (i > 0) {
      wrapped += " ";
      lineLen++;
    }
    wrapped += words[i];
    lineLen += words[i].length();
  }
  return wrapped;
}

int TplUtils::toInt(const string& num, bool strict) {
  int ret;
  if ((sscanf(num.c_str(), "%d", &ret) != 1) && strict) TplUtils::error("failed to convert '" + num + "' to integer", "TplUtils::toInt");
  else if (!strict && !isInt(num)) return 0;
  return ret;
}

bool TplUtils::isInt(const string& num) {
  int ret;
  return (sscanf(num.c_str(), "%d", &ret) == 1);
}

TPL::tplreal TplUtils::toReal(const string& num, bool strict) {
  double ret;
  if ((sscanf(num.c_str(), "%lf", &ret) != 1) && strict) TplUtils::error("failed to convert '" + num + "' to real", "TplUtils::toReal");
  else if (!strict && !isReal(num)) return 0.0;
  return (TPL::tplreal) ret;
}

bool TplUtils::isReal(const string& num) {
  double ret;
  return (sscanf(num.c_str(), "%lf", &ret) == 1);
}

vector<string> TplUtils::split(const string& str, string delimiters, bool skipTrailingDelims) {
  vector<string> tokens;
  string rem = str;
  while (!rem.empty()) {
    size_t pos = rem.find_first_of(delimiters);
    if (pos == string::npos) { tokens.push_back(rem); break; }
    tokens.push_back(rem.substr(0, pos));
    rem = rem.substr(pos + 1);
    if (skipTrailingDelims) {
      size_t next = rem.find_first_not_of(delimiters);
      rem = (next == string::npos) ? "" : rem.substr(next);
    } else if (rem.empty()) {
      tokens.push_back("");
    }
  }
  return tokens;
}

string TplUtils::join(const string& delim, const vector<string>& words) {
  string joined;
  for (int i = 0; i < words.size(); i++) {
    joined += words[i];
    if (i != words.size() - 1) joined += delim;
  }
  return joined;
}
