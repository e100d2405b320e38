#ifndef _TPLTYPES_H
#define _TPLTYPES_H

#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include <vector>
#include <map>
#include <set>
#include <limits>
#include <algorithm>
#include <stdexcept>
#include <math.h>
#include <chrono>

using namespace std;

namespace TPL {

// forward declarations
class Chain;
class Residue;
class Atom;
class Structure;
class CartesianPoint;

typedef double tplreal;

/* Errors raised by the library. Everything derives from Error, so callers that
 * process many hits can catch per hit and keep going. */
class Error : public runtime_error {
  public:
    explicit Error(const string& message) : runtime_error(message) {}
    virtual string kind() const { return "Error"; }
};

// the structure produced no residues to build a contact graph from
class EmptyStructureError : public Error {
  public:
    explicit EmptyStructureError(const string& message) : Error(message) {}
    string kind() const { return "EmptyStructureError"; }
};

// gapped query and target strings of an alignment differ in length
class AlignmentLengthMismatchError : public Error {
  public:
    explicit AlignmentLengthMismatchError(const string& message) : Error(message) {}
    string kind() const { return "AlignmentLengthMismatchError"; }
};

// a parameter is out of its allowed range
class ConfigurationError : public Error {
  public:
    explicit ConfigurationError(const string& message) : Error(message) {}
    string kind() const { return "ConfigurationError"; }
};

class Structure {
  friend class Chain;

  public:
    Structure();
    Structure(const string& pdbFile, string options = "");
    Structure(istream& is, string options = "");
    Structure(const Structure& S);
    ~Structure();

    static Structure fromPDBString(const string& pdbText, string options = "");

    void readPDB(const string& pdbFile, string options = "");
    void readPDB(istream& is, string options = "");
    void writePDB(const string& pdbFile) const;
    void writePDB(ostream& ofs) const;
    void reset();
    Structure& operator=(const Structure& A);

    int chainSize() const { return chains.size(); }
    int residueSize() const { return numResidues; }
    int atomSize() const { return numAtoms; }
    Chain& getChain(int i) const { return (*this)[i]; }
    Chain& operator[](int i) const { return *(chains[i]); }
    Residue& getResidue(int i) const;
    vector<Residue*> getResidues() const;
    vector<Atom*> getAtoms() const;
    void setName(const string& _name) { name = _name; }
    string getName() const { return name; }

    /* Coordinates of the named atom of every residue, in chain order. With
     * strict set, a residue lacking the atom is an error; otherwise it is
     * skipped (and the residue order of the result no longer matches that
     * of the structure). With maxResidues >= 0, only the first maxResidues
     * residues are looked at. */
    vector<CartesianPoint> getAtomCoordinates(const string& atomName = "CA", bool strict = true, int maxResidues = -1) const;

    // takes ownership of the chain; chains with repeated IDs are renamed if allowed
    bool appendChain(Chain* C, bool allowRename = true);
    Chain* appendChain(const string& cid, bool allowRename = true);

  protected:
    void incrementNumAtoms(int delta = 1) { numAtoms += delta; }
    void incrementNumResidues(int delta = 1) { numResidues += delta; }
    void deletePointers();
    void copy(const Structure& S);

  private:
    vector<Chain*> chains;
    string name;
    int numResidues, numAtoms;
    map<string, Chain*> chainsByID;
};

class Chain {
  friend class Residue;
  friend class Structure;

  public:
    Chain();
    Chain(const Chain& C);
    Chain(const string& chainID, const string& segID);
    ~Chain();

    int residueSize() const { return residues.size(); }
    int atomSize() const { return numAtoms; }
    Residue& operator[](int i) const { return *(residues[i]); }
    Residue& getResidue(int i) const { return (*this)[i]; }
    vector<Residue*> getResidues() const { return residues; }
    string getID() const { return cid; }
    string getSegID() const { return sid; }
    Structure* getParent() const { return parent; }
    void setID(const string& _cid) { cid = _cid; }
    void setSegID(const string& _sid) { sid = _sid; }

    // takes ownership of the residue
    void appendResidue(Residue* R);

  protected:
    void setParent(Structure* p) { parent = p; } // will not itself update residue/atom counts in parent
    void incrementNumAtoms(int delta = 1);

  private:
    vector<Residue*> residues;
    Structure* parent;
    int numAtoms;
    string cid, sid;
};

class Residue {
  friend class Structure;
  friend class Chain;

  public:
    Residue();
    Residue(const Residue& R);
    Residue(const string& _resname, int _resnum, char _icode = ' ');
    ~Residue();

    int atomSize() const { return atoms.size(); }
    vector<Atom*> getAtoms() const { return atoms; }
    Atom& operator[](int i) const { return *(atoms[i]); }
    Atom& getAtom(int i) const { return *(atoms[i]); }
    Chain* getParent() const { return parent; }
    string getChainID() const;
    string getName() const { return resname; }
    int getNum() const { return resnum; }
    char getIcode() const { return icode; }
    bool isNamed(const string& _name) const { return (resname.compare(_name) == 0); }
    Atom* findAtom(const string& _name, bool strict = true) const; // returns NULL if not found and if strict is false

    // takes ownership of the atom
    void appendAtom(Atom* A);

    friend ostream & operator<<(ostream &_os, const Residue& _res) {
      if (_res.getParent() != NULL) {
        _os << _res.getParent()->getID() << ",";
      }
      _os << _res.getNum() << " " << _res.getName();
      return _os;
    }

  protected:
    void setParent(Chain* _parent) { parent = _parent; }

  private:
    vector<Atom*> atoms;
    Chain* parent;
    int resnum;
    string resname;
    char icode;
};

class Atom {
  friend class Residue;

  public:
    Atom();
    Atom(const Atom& A);
    Atom(int _index, const string& _name, tplreal _x, tplreal _y, tplreal _z, tplreal _B, tplreal _occ, bool _het, char _alt = ' ');

    tplreal getX() const { return x; }
    tplreal getY() const { return y; }
    tplreal getZ() const { return z; }
    CartesianPoint getCoor() const;
    tplreal getB() const { return B; }
    tplreal getOcc() const { return occ; }
    string getName() const { return name; }
    bool isHetero() const { return het; }
    int getIndex() const { return index; }
    char getAlt() const { return alt; }
    bool isNamed(const string& _name) const { return (name.compare(_name) == 0); }
    Residue* getParent() const { return parent; }

    string pdbLine(int resIndex, int atomIndex) const;

  protected:
    void setParent(Residue* _parent) { parent = _parent; }

  private:
    tplreal x, y, z, B, occ;
    string name;
    char alt;
    bool het;
    int index;
    Residue* parent;
};

class CartesianPoint : public vector<tplreal> {
  public:
    CartesianPoint() : vector<tplreal>() { }
    CartesianPoint(size_t sz) : vector<tplreal>(sz) { }
    CartesianPoint(const CartesianPoint& other) : vector<tplreal>(other) { }
    CartesianPoint(const vector<tplreal>& other) : vector<tplreal>(other) { }
    CartesianPoint(tplreal x, tplreal y, tplreal z) : vector<tplreal>(3, 0) { (*this)[0] = x; (*this)[1] = y; (*this)[2] = z; }
    CartesianPoint(const Atom& A);

    CartesianPoint& operator=(const CartesianPoint& other) { vector<tplreal>::operator=(other); return *this; }

    tplreal getX() const { return (*this)[0]; }
    tplreal getY() const { return (*this)[1]; }
    tplreal getZ() const { return (*this)[2]; }

    tplreal distance(const CartesianPoint& another) const;
    tplreal distance2(const CartesianPoint& another) const;
    tplreal distance2nc(const CartesianPoint& another) const; // no size check (for speed)

    friend ostream & operator<<(ostream &_os, const CartesianPoint& _p) {
      for (int i = 0; i < _p.size(); i++) {
        _os << _p[i];
        if (i != _p.size() - 1) _os << " ";
      }
      return _os;
    }
};

/* Bucketed 3D grid over a point cloud. Points are binned into an N x N x N
 * grid spanning the bounding box, so a range query only visits buckets that
 * can hold points within the requested distance. */
class ProximitySearch {
  public:
    ProximitySearch() { xlo = ylo = zlo = xhi = yhi = zhi = xbw = ybw = zbw = 0.0; N = 0; }
    ProximitySearch(const vector<CartesianPoint>& points, tplreal characteristicDistance, tplreal pad = 0);

    int pointSize() const { return pointList.size(); }
    const CartesianPoint& getPoint(int i) const { return pointList[i]; }
    int getPointTag(int i) const { return pointTags[i]; }
    int gridSize() const { return N; }

    void addPoint(const CartesianPoint& _p, int tag);

    /* Finds points whose distance d to c satisfies dmin <= d <= dmax. Returns
     * whether any were found; if list is given, point indices (or tags, with
     * byTag) are written into it. */
    bool pointsWithin(const CartesianPoint& c, tplreal dmin, tplreal dmax, vector<int>* list = NULL, bool byTag = false) const;
    vector<int> getPointsWithin(const CartesianPoint& c, tplreal dmin, tplreal dmax, bool byTag = false) const;

    static void calculateExtent(const vector<CartesianPoint>& points, tplreal& _xlo, tplreal& _ylo, tplreal& _zlo, tplreal& _xhi, tplreal& _yhi, tplreal& _zhi);

  protected:
    void reinitBuckets(int _N);
    void setBinWidths();
    void pointBucket(tplreal px, tplreal py, tplreal pz, int* i, int* j, int* k) const;
    tplreal limitX(tplreal x) const { return (x < xlo) ? xlo : ((x > xhi) ? xhi : x); }
    tplreal limitY(tplreal y) const { return (y < ylo) ? ylo : ((y > yhi) ? yhi : y); }
    tplreal limitZ(tplreal z) const { return (z < zlo) ? zlo : ((z > zhi) ? zhi : z); }

  private:
    int N; // dimension of bucket list is N x N x N
    tplreal xlo, ylo, zlo, xhi, yhi, zhi, xbw, ybw, zbw;

    // each bucket holds indices into pointList/pointTags
    vector<vector<vector<vector<int> > > > buckets;
    vector<CartesianPoint> pointList;
    vector<int> pointTags;
};

}

/* A simple timer class built on top of chrono::high_resolution_clock */
class TplTimer {
  public:
    enum timeUnits { sec = 0, msec, usec };

    TplTimer() {
      running = false;
      begin = chrono::high_resolution_clock::now();
      elapsed = begin - begin;
    }
    bool isRunning() const { return running; }
    bool start() {
      if (running) return false;
      running = true;
      elapsed = begin - begin;
      begin = chrono::high_resolution_clock::now();
      return true;
    }
    bool stop() {
      if (!running) return false;
      running = false;
      elapsed += (chrono::high_resolution_clock::now() - begin);
      return true;
    }
    long getDuration(timeUnits units = timeUnits::sec) const {
      chrono::high_resolution_clock::duration dt = running ? chrono::high_resolution_clock::now() - begin : elapsed;
      switch (units) {
        case timeUnits::sec:
          return chrono::duration_cast<std::chrono::seconds>(dt).count();
        case timeUnits::msec:
          return chrono::duration_cast<std::chrono::milliseconds>(dt).count();
        case timeUnits::usec:
          return chrono::duration_cast<std::chrono::microseconds>(dt).count();
      }
      return 0;
    }

  private:
    bool running;
    chrono::high_resolution_clock::time_point begin;
    chrono::high_resolution_clock::duration elapsed;
};

/* Utilities class, defined outside of the TPL namespace since it is not a
 * TPL type and some of its names (error, warn) are likely to clash elsewhere. */
class TplUtils {
  public:
    template <class F>
    static void openFile(F& fs, const string& filename, ios_base::openmode mode = ios_base::in, string from = "");
    static vector<string> fileToArray(const string& _filename);
    static string trim(const string& str, string delimiters = " \t\n\v\f\r");
    static void warn(const string& message, string from = "");

    // formats the message and throws TPL::Error
    static void error(const string& message, string from = "");
    static void assertCond(bool condition, string message = "error: assertion failed", string from = "");

    // message formatting shared by error() and the typed errors thrown directly
    static string errorMessage(const string& message, string from = "");
    static string uc(const string& str);
    static string wrapText(const string& message, int width, int leftSkip = 0, int startingOffset = 0);
    static int toInt(const string& num, bool strict = true);
    static bool isInt(const string& num);
    static TPL::tplreal toReal(const string& num, bool strict = true);
    static bool isReal(const string& num);
    static vector<string> split(const string& str, string delimiters = " ", bool skipTrailingDelims = true);
    static string join(const string& delim, const vector<string>& words);

    template <class T>
    static string toString(const T& obj) {
      stringstream ss;
      ss << obj;
      return ss.str();
    }
    template <class T>
    static bool closeEnough(const T& a, const T& b, const T& epsilon = std::numeric_limits<T>::epsilon()) {
      return (a - b > -epsilon) && (a - b < epsilon);
    }
};

template <class F>
void TplUtils::openFile(F& fs, const string& filename, ios_base::openmode mode, string from) {
  fs.open(filename.c_str(), mode);
  if (!fs.is_open()) {
    if (!from.empty()) from += " -> ";
    TplUtils::error("could not open file '" + filename + "'", from + "TplUtils::openFile");
  }
}

#endif
