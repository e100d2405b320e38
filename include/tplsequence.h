#ifndef _TPLSEQUENCE_H
#define _TPLSEQUENCE_H

#include "tpltypes.h"

namespace TPL {

/* A named one-letter residue string. Alignment rows are Sequences too, in
 * which case they may contain the gap symbol. */
class Sequence {
  public:
    Sequence() {}
    Sequence(const Structure& S);
    Sequence(const string& _seq, const string& _name = "") { seq = _seq; name = _name; }

    string getName() const { return name; }
    void setName(const string& _name) { name = _name; }
    string toString() const { return seq; }
    char& operator[] (int i) { return seq[i]; }
    char operator[] (int i) const { return seq[i]; }
    int length() const { return seq.size(); }
    int size() const { return seq.size(); }
    int ungappedLength() const;
    bool isGap(int i) const;
    Sequence ungapped() const;
    void appendResidue(char aa) { seq.push_back(aa); }

    bool operator==(const Sequence& other) const { return (seq == other.seq) && (name == other.name); }
    bool operator!=(const Sequence& other) const { return !(*this == other); }
    friend ostream & operator<<(ostream &_os, const Sequence& _seq) {
      _os << _seq.seq;
      return _os;
    }

  private:
    string seq;
    string name;
};

class SeqTools {
  public:
    // A kind of a constructor for all the static variables, called automatically.
    static bool initConstants();

    static char gapChar() { return '-'; }
    static bool isGap(char c) { return c == gapChar(); }

    // three-letter to one-letter code; unknown names become 'X'
    static string toSingle(const string& aa);
    static string tripleToSingle(const vector<string>& triples);

    static vector<Sequence> readFasta(const string& fastaFile);
    static void readFasta(const string& fastaFile, vector<Sequence>& seqs);
    static void writeFasta(const string& fastaFile, const vector<Sequence>& seqs);

    /* Keeps the sequences whose length lies in [minLen, maxLen]. Names and
     * lengths of the removed ones are written into skipped, if given. Errors
     * if no sequences are given or none survive. */
    static vector<Sequence> filterByLength(const vector<Sequence>& seqs, int minLen = 60, int maxLen = 1000, map<string, int>* skipped = NULL);

    // tab-separated "name length" rows, with a header, for what filterByLength removed
    static void writeSkipped(const string& file, const map<string, int>& skipped);

    /* One-hot encoding over the 26-symbol vocabulary returned by oneHotAlphabet().
     * Row i of the result has a single 1 in the column of the i-th symbol. */
    static vector<vector<int> > oneHot(const string& seq);
    static string oneHotAlphabet() { return vocab; }

  private:
    static map<string, string> aa3ToAA1;
    static string vocab;
    static map<char, int> vocabIdx;
    static bool initialized;
};

}

#endif
