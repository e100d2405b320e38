#ifndef _TPLSEARCH_H
#define _TPLSEARCH_H

#include "tpltypes.h"

namespace TPL {

/* One row of a sequence-search result table. */
class searchHit {
  public:
    searchHit() {
      fident = qcov = tcov = evalue = bits = 0;
      alnlen = mismatch = gapopen = qstart = qend = tstart = tend = 0;
    }

    // the structure identifier is the target name without its last ".suffix"
    string targetStructureId() const;
    bool hasAlignment() const { return !qaln.empty() || !taln.empty(); }

    // 0-based residue where the local alignment starts; an unset (0) start counts as 1
    int queryOffset() const { return (qstart > 1) ? qstart - 1 : 0; }
    int targetOffset() const { return (tstart > 1) ? tstart - 1 : 0; }

    /* Field access by column name, as used for reading and writing tables.
     * Unknown column names are an error. */
    string getField(const string& column) const;
    void setField(const string& column, const string& value);

    static const vector<string>& columns() { return allColumns; }
    static const vector<string>& requiredColumns() { return reqColumns; }
    static bool isColumn(const string& column);

    string query, target;
    tplreal fident;
    int alnlen, mismatch, gapopen, qstart, qend, tstart, tend;
    tplreal qcov, tcov, evalue, bits;
    string qaln, taln;

  private:
    static bool initConstants();
    static vector<string> allColumns;
    static vector<string> reqColumns;
    static bool initialized;
};

/* A table of search hits plus the files it came from. */
class searchResult {
  public:
    searchResult() {}
    searchResult(const vector<searchHit>& _hits, const string& _queryFasta = "", const string& _database = "") {
      hits = _hits; queryFasta = _queryFasta; database = _database;
    }

    int size() const { return hits.size(); }
    bool empty() const { return hits.empty(); }
    const searchHit& operator[](int i) const { return hits[i]; }
    searchHit& operator[](int i) { return hits[i]; }
    const vector<searchHit>& getHits() const { return hits; }
    void addHit(const searchHit& hit) { hits.push_back(hit); }

    string getQueryFasta() const { return queryFasta; }
    string getDatabase() const { return database; }
    void setQueryFasta(const string& _queryFasta) { queryFasta = _queryFasta; }
    void setDatabase(const string& _database) { database = _database; }

    /* Reads a tab-separated table with a header row. Lines starting with '#'
     * are comments, except that "#Query:" and "#Database:" lines set the
     * metadata. Columns may come in any order; unknown ones are ignored and
     * missing required ones are an error. */
    static searchResult readTSV(const string& file);
    static searchResult readTSV(istream& is, const string& source = "");

    // writes the metadata lines, a header and one row per hit; qaln/taln only if any hit has them
    void writeTSV(const string& file) const;
    void writeTSV(ostream& os) const;

    searchResult filter(tplreal minIdentity, tplreal minBits = 0) const;
    // by descending identity, ties broken by ascending e-value
    void sortByIdentity();
    // the k best hits (by identity) of every query, queries in order of first appearance
    searchResult topK(int k) const;
    searchResult hitsForQuery(const string& query) const;
    vector<string> queries() const;

  private:
    vector<searchHit> hits;
    string queryFasta, database;
};

}

#endif
