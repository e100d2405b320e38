#ifndef _TPLEXTERNAL_H
#define _TPLEXTERNAL_H

#include "tplsystem.h"
#include "tplsearch.h"

// For classes that need to interact with non-TPL programs

namespace TPL {

class searchParams {
  public:
    searchParams() {
      maxEval = 1e-4;
      sens = 5.7;
      nThreads = 1;
      indexTarget = true;
      verbose = false;
    }

    tplreal getMaxEvalue() const { return maxEval; }
    tplreal getSensitivity() const { return sens; }
    int getThreads() const { return nThreads; }
    bool indexTargetDB() const { return indexTarget; }
    bool isVerbose() const { return verbose; }

    void setMaxEvalue(tplreal _maxEval) { maxEval = _maxEval; }
    void setSensitivity(tplreal _sens) { sens = _sens; }
    void setThreads(int _nThreads) { nThreads = _nThreads; }
    void setIndexTarget(bool _indexTarget) { indexTarget = _indexTarget; }
    void setVerbose(bool _verbose) { verbose = _verbose; }

    // sensitivity outside [1.0, 7.5], a non-positive e-value or thread count is a ConfigurationError
    void validate() const;

  private:
    tplreal maxEval, sens;
    int nThreads;
    bool indexTarget, verbose;
};

/**
 MMseqs2 is a sequence search suite. This class is a wrapper that builds its
 command lines, runs them through external calls and parses the tabular
 output. Hits always carry the gapped alignment strings (qaln, taln).

 https://github.com/soedinglab/MMseqs2
 */
class mmseqsInterface {
  public:
    /**
     @param _mmseqsBin Path to the mmseqs binary (or its name, if on the PATH)
     */
    mmseqsInterface(const string& _mmseqsBin = "mmseqs") : mmseqsBin(_mmseqsBin) {}

    string createdbCommand(const string& fastaFile, const string& dbPath) const;
    string createindexCommand(const string& dbPath, const string& tmpDir, int threads = 1) const;
    string searchCommand(const string& queryDB, const string& targetDB, const string& resultDB, const string& tmpDir, const searchParams& params) const;
    string convertalisCommand(const string& queryDB, const string& targetDB, const string& resultDB, const string& outTSV) const;

    void createdb(const string& fastaFile, const string& dbPath) const;
    void createindex(const string& dbPath, int threads = 1) const;

    /* Builds a target database from a FASTA file, indexing it if requested. */
    void createTargetDatabase(const string& fastaFile, const string& dbPath, bool index = true, int threads = 1) const;

    /**
     Searches the query sequences against the target and returns the hits.

     @param queryFasta FASTA file of query sequences
     @param target An MMseqs2 database, or a FASTA file (detected by a leading '>'), which is
                   converted to a database next to it first
     @param outTSV If not empty, the result table is also written here
     */
    searchResult search(const string& queryFasta, const string& target, const searchParams& params, const string& outTSV = "") const;

    /**
     @return True if every file of an indexed database is present. The first missing file is reported
             as a warning.
     */
    static bool isValidDatabase(const string& dbPath);
    static vector<string> databaseExtensions();
    static vector<string> outputColumns();

    // does the file start with a FASTA header?
    static bool isFasta(const string& path);

  private:
    string mmseqsBin;
};

}

#endif
