#include <dirent.h>
#include <cstdlib>
#include "tpltypes.h"
#include "tplsystem.h"
#include "tplsearch.h"
#include "tplexternal.h"

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

bool contains(const string& str, const string& part) {
  return str.find(part) != string::npos;
}

// entries of a directory other than . and ..
int entryCount(const string& path) {
  DIR* d = opendir(path.c_str());
  if (d == NULL) TplUtils::error("could not open directory '" + path + "'", "entryCount");
  int n = 0;
  struct dirent* ent;
  while ((ent = readdir(d)) != NULL) {
    string name = ent->d_name;
    if ((name != ".") && (name != "..")) n++;
  }
  closedir(d);
  return n;
}

int main(int argc, char** argv) {
  string dir;
  try {
    // columns in any order, an unknown column, metadata and comments
    stringstream table;
    table << "#Query:queries.fasta" << endl;
    table << "#Database:pdb_seqres" << endl;
    table << "# a comment" << endl;
    table << "target\tquery\tfident\tprob\tevalue\tbits\tqaln\ttaln" << endl;
    table << "1abc.A\tq1\t0.45\t0.9\t1e-10\t120.5\tAB-D\tABCD" << endl;
    table << "2xyz\tq1\t0.9\t0.99\t1e-20\t200\tABCD\tABCD\r" << endl;
    table << endl;
    table << "3def.B\tq2\t0.9\t0.5\t1e-05\t80\tMK\tMR" << endl;
    table << "4ghi.C\tq1\t0.9\t0.5\t1e-30\t210\tABCD\tAB-D" << endl;
    table << "5jkl\tq2\t0.3\t0.1\t0.001\t40\tMK\tM-" << endl;
    searchResult res = searchResult::readTSV(table, "table");
    TplUtils::assertCond(res.size() == 5, "failed on 'read table': expected 5 hits, got " + TplUtils::toString(res.size()));
    TplUtils::assertCond((res.getQueryFasta() == "queries.fasta") && (res.getDatabase() == "pdb_seqres"), "failed on 'read table': metadata not read");
    TplUtils::assertCond((res[0].query == "q1") && (res[0].target == "1abc.A"), "failed on 'read table': columns mixed up");
    TplUtils::assertCond(TplUtils::closeEnough(res[0].fident, 0.45, 1e-9) && TplUtils::closeEnough(res[0].bits, 120.5, 1e-9), "failed on 'read table': numeric columns");
    TplUtils::assertCond(res[1].taln == "ABCD", "failed on 'read table': a trailing carriage return should be dropped");
    TplUtils::assertCond((res[0].qaln == "AB-D") && res[0].hasAlignment(), "failed on 'read table': alignment strings");

    // structure identifiers
    TplUtils::assertCond(res[0].targetStructureId() == "1abc", "failed on 'structure id': the chain suffix should be removed");
    TplUtils::assertCond(res[1].targetStructureId() == "2xyz", "failed on 'structure id': a plain name should be kept");

    // query order, filtering and ranking
    {
      vector<string> q = res.queries();
      TplUtils::assertCond((q.size() == 2) && (q[0] == "q1") && (q[1] == "q2"), "failed on 'queries': expected q1 then q2");
      TplUtils::assertCond(res.filter(0.5).size() == 3, "failed on 'filter': expected 3 hits with identity of at least 0.5");
      TplUtils::assertCond(res.filter(0.0, 100).size() == 3, "failed on 'filter': expected 3 hits with at least 100 bits");
      TplUtils::assertCond(res.filter(0.5).getDatabase() == "pdb_seqres", "failed on 'filter': metadata should be kept");

      searchResult top = res.topK(1);
      TplUtils::assertCond(top.size() == 2, "failed on 'top hits': expected one hit per query");
      // identity ties go to the smaller e-value
      TplUtils::assertCond((top[0].query == "q1") && (top[0].target == "4ghi.C"), "failed on 'top hits': wrong best hit for q1, got " + top[0].target);
      TplUtils::assertCond(top[1].target == "3def.B", "failed on 'top hits': wrong best hit for q2");
      TplUtils::assertCond(res.topK(10).size() == 5, "failed on 'top hits': k beyond the hit count should keep everything");
      TplUtils::assertCond(res.topK(0).empty(), "failed on 'top hits': k = 0 should keep nothing");
      TplUtils::assertCond(raises<ConfigurationError>([&]() { res.topK(-1); }), "failed on 'top hits': negative k accepted");

      searchResult q1 = res.hitsForQuery("q1");
      q1.sortByIdentity();
      TplUtils::assertCond((q1.size() == 3) && (q1[0].target == "4ghi.C") && (q1[1].target == "2xyz") && (q1[2].target == "1abc.A"), "failed on 'sort': unexpected order");
    }

    // write and read back
    {
      stringstream ss;
      res.writeTSV(ss);
      searchResult back = searchResult::readTSV(ss);
      TplUtils::assertCond(back.size() == res.size(), "failed on 'write table': hit count changed");
      TplUtils::assertCond(back.getQueryFasta() == res.getQueryFasta(), "failed on 'write table': metadata changed");
      for (int i = 0; i < res.size(); i++) {
        TplUtils::assertCond((back[i].target == res[i].target) && (back[i].qaln == res[i].qaln) && (back[i].taln == res[i].taln), "failed on 'write table': hit " + TplUtils::toString(i) + " changed");
        TplUtils::assertCond(TplUtils::closeEnough(back[i].evalue, res[i].evalue, 1e-12), "failed on 'write table': e-value of hit " + TplUtils::toString(i) + " changed");
      }

      // scores survive a write and read at full precision
      searchHit fine;
      fine.query = "q"; fine.target = "t";
      fine.fident = 0.123456789012345;
      fine.evalue = 1.234567891234e-10;
      fine.bits = 123.456789012;
      stringstream precise;
      searchResult(vector<searchHit>(1, fine)).writeTSV(precise);
      searchResult exact = searchResult::readTSV(precise);
      TplUtils::assertCond(exact[0].evalue == fine.evalue, "failed on 'write table': e-value lost precision, read back " + exact[0].getField("evalue"));
      TplUtils::assertCond(exact[0].bits == fine.bits, "failed on 'write table': bit score lost precision, read back " + exact[0].getField("bits"));
      TplUtils::assertCond(exact[0].fident == fine.fident, "failed on 'write table': identity lost precision");

      // without alignments, the alignment columns are left out
      searchHit bare;
      bare.query = "q"; bare.target = "t";
      stringstream noAln;
      searchResult(vector<searchHit>(1, bare)).writeTSV(noAln);
      TplUtils::assertCond(!contains(noAln.str(), "qaln"), "failed on 'write table': alignment columns written for hits without alignments");
    }

    // malformed tables
    {
      stringstream missing("query\ttarget\tfident\tbits\nq\tt\t0.5\t10\n");
      TplUtils::assertCond(raises<Error>([&]() { searchResult::readTSV(missing); }), "failed on 'bad table': missing evalue column accepted");
      stringstream ragged("query\ttarget\tfident\tevalue\tbits\nq\tt\t0.5\t1e-3\n");
      TplUtils::assertCond(raises<Error>([&]() { searchResult::readTSV(ragged); }), "failed on 'bad table': short row accepted");
      stringstream dup("query\ttarget\tfident\tevalue\tbits\tbits\n");
      TplUtils::assertCond(raises<Error>([&]() { searchResult::readTSV(dup); }), "failed on 'bad table': repeated column accepted");
      stringstream number("query\ttarget\tfident\tevalue\tbits\nq\tt\tabc\t1e-3\t10\n");
      TplUtils::assertCond(raises<Error>([&]() { searchResult::readTSV(number); }), "failed on 'bad table': non-numeric identity accepted");
      stringstream empty("# nothing here\n");
      TplUtils::assertCond(raises<Error>([&]() { searchResult::readTSV(empty); }), "failed on 'bad table': a table without a header accepted");
      searchHit h;
      TplUtils::assertCond(raises<Error>([&]() { h.setField("nonsense", "1"); }), "failed on 'fields': unknown column accepted");
    }

    // search parameters
    {
      searchParams sp;
      sp.validate();
      sp.setSensitivity(8.0);
      TplUtils::assertCond(raises<ConfigurationError>([&]() { sp.validate(); }), "failed on 'search parameters': sensitivity above 7.5 accepted");
      sp.setSensitivity(7.5);
      sp.validate();
      sp.setMaxEvalue(0);
      TplUtils::assertCond(raises<ConfigurationError>([&]() { sp.validate(); }), "failed on 'search parameters': zero e-value accepted");
      sp.setMaxEvalue(1e-4);
      sp.setThreads(0);
      TplUtils::assertCond(raises<ConfigurationError>([&]() { sp.validate(); }), "failed on 'search parameters': zero threads accepted");
    }

    // command lines
    {
      mmseqsInterface mm("/opt/mmseqs/bin/mmseqs");
      searchParams sp;
      sp.setThreads(4);
      string cmd = mm.searchCommand("qdb", "tdb", "rdb", "tmp", sp);
      TplUtils::assertCond(cmd.find("/opt/mmseqs/bin/mmseqs search") == 0, "failed on 'search command': " + cmd);
      TplUtils::assertCond(contains(cmd, "-e 0.0001") && contains(cmd, "--threads 4") && contains(cmd, "-s 5.7"), "failed on 'search command': parameters missing from " + cmd);
      TplUtils::assertCond(contains(cmd, "'qdb' 'tdb' 'rdb' 'tmp'"), "failed on 'search command': paths missing from " + cmd);
      string conv = mm.convertalisCommand("qdb", "tdb", "rdb", "out.tsv");
      TplUtils::assertCond(contains(conv, "--format-mode 4") && contains(conv, "--format-output query,target,fident,"), "failed on 'convertalis command': " + conv);
      TplUtils::assertCond(contains(conv, ",qaln,taln"), "failed on 'convertalis command': alignment columns missing from " + conv);
      TplUtils::assertCond(contains(mm.createdbCommand("my seqs.fasta", "db"), "'my seqs.fasta'"), "failed on 'createdb command': path not quoted");
      TplUtils::assertCond(contains(mm.createindexCommand("db", "tmp", 2), "--threads 2"), "failed on 'createindex command'");
    }

    // database completeness and FASTA detection
    {
      dir = TplSys::makeTempDir("tpl-test-search");
      string db = TplSys::joinPath(dir, "targets");
      vector<string> exts = mmseqsInterface::databaseExtensions();
      TplUtils::assertCond(exts.size() == 10, "failed on 'database files': expected 10 database files");
      for (int i = 0; i < exts.size(); i++) {
        TplUtils::assertCond(!mmseqsInterface::isValidDatabase(db), "failed on 'database files': incomplete database accepted");
        fstream ofs;
        TplUtils::openFile(ofs, db + exts[i], fstream::out);
        ofs.close();
      }
      TplUtils::assertCond(mmseqsInterface::isValidDatabase(db), "failed on 'database files': complete database rejected");

      string fasta = TplSys::joinPath(dir, "targets.fasta");
      fstream ofs;
      TplUtils::openFile(ofs, fasta, fstream::out);
      ofs << ">t1" << endl << "MKV" << endl;
      ofs.close();
      TplUtils::assertCond(mmseqsInterface::isFasta(fasta), "failed on 'FASTA detection': FASTA file not recognized");
      TplUtils::assertCond(!mmseqsInterface::isFasta(db + ".index"), "failed on 'FASTA detection': empty file taken for FASTA");
      TplUtils::assertCond(!mmseqsInterface::isFasta(dir), "failed on 'FASTA detection': directory taken for FASTA");
      TplSys::crmdir(dir, true);
      dir.clear();
    }

    // scratch directories are removed when they go out of scope
    {
      string path;
      {
        TplTempDir scratch("tpl-test-scratch");
        path = scratch.getPath();
        TplUtils::assertCond(TplSys::isDir(path), "failed on 'scratch directory': not created");
        fstream ofs;
        TplUtils::openFile(ofs, TplSys::joinPath(path, "note.txt"), fstream::out);
        ofs << "x" << endl;
        ofs.close();
      }
      TplUtils::assertCond(!TplSys::fileExists(path), "failed on 'scratch directory': " + path + " left behind");
    }

    // a failing search leaves no scratch directories behind
    {
      dir = TplSys::makeTempDir("tpl-test-failing-search");
      const char* prevTmp = getenv("TMPDIR");
      string prev = (prevTmp == NULL) ? "" : prevTmp;
      setenv("TMPDIR", dir.c_str(), 1);
      mmseqsInterface broken("false");
      bool failed = raises<Error>([&]() { broken.search("queries.fasta", "targetDB", searchParams()); });
      bool failedIndex = raises<Error>([&]() { broken.createindex("targetDB"); });
      int left = entryCount(dir);
      if (prevTmp == NULL) unsetenv("TMPDIR");
      else setenv("TMPDIR", prev.c_str(), 1);
      TplUtils::assertCond(failed && failedIndex, "failed on 'failing search': a failing mmseqs command should raise an error");
      TplUtils::assertCond(left == 0, "failed on 'failing search': " + TplUtils::toString(left) + " scratch entries left behind");
      TplSys::crmdir(dir, true);
      dir.clear();
    }
  } catch (const Error& e) {
    cerr << e.what() << endl;
    if (!dir.empty() && TplSys::isDir(dir)) TplSys::crmdir(dir, true);
    return 1;
  }
  cout << "all search tests passed" << endl;
  return 0;
}
