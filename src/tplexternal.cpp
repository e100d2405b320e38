#include "tplexternal.h"
using namespace TPL;

void searchParams::validate() const {
  string from = "searchParams::validate";
  if (!((sens >= 1.0) && (sens <= 7.5))) throw ConfigurationError(TplUtils::errorMessage("sensitivity should be between 1.0 and 7.5, got " + TplUtils::toString(sens), from));
  if (!(maxEval > 0)) throw ConfigurationError(TplUtils::errorMessage("maximum e-value must be positive, got " + TplUtils::toString(maxEval), from));
  if (nThreads < 1) throw ConfigurationError(TplUtils::errorMessage("number of threads must be at least 1, got " + TplUtils::toString(nThreads), from));
}

vector<string> mmseqsInterface::databaseExtensions() {
  string exts[] = {".index", ".dbtype", "_h", "_h.index", "_h.dbtype", ".idx", ".idx.index", ".idx.dbtype", ".lookup", ".source"};
  return vector<string>(exts, exts + sizeof(exts)/sizeof(exts[0]));
}

vector<string> mmseqsInterface::outputColumns() {
  return searchHit::columns();
}

bool mmseqsInterface::isValidDatabase(const string& dbPath) {
  vector<string> exts = databaseExtensions();
  for (int i = 0; i < exts.size(); i++) {
    if (!TplSys::fileExists(dbPath + exts[i])) {
      TplUtils::warn("database file '" + dbPath + exts[i] + "' is missing", "mmseqsInterface::isValidDatabase");
      return false;
    }
  }
  return true;
}

bool mmseqsInterface::isFasta(const string& path) {
  if (TplSys::isDir(path)) return false;
  fstream ifs;
  ifs.open(path.c_str(), fstream::in);
  if (!ifs.is_open()) return false;
  string line;
  bool fasta = getline(ifs, line) && (line.find(">") == 0);
  ifs.close();
  return fasta;
}

string mmseqsInterface::createdbCommand(const string& fastaFile, const string& dbPath) const {
  return mmseqsBin + " createdb " + TplSys::shellQuote(fastaFile) + " " + TplSys::shellQuote(dbPath) + " --dbtype 1";
}

string mmseqsInterface::createindexCommand(const string& dbPath, const string& tmpDir, int threads) const {
  return mmseqsBin + " createindex " + TplSys::shellQuote(dbPath) + " " + TplSys::shellQuote(tmpDir) + " --threads " + TplUtils::toString(threads);
}

string mmseqsInterface::searchCommand(const string& queryDB, const string& targetDB, const string& resultDB, const string& tmpDir, const searchParams& params) const {
  return mmseqsBin + " search -e " + TplUtils::toString(params.getMaxEvalue()) + " --threads " + TplUtils::toString(params.getThreads()) +
         " -s " + TplUtils::toString(params.getSensitivity()) + " " + TplSys::shellQuote(queryDB) + " " + TplSys::shellQuote(targetDB) + " " +
         TplSys::shellQuote(resultDB) + " " + TplSys::shellQuote(tmpDir);
}

string mmseqsInterface::convertalisCommand(const string& queryDB, const string& targetDB, const string& resultDB, const string& outTSV) const {
  return mmseqsBin + " convertalis " + TplSys::shellQuote(queryDB) + " " + TplSys::shellQuote(targetDB) + " " + TplSys::shellQuote(resultDB) + " " +
         TplSys::shellQuote(outTSV) + " --format-mode 4 --format-output " + TplUtils::join(",", outputColumns());
}

void mmseqsInterface::createdb(const string& fastaFile, const string& dbPath) const {
  TplSys::csystem(createdbCommand(fastaFile, dbPath), true, 0, "mmseqsInterface::createdb");
}

void mmseqsInterface::createindex(const string& dbPath, int threads) const {
  TplTempDir tmpDir("tpl-createindex");
  TplSys::csystem(createindexCommand(dbPath, tmpDir.getPath(), threads), true, 0, "mmseqsInterface::createindex");
}

void mmseqsInterface::createTargetDatabase(const string& fastaFile, const string& dbPath, bool index, int threads) const {
  createdb(fastaFile, dbPath);
  if (index) createindex(dbPath, threads);
}

searchResult mmseqsInterface::search(const string& queryFasta, const string& target, const searchParams& params, const string& outTSV) const {
  params.validate();
  TplTempDir scratchDir("tpl-search");
  string tmpDir = scratchDir.getPath();
  string queryDB = TplSys::joinPath(tmpDir, "query.mmseqsDB");
  string resultDB = TplSys::joinPath(tmpDir, "search_resultDB");
  string tsv = TplSys::joinPath(tmpDir, "search_results.tsv");
  string scratch = TplSys::joinPath(tmpDir, "tmp");
  TplSys::cmkdir(scratch);

  string targetDB = target;
  if (isFasta(target)) {
    targetDB = TplSys::pathBase(target) + ".mmseqsDB";
    if (params.isVerbose()) cout << "building target database " << targetDB << " from " << target << endl;
    createTargetDatabase(target, targetDB, params.indexTargetDB(), params.getThreads());
  }

  TplTimer timer; timer.start();
  createdb(queryFasta, queryDB);
  TplSys::csystem(searchCommand(queryDB, targetDB, resultDB, scratch, params), true, 0, "mmseqsInterface::search");
  TplSys::csystem(convertalisCommand(queryDB, targetDB, resultDB, tsv), true, 0, "mmseqsInterface::search");
  searchResult res = searchResult::readTSV(tsv);
  res.setQueryFasta(queryFasta);
  res.setDatabase(targetDB);
  if (params.isVerbose()) cout << "search found " << res.size() << " hits in " << timer.getDuration() << " s" << endl;

  if (!outTSV.empty()) res.writeTSV(outTSV);
  return res;
}
