#include <iomanip>
#include "tplsearch.h"
using namespace TPL;

/* ------------ searchHit ------------ */

vector<string> searchHit::allColumns;
vector<string> searchHit::reqColumns;
bool searchHit::initialized = searchHit::initConstants();

bool searchHit::initConstants() {
  string cols[] = {"query", "target", "fident", "alnlen", "mismatch", "gapopen", "qstart", "qend",
                   "tstart", "tend", "qcov", "tcov", "evalue", "bits", "qaln", "taln"};
  allColumns = vector<string>(cols, cols + sizeof(cols)/sizeof(cols[0]));
  string req[] = {"query", "target", "fident", "evalue", "bits"};
  reqColumns = vector<string>(req, req + sizeof(req)/sizeof(req[0]));
  return true;
}

bool searchHit::isColumn(const string& column) {
  return find(allColumns.begin(), allColumns.end(), column) != allColumns.end();
}

string searchHit::targetStructureId() const {
  size_t pos = target.rfind(".");
  if (pos == string::npos) return target;
  return target.substr(0, pos);
}

// enough digits that reading the value back gives the same number
static string realField(tplreal val) {
  stringstream ss;
  ss << setprecision(numeric_limits<tplreal>::max_digits10) << val;
  return ss.str();
}

string searchHit::getField(const string& column) const {
  if (column == "query") return query;
  if (column == "target") return target;
  if (column == "fident") return realField(fident);
  if (column == "alnlen") return TplUtils::toString(alnlen);
  if (column == "mismatch") return TplUtils::toString(mismatch);
  if (column == "gapopen") return TplUtils::toString(gapopen);
  if (column == "qstart") return TplUtils::toString(qstart);
  if (column == "qend") return TplUtils::toString(qend);
  if (column == "tstart") return TplUtils::toString(tstart);
  if (column == "tend") return TplUtils::toString(tend);
  if (column == "qcov") return realField(qcov);
  if (column == "tcov") return realField(tcov);
  if (column == "evalue") return realField(evalue);
  if (column == "bits") return realField(bits);
  if (column == "qaln") return qaln;
  if (column == "taln") return taln;
  TplUtils::error("unknown column '" + column + "'", "searchHit::getField");
  return "";
}

void searchHit::setField(const string& column, const string& value) {
  if (column == "query") query = value;
  else if (column == "target") target = value;
  else if (column == "fident") fident = TplUtils::toReal(value);
  else if (column == "alnlen") alnlen = TplUtils::toInt(value);
  else if (column == "mismatch") mismatch = TplUtils::toInt(value);
  else if (column == "gapopen") gapopen = TplUtils::toInt(value);
  else if (column == "qstart") qstart = TplUtils::toInt(value);
  else if (column == "qend") qend = TplUtils::toInt(value);
  else if (column == "tstart") tstart = TplUtils::toInt(value);
  else if (column == "tend") tend = TplUtils::toInt(value);
  else if (column == "qcov") qcov = TplUtils::toReal(value);
  else if (column == "tcov") tcov = TplUtils::toReal(value);
  else if (column == "evalue") evalue = TplUtils::toReal(value);
  else if (column == "bits") bits = TplUtils::toReal(value);
  else if (column == "qaln") qaln = value;
  else if (column == "taln") taln = value;
  else TplUtils::error("unknown column '" + column + "'", "searchHit::setField");
}

/* ------------ searchResult ------------ */

searchResult searchResult::readTSV(const string& file) {
  fstream ifs;
  TplUtils::openFile(ifs, file, fstream::in, "searchResult::readTSV");
  searchResult res = searchResult::readTSV(ifs, file);
  ifs.close();
  return res;
}

searchResult searchResult::readTSV(istream& is, const string& source) {
  string from = "searchResult::readTSV" + (source.empty() ? string("") : " " + source);
  searchResult res;
  vector<string> header;
  vector<int> colIdx; // header position of each known column, -1 for unknown ones
  string line;
  int lineNum = 0;
  while (getline(is, line)) {
    lineNum++;
    if (!line.empty() && (line[line.size() - 1] == '\r')) line.erase(line.size() - 1);
    if (TplUtils::trim(line).empty()) continue;
    if (line[0] == '#') {
      if (line.find("#Query:") == 0) res.queryFasta = TplUtils::trim(line.substr(7));
      else if (line.find("#Database:") == 0) res.database = TplUtils::trim(line.substr(10));
      continue;
    }
    vector<string> fields = TplUtils::split(line, "\t", false);
    if (header.empty()) {
      header = fields;
      set<string> seen;
      for (int i = 0; i < header.size(); i++) {
        header[i] = TplUtils::trim(header[i]);
        if (seen.find(header[i]) != seen.end()) TplUtils::error("column '" + header[i] + "' appears more than once in the header", from);
        seen.insert(header[i]);
      }
      const vector<string>& req = searchHit::requiredColumns();
      for (int i = 0; i < req.size(); i++) {
        if (seen.find(req[i]) == seen.end()) TplUtils::error("required column '" + req[i] + "' is missing from the header", from);
      }
      continue;
    }
    if (fields.size() != header.size()) TplUtils::error("line " + TplUtils::toString(lineNum) + " has " + TplUtils::toString(fields.size()) + " fields, the header has " + TplUtils::toString(header.size()), from);
    searchHit hit;
    for (int i = 0; i < header.size(); i++) {
      if (!searchHit::isColumn(header[i])) continue;
      try {
        hit.setField(header[i], TplUtils::trim(fields[i]));
      } catch (const Error& e) {
        TplUtils::error("could not parse column '" + header[i] + "' on line " + TplUtils::toString(lineNum) + ": " + e.what(), from);
      }
    }
    res.hits.push_back(hit);
  }
  if (header.empty()) TplUtils::error("no header row found", from);
  return res;
}

void searchResult::writeTSV(const string& file) const {
  fstream ofs;
  TplUtils::openFile(ofs, file, fstream::out, "searchResult::writeTSV");
  writeTSV(ofs);
  ofs.close();
}

void searchResult::writeTSV(ostream& os) const {
  os << "#Query:" << queryFasta << endl;
  os << "#Database:" << database << endl;
  bool withAln = false;
  for (int i = 0; i < hits.size(); i++) {
    if (hits[i].hasAlignment()) { withAln = true; break; }
  }
  vector<string> cols;
  const vector<string>& all = searchHit::columns();
  for (int i = 0; i < all.size(); i++) {
    if (!withAln && ((all[i] == "qaln") || (all[i] == "taln"))) continue;
    cols.push_back(all[i]);
  }
  os << TplUtils::join("\t", cols) << endl;
  for (int i = 0; i < hits.size(); i++) {
    vector<string> vals(cols.size());
    for (int j = 0; j < cols.size(); j++) vals[j] = hits[i].getField(cols[j]);
    os << TplUtils::join("\t", vals) << endl;
  }
}

searchResult searchResult::filter(tplreal minIdentity, tplreal minBits) const {
  searchResult res(vector<searchHit>(), queryFasta, database);
  for (int i = 0; i < hits.size(); i++) {
    if ((hits[i].fident >= minIdentity) && (hits[i].bits >= minBits)) res.hits.push_back(hits[i]);
  }
  return res;
}

namespace TPL {
  // descending identity, then ascending e-value
  struct hitIdentityOrder {
    bool operator()(const searchHit& a, const searchHit& b) const {
      if (a.fident != b.fident) return a.fident > b.fident;
      return a.evalue < b.evalue;
    }
  };
}

void searchResult::sortByIdentity() {
  stable_sort(hits.begin(), hits.end(), hitIdentityOrder());
}

vector<string> searchResult::queries() const {
  vector<string> names;
  set<string> seen;
  for (int i = 0; i < hits.size(); i++) {
    if (seen.find(hits[i].query) != seen.end()) continue;
    seen.insert(hits[i].query);
    names.push_back(hits[i].query);
  }
  return names;
}

searchResult searchResult::hitsForQuery(const string& query) const {
  searchResult res(vector<searchHit>(), queryFasta, database);
  for (int i = 0; i < hits.size(); i++) {
    if (hits[i].query == query) res.hits.push_back(hits[i]);
  }
  return res;
}

searchResult searchResult::topK(int k) const {
  if (k < 0) throw ConfigurationError(TplUtils::errorMessage("number of hits per query cannot be negative, got " + TplUtils::toString(k), "searchResult::topK"));
  searchResult res(vector<searchHit>(), queryFasta, database);
  vector<string> names = queries();
  for (int q = 0; q < names.size(); q++) {
    searchResult sub = hitsForQuery(names[q]);
    sub.sortByIdentity();
    for (int i = 0; (i < sub.size()) && (i < k); i++) res.hits.push_back(sub[i]);
  }
  return res;
}
