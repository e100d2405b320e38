#include "tplsequence.h"
using namespace TPL;

/* ------------ Sequence ------------ */

Sequence::Sequence(const Structure& S) {
  vector<Residue*> residues = S.getResidues();
  vector<string> names(residues.size());
  for (int i = 0; i < residues.size(); i++) names[i] = residues[i]->getName();
  seq = SeqTools::tripleToSingle(names);
  name = S.getName();
}

int Sequence::ungappedLength() const {
  int L = 0;
  for (int i = 0; i < seq.size(); i++) {
    if (!SeqTools::isGap(seq[i])) L++;
  }
  return L;
}

bool Sequence::isGap(int i) const {
  return SeqTools::isGap(seq[i]);
}

Sequence Sequence::ungapped() const {
  string ug;
  ug.reserve(seq.size());
  for (int i = 0; i < seq.size(); i++) {
    if (!SeqTools::isGap(seq[i])) ug.push_back(seq[i]);
  }
  return Sequence(ug, name);
}

/* ------------ SeqTools ------------ */

// statics must be defined in the cpp file
map<string, string> SeqTools::aa3ToAA1;
string SeqTools::vocab;
map<char, int> SeqTools::vocabIdx;
bool SeqTools::initialized = SeqTools::initConstants();

bool SeqTools::initConstants() {
  aa3ToAA1["ALA"] = "A"; aa3ToAA1["CYS"] = "C"; aa3ToAA1["ASP"] = "D"; aa3ToAA1["GLU"] = "E";
  aa3ToAA1["PHE"] = "F"; aa3ToAA1["GLY"] = "G"; aa3ToAA1["HIS"] = "H"; aa3ToAA1["ILE"] = "I";
  aa3ToAA1["LYS"] = "K"; aa3ToAA1["LEU"] = "L"; aa3ToAA1["MET"] = "M"; aa3ToAA1["ASN"] = "N";
  aa3ToAA1["PRO"] = "P"; aa3ToAA1["GLN"] = "Q"; aa3ToAA1["ARG"] = "R"; aa3ToAA1["SER"] = "S";
  aa3ToAA1["THR"] = "T"; aa3ToAA1["VAL"] = "V"; aa3ToAA1["TRP"] = "W"; aa3ToAA1["TYR"] = "Y";

  // ambiguous and non-standard codes
  aa3ToAA1["ASX"] = "B"; aa3ToAA1["XAA"] = "X"; aa3ToAA1["GLX"] = "Z";
  aa3ToAA1["XLE"] = "J"; aa3ToAA1["SEC"] = "U"; aa3ToAA1["PYL"] = "O";
  aa3ToAA1["UNK"] = "X";

  // order matters: column k of a one-hot row stands for vocab[k]
  vocab = "-DGULNTKHYWCPVSOIEFXQABZRM";
  for (int i = 0; i < vocab.size(); i++) vocabIdx[vocab[i]] = i;
  return true;
}

string SeqTools::toSingle(const string& aa) {
  map<string, string>::const_iterator it = aa3ToAA1.find(TplUtils::uc(aa));
  if (it == aa3ToAA1.end()) return "X";
  return it->second;
}

string SeqTools::tripleToSingle(const vector<string>& triples) {
  string single;
  for (int i = 0; i < triples.size(); i++) single += SeqTools::toSingle(triples[i]);
  return single;
}

void SeqTools::readFasta(const string& fastaFile, vector<Sequence>& seqs) {
  fstream file;
  TplUtils::openFile(file, fastaFile, fstream::in, "SeqTools::readFasta " + fastaFile);

  string id, seq, line;
  while (getline(file, line)) {
    line = TplUtils::trim(line);
    if (line.empty()) continue;
    if (line[0] == '>') { // identifier lines should start with '>'
      if (id.length() > 0) { // add previous (id, sequence) if this is not the first identifier
        TplUtils::assertCond((seq.length() > 0), "sequence " + TplUtils::toString(seqs.size() + 1) + " appears to be missing", "SeqTools::readFasta");
        seqs.push_back(Sequence(seq, id));
      }
      // the name is the first word of the header
      vector<string> words = TplUtils::split(TplUtils::trim(line.substr(1)), " \t");
      id = words.empty() ? "" : words[0];
      TplUtils::assertCond((id.length() > 0), "identifier for sequence " + TplUtils::toString(seqs.size() + 1) + " appears to be missing", "SeqTools::readFasta");
      seq = "";
    } else {
      seq += line; // sequences can be multi-line
    }
  }

  if (seq.length() > 0) {
    seqs.push_back(Sequence(seq, id));
  }
  file.close();
}

vector<Sequence> SeqTools::readFasta(const string& fastaFile) {
  vector<Sequence> seqs;
  SeqTools::readFasta(fastaFile, seqs);
  return seqs;
}

void SeqTools::writeFasta(const string& fastaFile, const vector<Sequence>& seqs) {
  fstream ofs;
  TplUtils::openFile(ofs, fastaFile, fstream::out, "SeqTools::writeFasta");
  for (int i = 0; i < seqs.size(); i++) {
    ofs << ">" << seqs[i].getName() << endl << seqs[i].toString() << endl;
  }
  ofs.close();
}

vector<Sequence> SeqTools::filterByLength(const vector<Sequence>& seqs, int minLen, int maxLen, map<string, int>* skipped) {
  if (minLen > maxLen) throw ConfigurationError(TplUtils::errorMessage("minimum length " + TplUtils::toString(minLen) + " exceeds maximum length " + TplUtils::toString(maxLen), "SeqTools::filterByLength"));
  if (seqs.empty()) TplUtils::error("no sequences to filter", "SeqTools::filterByLength");
  vector<Sequence> kept;
  for (int i = 0; i < seqs.size(); i++) {
    int L = seqs[i].length();
    if ((L < minLen) || (L > maxLen)) {
      if (skipped != NULL) (*skipped)[seqs[i].getName()] = L;
      continue;
    }
    kept.push_back(seqs[i]);
  }
  if (kept.empty()) TplUtils::error("all " + TplUtils::toString(seqs.size()) + " sequences were filtered out due to length outside of range " + TplUtils::toString(minLen) + "-" + TplUtils::toString(maxLen), "SeqTools::filterByLength");
  return kept;
}

void SeqTools::writeSkipped(const string& file, const map<string, int>& skipped) {
  fstream ofs;
  TplUtils::openFile(ofs, file, fstream::out, "SeqTools::writeSkipped");
  ofs << "query\tlength" << endl;
  for (map<string, int>::const_iterator it = skipped.begin(); it != skipped.end(); ++it) {
    ofs << it->first << "\t" << it->second << endl;
  }
  ofs.close();
}

vector<vector<int> > SeqTools::oneHot(const string& seq) {
  vector<vector<int> > enc(seq.size(), vector<int>(vocab.size(), 0));
  for (int i = 0; i < seq.size(); i++) {
    map<char, int>::const_iterator it = vocabIdx.find(seq[i]);
    if (it == vocabIdx.end()) TplUtils::error("symbol '" + string(1, seq[i]) + "' at position " + TplUtils::toString(i) + " is not in the encoding alphabet", "SeqTools::oneHot");
    enc[i][it->second] = 1;
  }
  return enc;
}
