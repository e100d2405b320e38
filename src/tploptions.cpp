#include "tploptions.h"

void TplOptions::addOption(string opt, string info, bool req) {
  options.push_back(opt);
  optionsInfo.push_back(info);
  if (req) required.insert(opt);
  // if long option names are specified, move the usage info tab over
  if (p1 + opt.length() + 3 > p2) p2 = p1 + opt.length() + 3;
}

string TplOptions::usage() {
  string usageString;
  usageString = "\n" + formatOptInfo("", title, 0, 0) + "\n";
  for (int i = 0; i < options.size(); i++) {
    usageString += formatOptInfo(options[i], optionsInfo[i]) + "\n";
  }
  return usageString;
}

string TplOptions::formatOptInfo(string opt, string mes, int _p1, int _p2) {
  if (_p1 < 0) _p1 = p1;
  if (_p2 < 0) _p2 = p2;

  // first print the name of the option
  string text(_p1, ' ');
  if (!opt.empty()) text += "--" + opt;
  if (_p2 > text.size()) text += string(_p2 - text.size(), ' ');

  // next print the description text
  int i = 0, k, L = text.size(), n;
  while (i < mes.size()) {
    k = mes.find_first_of(" ", i);
    if (k == string::npos) k = mes.size();
    n = k - i;
    if ((L + n >= w) && (L > 0)) { text += "\n" + string(_p2, ' '); L = _p2; }
    text += mes.substr(i, n) + " ";
    L += n + 1;
    i = k+1;
  }
  return text;
}

void TplOptions::setOptions(int argc, char** argv) {
  execName.clear();
  givenOptions.clear();
  set<string> missingRequired = required;
  set<string> known(options.begin(), options.end());
  if (argc <= 0) return;
  execName = argv[0];
  for (int i = 1; i < argc; ) {
    string token = argv[i];
    string nextToken = ((i < argc - 1) ? argv[i+1] : "--");
    if (token.find("--") != 0) {
      cerr << usage() << endl;
      TplUtils::error("could not parse options, could not understand the token '" + token + "'", "TplOptions::setOptions");
    }
    token = token.substr(2);
    if (known.find(token) == known.end()) {
      cerr << usage() << endl;
      TplUtils::error("unknown option '--" + token + "'", "TplOptions::setOptions");
    }
    if (nextToken.find("--") != 0) {
      givenOptions[token].push_back(nextToken);
      i += 2;
    } else {
      givenOptions[token].push_back("");
      i++;
    }
    missingRequired.erase(token);
  }
  if (missingRequired.size() != 0) {
    cerr << usage() << endl;
    for (set<string>::iterator it = missingRequired.begin(); it != missingRequired.end(); ++it) cerr << "missing required option: " << *it << endl;
    cerr << endl;
    TplUtils::error("not all required options were specified!", "TplOptions::setOptions");
  }
}

const string& TplOptions::value(const string& opt, int idx) const {
  map<string, vector<string> >::const_iterator it = givenOptions.find(opt);
  if (it == givenOptions.end()) TplUtils::error("option '--" + opt + "' was not given", "TplOptions::value");
  if ((idx < 0) || (idx >= it->second.size())) TplUtils::error("option '--" + opt + "' was given " + TplUtils::toString(it->second.size()) + " time(s), occurrence " + TplUtils::toString(idx) + " requested", "TplOptions::value");
  return it->second[idx];
}

int TplOptions::getInt(const string& opt, int defVal, int idx) const {
  if (!isGiven(opt)) return defVal;
  const string& val = value(opt, idx);
  if (!TplUtils::isInt(val)) TplUtils::error("option '--" + opt + "' expects an integer, got '" + val + "'", "TplOptions::getInt");
  return TplUtils::toInt(val);
}

tplreal TplOptions::getReal(const string& opt, tplreal defVal, int idx) const {
  if (!isGiven(opt)) return defVal;
  const string& val = value(opt, idx);
  if (!TplUtils::isReal(val)) TplUtils::error("option '--" + opt + "' expects a number, got '" + val + "'", "TplOptions::getReal");
  return TplUtils::toReal(val);
}

bool TplOptions::isInt(const string& opt, int idx) const {
  if (!isGiven(opt)) return false;
  return TplUtils::isInt(value(opt, idx));
}

bool TplOptions::isReal(const string& opt, int idx) const {
  if (!isGiven(opt)) return false;
  return TplUtils::isReal(value(opt, idx));
}

string TplOptions::getString(const string& opt, string defVal, int idx) const {
  if (!isGiven(opt)) return defVal;
  return value(opt, idx);
}

// a bare flag counts as true, as does any non-zero integer value
bool TplOptions::getBool(const string& opt, int idx) const {
  if (!isGiven(opt)) return false;
  const string& val = value(opt, idx);
  if (val.empty()) return true;
  if (!TplUtils::isInt(val)) return false;
  return (TplUtils::toInt(val) != 0);
}

bool TplOptions::isGiven(const string& opt) const {
  if (givenOptions.find(opt) == givenOptions.end()) return false;
  return true;
}

int TplOptions::timesGiven(const string& opt) const {
  if (givenOptions.find(opt) == givenOptions.end()) return 0;
  return givenOptions.at(opt).size();
}
