#ifndef _TPLOPTIONS_H
#define _TPLOPTIONS_H

#include <iostream>
#include <fstream>
#include <string>
#include <stdio.h>
#include <string.h>
#include <vector>
#include <map>
#include <set>
#include "tpltypes.h"

using namespace std;
using namespace TPL;

/* Options parsing/usage statement class. Options are given as "--name value"
 * or, for flags, just "--name". */
class TplOptions {
  public:
    TplOptions() { w = 80; p1 = 3; p2 = p1+8; }
    TplOptions(int argc, char** argv) : TplOptions() { setOptions(argc, argv); }

    // formatting of usage information
    void addOption(string opt, string info, bool req = false);
    void setTitle(string _title) { title = _title; }
    string usage();
    void setUsageWidth(int _w) { w = _w; }
    void setUsageParOffset(int _p1) { p1 = _p1; }
    void setUsageSecondParOffset(int _p2) { p2 = _p2; }
    string formatOptInfo(string opt, string mes, int _p1 = -1, int _p2 = -1);

    /* Parses the command line. Unknown options, malformed tokens and missing
     * required options are errors (the usage statement is printed to stderr
     * first). */
    void setOptions(int argc, char** argv);
    bool isInt(const string& opt, int idx = 0) const;
    int getInt(const string& opt, int defVal = 0, int idx = 0) const;
    bool isReal(const string& opt, int idx = 0) const;
    tplreal getReal(const string& opt, tplreal defVal = 0.0, int idx = 0) const;
    string getString(const string& opt, string defVal = "", int idx = 0) const;
    bool getBool(const string& opt, int idx = 0) const;
    bool isGiven(const string& opt) const;
    int timesGiven(const string& opt) const;
    string getExecName() const { return execName; }

  protected:
    const string& value(const string& opt, int idx) const;

  private:
    int w, p1, p2;
    string execName, title;
    map<string, vector<string> > givenOptions;
    vector<string> options;
    vector<string> optionsInfo;
    set<string> required;
};

#endif
