#ifndef _TPLSYSTEM_H
#define _TPLSYSTEM_H

#include "tpltypes.h"
#include <unistd.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/wait.h>

/* A bunch of static routines to perform various OS-related operations */
class TplSys {
  public:
    static string pathBase(const string& fn); // gets the base name of the path (removes the extension)

    /* Returns the directory part of the path, the file name, or the file extension,
     * depending on whether outToken is 0, 1, or 2, respectively. */
    static string splitPath(const string& path, int outToken, string* dirPathPtr = NULL, string* fileNamePtr = NULL, string* extensionPtr = NULL);
    static string joinPath(const string& dir, const string& name);

    static bool fileExists(const char *filename);
    static bool fileExists(const string filename) { return fileExists(filename.c_str()); }
    static long fileSize(const char* filename);
    static long fileSize(const string filename) { return fileSize(filename.c_str()); }
    static bool isDir(const char *filename);
    static bool isDir(const string& filename) { return isDir(filename.c_str()); }

    // runs through the shell; with checkError, an exit status other than success is an error
    static int csystem(const string& cmd, bool checkError = true, int success = 0, const string& from = "");
    static void cmkdir(const string& dirPath, bool makeParents = false);
    static void crmdir(const string& dirPath, bool recursive = false);
    static void crm(const string& filePath);

    // creates a fresh directory under base (or TMPDIR, or /tmp) and returns its path
    static string makeTempDir(const string& prefix = "tpl", string base = "");

    // single-quotes a string for the shell
    static string shellQuote(const string& arg);
};

/* A temporary directory (see TplSys::makeTempDir) removed, with everything in
 * it, when the object goes out of scope. */
class TplTempDir {
  public:
    TplTempDir(const string& prefix = "tpl", const string& base = "") { path = TplSys::makeTempDir(prefix, base); }
    ~TplTempDir();
    string getPath() const { return path; }

  private:
    TplTempDir(const TplTempDir& other);
    TplTempDir& operator=(const TplTempDir& other);

    string path;
};

#endif
