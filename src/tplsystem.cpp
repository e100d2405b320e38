#include "tplsystem.h"

using namespace TPL;

string TplSys::pathBase(const string& fn) {
  if (fn.find_last_of(".") == string::npos) return fn;
  else return fn.substr(0, fn.find_last_of("."));
}

string TplSys::splitPath(const string& path, int outToken, string* dirPathPtr, string* fileNamePtr, string* extensionPtr) {
  string dirPath, fileName, extension;
  size_t pos = path.rfind("/");
  if (pos == string::npos) {
    fileName = path;
    dirPath = "./";
  } else if (pos == 0) {
    fileName = path.substr(1);
    dirPath = "/";
  } else {
    fileName = path.substr(pos+1);
    dirPath = path.substr(0, pos);
  }
  pos = fileName.rfind(".");
  if (pos == string::npos) {
    extension = "";
  } else {
    extension = fileName.substr(pos+1);
    fileName = fileName.substr(0, pos);
  }
  if (dirPathPtr != NULL) *dirPathPtr = dirPath;
  if (fileNamePtr != NULL) *fileNamePtr = fileName;
  if (extensionPtr != NULL) *extensionPtr = extension;
  switch (outToken) {
    case 0:
      return dirPath;
    case 1:
      return fileName;
    case 2:
      return extension;
    default:
      TplUtils::error("unrecognized output token type specified '" + TplUtils::toString(outToken) + "'", "TplSys::splitPath");
  }
  return ""; // just to make the compiler happy, this is never reached
}

string TplSys::joinPath(const string& dir, const string& name) {
  if (dir.empty()) return name;
  if (dir[dir.size() - 1] == '/') return dir + name;
  return dir + "/" + name;
}

bool TplSys::fileExists(const char* filename) {
  struct stat buffer;
  if (stat(filename, &buffer) == 0) return true;
  return false;
}

long TplSys::fileSize(const char* filename) {
  struct stat stat_buf;
  int rc = stat(filename, &stat_buf);
  return rc == 0 ? stat_buf.st_size : -1;
}

bool TplSys::isDir(const char *filename) {
  struct stat buffer;
  if (stat(filename, &buffer) < 0) return false;
  return S_ISDIR(buffer.st_mode);
}

int TplSys::csystem(const string& cmd, bool checkError, int success, const string& from) {
  int ret = system(cmd.c_str());
  if ((ret != -1) && WIFEXITED(ret)) ret = WEXITSTATUS(ret);
  string head = from.empty() ? "" : from + " -> ";
  if ((checkError) && (ret != success)) {
    TplUtils::error("system command '" + cmd + "' failed with status " + TplUtils::toString(ret), head + "TplSys::csystem");
  }
  return ret;
}

void TplSys::cmkdir(const string& dirPath, bool makeParents) {
  if (TplSys::isDir(dirPath)) return; // return if the path is already a dir
  int ret = TplSys::csystem("mkdir " + (makeParents ? (string) "-p " : (string) "") + shellQuote(dirPath), false);
  TplUtils::assertCond(ret == 0, "failed to make directory '" + dirPath + "'", "TplSys::cmkdir");
}

void TplSys::crmdir(const string& dirPath, bool recursive) {
  int ret = TplSys::csystem((recursive ? (string) "rm -r " : (string) "rmdir ") + shellQuote(dirPath), false);
  TplUtils::assertCond(ret == 0, "failed to remove directory '" + dirPath + "'" + (recursive ? " recursively" : ""), "TplSys::crmdir");
}

void TplSys::crm(const string& filePath) {
  int ret = TplSys::csystem("rm " + shellQuote(filePath), false);
  TplUtils::assertCond(ret == 0, "failed to remove file '" + filePath + "'", "TplSys::crm");
}

string TplSys::makeTempDir(const string& prefix, string base) {
  if (base.empty()) {
    const char* tmp = getenv("TMPDIR");
    base = ((tmp != NULL) && (strlen(tmp) > 0)) ? tmp : "/tmp";
  }
  string templ = joinPath(base, prefix + ".XXXXXX");
  vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (mkdtemp(&buf[0]) == NULL) TplUtils::error("could not create a temporary directory from template '" + templ + "'", "TplSys::makeTempDir");
  return string(&buf[0]);
}

string TplSys::shellQuote(const string& arg) {
  string quoted = "'";
  for (int i = 0; i < arg.size(); i++) {
    if (arg[i] == '\'') quoted += "'\\''";
    else quoted += arg[i];
  }
  return quoted + "'";
}

TplTempDir::~TplTempDir() {
  if (!TplSys::isDir(path)) return;
  try {
    TplSys::crmdir(path, true);
  } catch (const exception& e) {
    TplUtils::warn(string("could not clean up: ") + e.what(), "TplTempDir::~TplTempDir");
  }
}
