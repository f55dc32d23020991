#include <cctype>
#include <sstream>

#include "util.hpp"

using namespace std;

namespace util {
  // Split string by single character delimiter.
  // https://stackoverflow.com/a/46931770
  vector<string> split(const string& s, char delim) {
    vector<string> result;
    stringstream ss(s);
    string item;
    while (getline(ss, item, delim)) {
      result.push_back(item);
    }
    return result;
  }

  string trim(const string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace(static_cast<unsigned char>(s[b]))) {
      ++b;
    }
    while (e > b && isspace(static_cast<unsigned char>(s[e - 1]))) {
      --e;
    }
    return s.substr(b, e - b);
  }
}
