#include "common/stl_utils.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace kata {
using namespace std;

string trim_copy(const string &s) {
    return boost::algorithm::trim_copy(s);
}

vector<string> split_by(const string &text, const string &separator) {
    vector<string> parts;
    size_t begin = 0;
    for (size_t pos; (pos = text.find(separator, begin)) != string::npos; begin = pos + separator.size())
        parts.push_back(text.substr(begin, pos - begin));
    parts.push_back(text.substr(begin));
    return parts;
}

}  // namespace kata
