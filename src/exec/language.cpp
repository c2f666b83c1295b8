#include "exec/language.hpp"
#include <stdexcept>

namespace kata {
using namespace std;

language parse_language(const string &name) {
    if (name == "py" || name == "python") return language::PYTHON;
    if (name == "js" || name == "javascript") return language::JAVASCRIPT;
    if (name == "ts" || name == "typescript") return language::TYPESCRIPT;
    if (name == "cpp" || name == "c++") return language::CPP;
    throw invalid_argument("unsupported language: " + name);
}

string to_string(language lang) {
    switch (lang) {
        case language::PYTHON: return "py";
        case language::JAVASCRIPT: return "js";
        case language::TYPESCRIPT: return "ts";
        case language::CPP: return "cpp";
    }
    throw invalid_argument("invalid language value " + std::to_string((int)lang));
}

}  // namespace kata
