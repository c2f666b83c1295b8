#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace kata {
using namespace std;

string read_file_content(const filesystem::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw system_error(errno, generic_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const filesystem::path &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, generic_category(), "unable to write " + path.string());
    fout << content;
    if (!fout) throw system_error(errno, generic_category(), "unable to write " + path.string());
}

// 返回从 i 开始的 UTF-8 字符的字节数，非法时返回 0
// 按 RFC 3629 检查第二个字节的范围，拒绝过长编码、代理区和超过 U+10FFFF 的码点
static size_t utf8_sequence_length(const string &string, size_t i) {
    size_t ix = string.length();
    unsigned c = (unsigned char)string[i];
    size_t n;
    unsigned lo = 0x80, hi = 0xBF;  // 第二个字节的范围
    if (c <= 0x7F) {
        return 1;
    } else if (c >= 0xC2 && c <= 0xDF) {
        n = 1;
    } else if (c == 0xE0) {
        n = 2;
        lo = 0xA0;
    } else if (c == 0xED) {
        n = 2;
        hi = 0x9F;
    } else if (c >= 0xE1 && c <= 0xEF) {
        n = 2;
    } else if (c == 0xF0) {
        n = 3;
        lo = 0x90;
    } else if (c == 0xF4) {
        n = 3;
        hi = 0x8F;
    } else if (c >= 0xF1 && c <= 0xF3) {
        n = 3;
    } else {
        return 0;
    }

    if (i + n >= ix) return 0;
    unsigned second = (unsigned char)string[i + 1];
    if (second < lo || second > hi) return 0;
    for (size_t j = 2; j <= n; j++) {
        if (((unsigned char)string[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.length();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

string sanitize_utf8(const string &string) {
    if (utf8_check_is_valid(string)) return string;

    std::string result;
    result.reserve(string.length());
    for (size_t i = 0; i < string.length();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) {
            result += "\xEF\xBF\xBD";
            ++i;
        } else {
            result.append(string, i, n);
            i += n;
        }
    }
    return result;
}

string tail(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(text.size() - limit);
}

}  // namespace kata
