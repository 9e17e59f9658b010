#include "judgecell/common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace judgecell {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.flush();
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == "..")
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

string truncate_utf8(const string &str, size_t limit) {
    if (str.size() <= limit) return str;
    size_t len = limit;
    // 回退到字符边界：10xxxxxx 为多字节字符的后续字节
    while (len > 0 && ((unsigned char)str[len] & 0xC0) == 0x80) --len;
    return str.substr(0, len);
}

bool is_valid_utf8(const string &str) {
    size_t i = 0, n = str.size();
    while (i < n) {
        unsigned char c = str[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        // 第二个字节的取值范围，排除过长编码和代理区
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }

        if (n - i < len) return false;
        unsigned char second = str[i + 1];
        if (second < lo || second > hi) return false;
        for (size_t k = 2; k < len; ++k)
            if (((unsigned char)str[i + k] & 0xC0) != 0x80) return false;
        i += len;
    }
    return true;
}

}  // namespace judgecell
