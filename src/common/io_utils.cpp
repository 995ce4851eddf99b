#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include "common/utils.hpp"

namespace labjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
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

string read_file_prefix(const fs::path &path, size_t limit, bool &truncated) {
    truncated = false;
    ifstream fin(path.string(), ios::binary);
    if (!fin) return "";
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    if (str.size() == limit && fin.peek() != char_traits<char>::eof())
        truncated = true;
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

void write_file_atomically(const fs::path &path, const string &content) {
    fs::path tmp = path;
    tmp += "." + generate_uuid() + ".tmp";
    write_file_content(tmp, content);
    fs::rename(tmp, path);
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace labjudge
