#include "runguard.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace labjudge {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) {
            // 值为空时 runguard 写入的是 "key: "，行尾空格可能被去掉
            if (!line.empty() && line.back() == ':') mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // 字段格式不正确时保留默认值
    }
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "sys-time", result.sys_time);
    try_to_parse(metadata, "user-time", result.user_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    if (metadata.count("memory-result")) result.memory_result = metadata.at("memory-result");
    if (metadata.count("time-result")) result.time_result = metadata.at("time-result");
    if (metadata.count("output-truncated")) result.output_truncated = metadata.at("output-truncated");
    if (metadata.count("internal-error")) result.internal_error = metadata.at("internal-error");
    result.has_exitcode = metadata.count("exitcode") > 0 && result.exitcode >= 0;
    return result;
}

}  // namespace labjudge
