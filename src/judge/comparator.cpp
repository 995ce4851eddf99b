#include "judge/comparator.hpp"
#include <vector>

namespace labjudge {
using namespace std;

static bool is_trailing_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

string normalize_output(const string &output) {
    vector<string> lines;
    string line;
    for (size_t i = 0; i < output.size(); ++i) {
        char c = output[i];
        if (c == '\r' && i + 1 < output.size() && output[i + 1] == '\n') continue;
        if (c == '\n') {
            lines.push_back(move(line));
            line.clear();
        } else {
            line.push_back(c);
        }
    }
    lines.push_back(move(line));

    for (auto &l : lines) {
        size_t end = l.size();
        while (end > 0 && is_trailing_space(l[end - 1])) --end;
        l.resize(end);
    }
    while (!lines.empty() && lines.back().empty()) lines.pop_back();

    string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) result.push_back('\n');
        result += lines[i];
    }
    return result;
}

bool outputs_match(const string &actual, const string &expected) {
    return normalize_output(actual) == normalize_output(expected);
}

}  // namespace labjudge
