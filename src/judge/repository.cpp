#include "judge/repository.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace labjudge {
using namespace std;
namespace fs = std::filesystem;

submission_repository::~submission_repository() {}

json_file_repository::json_file_repository(const fs::path &dir)
    : dir(dir) {
    fs::create_directories(dir);
}

fs::path json_file_repository::path_of(const string &id) const {
    return dir / (assert_safe_path(id) + ".json");
}

void json_file_repository::save(const submission &snapshot) {
    nlohmann::json j = snapshot;
    write_file_atomically(path_of(snapshot.id), j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

optional<submission> json_file_repository::load(const string &id) {
    fs::path path = path_of(id);
    if (!fs::exists(path)) return nullopt;
    return nlohmann::json::parse(read_file_content(path)).get<submission>();
}

void memory_repository::save(const submission &snapshot) {
    scoped_lock lock(mut);
    submissions[snapshot.id] = snapshot;
    histories[snapshot.id].push_back(snapshot.stat);
}

optional<submission> memory_repository::load(const string &id) {
    scoped_lock lock(mut);
    auto it = submissions.find(id);
    if (it == submissions.end()) return nullopt;
    return it->second;
}

vector<status> memory_repository::history(const string &id) {
    scoped_lock lock(mut);
    return histories[id];
}

}  // namespace labjudge
