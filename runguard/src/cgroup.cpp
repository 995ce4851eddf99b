#include "cgroup.hpp"

#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <chrono>
#include <fstream>
#include <thread>

using namespace std;
namespace fs = std::filesystem;

static const fs::path CGROUP_ROOT = "/sys/fs/cgroup";

static string describe(const string &cgroup_op, int err) {
    if (err == ECGOTHER)
        return fmt::format("libcgroup: {}: {}", cgroup_op, cgroup_strerror(cgroup_get_last_errno()));
    return fmt::format("{}: {}", cgroup_op, cgroup_strerror(err));
}

static void check(const string &cgroup_op, int err) {
    if (err != 0) throw cgroup_exception(cgroup_op, err);
}

cgroup_exception::cgroup_exception(const string &cgroup_op, int err)
    : runtime_error(describe(cgroup_op, err)), err(err) {}

int cgroup_exception::error() const noexcept {
    return err;
}

void cgroup_ctrl::set(const string &name, int64_t value) {
    check(fmt::format("cgroup_add_value_int64({}, {})", name, value),
          cgroup_add_value_int64(ctrl, name.c_str(), value));
}

void cgroup_ctrl::set(const string &name, const string &value) {
    check(fmt::format("cgroup_add_value_string({}, {})", name, value),
          cgroup_add_value_string(ctrl, name.c_str(), value.c_str()));
}

void cgroup_guard::init() {
    check("cgroup_init", cgroup_init());
}

bool cgroup_guard::unified() {
    static const bool is_unified = fs::exists(CGROUP_ROOT / "cgroup.controllers");
    return is_unified;
}

fs::path cgroup_guard::root(const string &controller) {
    return unified() ? CGROUP_ROOT : CGROUP_ROOT / controller;
}

cgroup_guard::cgroup_guard(const string &cgroup_name)
    : cgroup_name(cgroup_name), cg(cgroup_new_cgroup(cgroup_name.c_str())) {
    if (!cg)
        throw cgroup_exception(fmt::format("cgroup_new_cgroup({})", cgroup_name), ECGOTHER);
}

cgroup_guard::~cgroup_guard() {
    cgroup_free(&cg);
}

const string &cgroup_guard::name() const {
    return cgroup_name;
}

fs::path cgroup_guard::path(const string &controller) const {
    // cgroup 名称以 / 开头，不能直接用 operator/ 拼接
    size_t start = cgroup_name.find_first_not_of('/');
    return root(controller) / (start == string::npos ? "" : cgroup_name.substr(start));
}

cgroup_ctrl cgroup_guard::add_controller(const string &name) {
    struct cgroup_controller *controller = cgroup_add_controller(cg, name.c_str());
    if (!controller)
        throw cgroup_exception(fmt::format("cgroup_add_controller({})", name), ECGOTHER);
    return {controller};
}

void cgroup_guard::create() {
    // 忽略 ownership，cgroup 属于 root
    check(fmt::format("cgroup_create_cgroup({})", cgroup_name), cgroup_create_cgroup(cg, 1));
}

void cgroup_guard::load() {
    check(fmt::format("cgroup_get_cgroup({})", cgroup_name), cgroup_get_cgroup(cg));
}

void cgroup_guard::attach() {
    check(fmt::format("cgroup_attach_task({})", cgroup_name), cgroup_attach_task(cg));
}

bool cgroup_guard::kill_all() {
    if (unified()) {
        // Linux 5.14 起可以通过 cgroup.kill 一次性杀死 cgroup 内所有进程
        fs::path kill_file = path("") / "cgroup.kill";
        if (fs::exists(kill_file)) {
            ofstream fout(kill_file);
            fout << 1 << endl;
            if (fout) return true;
        }
    }

    for (int attempt = 0; attempt < 100; ++attempt) {
        void *handle = nullptr;
        pid_t pid;
        int ret = cgroup_get_task_begin(cgroup_name.c_str(), "memory", &handle, &pid);
        cgroup_get_task_end(&handle);
        if (ret != 0) return true;
        kill(pid, SIGKILL);
        this_thread::sleep_for(chrono::milliseconds(1));
    }
    return false;
}

void cgroup_guard::remove(int retries) {
    for (int attempt = 0;; ++attempt) {
        try {
            check(fmt::format("cgroup_delete_cgroup({})", cgroup_name),
                  cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
            return;
        } catch (cgroup_exception &ex) {
            if (attempt >= retries) throw;
            LOG(WARNING) << "retrying deletion of cgroup " << cgroup_name << ": " << ex.what();
            this_thread::sleep_for(chrono::milliseconds(10));
        }
    }
}

int64_t cgroup_guard::read_value(const string &controller, const string &file, int64_t def) const {
    ifstream fin(path(controller) / file);
    int64_t value;
    if (fin >> value) return value;
    return def;
}

int64_t cgroup_guard::read_keyed_value(const string &controller, const string &file, const string &key, int64_t def) const {
    ifstream fin(path(controller) / file);
    string token;
    int64_t value;
    while (fin >> token >> value)
        if (token == key) return value;
    return def;
}
