#include "limits.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <libcgroup.h>
#include <limits>
#include <math.h>
#include <sched.h>
#include <seccomp.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>
#include "cgroup.hpp"
#include "utils.hpp"

using namespace std;
namespace fs = std::filesystem;

const int64_t CPU_PERIOD = 100000;  // 100ms, in us

void cgroup_create(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    bool v2 = cgroup_guard::unified();

    // 初始化 memory 资源管控器
    cgroup_ctrl memory = cg.add_controller("memory");
    if (opt.memory_limit >= 0) {
        if (v2) {
            memory.set("memory.max", opt.memory_limit);
            // 禁止使用交换分区，超过限制时直接触发 OOM killer
            memory.set("memory.swap.max", (int64_t)0);
        } else {
            // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
            memory.set("memory.limit_in_bytes", opt.memory_limit);
            if (fs::exists(cgroup_guard::root("memory") / "memory.memsw.limit_in_bytes"))
                memory.set("memory.memsw.limit_in_bytes", opt.memory_limit);
            else
                LOG(WARNING) << "swap accounting disabled, memory.memsw.limit_in_bytes unavailable";
        }
    }

    if (opt.nproc != numeric_limits<size_t>::max()) {
        // 限制进程数，避免 fork 炸弹
        cg.add_controller("pids").set("pids.max", (int64_t)opt.nproc);
    }

    if (opt.cpu_quota > 0) {
        cgroup_ctrl cpu = cg.add_controller("cpu");
        int64_t quota = (int64_t)(opt.cpu_quota * CPU_PERIOD);
        if (v2) {
            cpu.set("cpu.max", fmt::format("{} {}", quota, CPU_PERIOD));
        } else {
            cpu.set("cpu.cfs_period_us", CPU_PERIOD);
            cpu.set("cpu.cfs_quota_us", quota);
        }
    } else if (v2) {
        // cgroup v2 通过 cpu.stat 统计 CPU 时间
        cg.add_controller("cpu");
    }

    if (!opt.cpuset.empty()) {
        // 受控程序独占 CPU，避免时间计量受其他进程影响
        cgroup_ctrl cpuset = cg.add_controller("cpuset");
        // TODO: cpuset.mems 应当设置为 cpuset.cpus 所在的 NUMA 节点
        cpuset.set("cpuset.mems", "0");
        cpuset.set("cpuset.cpus", opt.cpuset);
    }

    if (!v2) cg.add_controller("cpuacct");

    cg.create();
}

void cgroup_attach(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.load();
    cg.attach();
}

void cgroup_kill(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    if (!cg.kill_all())
        LOG(ERROR) << "unable to kill all processes in cgroup " << opt.cgroupname;
}

void cgroup_delete(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.load();
    cg.remove(10);
}

cgroup_stats cgroup_read_stats(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cgroup_stats stats;
    if (cgroup_guard::unified()) {
        // memory.peak 需要 Linux 5.19
        stats.memory_peak = cg.read_value("", "memory.peak", -1);
        int64_t usage_usec = cg.read_keyed_value("", "cpu.stat", "usage_usec", -1);
        if (usage_usec >= 0) stats.cpu_time = usage_usec / 1e6;
        stats.oom_killed = cg.read_keyed_value("", "memory.events", "oom_kill", 0) > 0;
    } else {
        stats.memory_peak = cg.read_value("memory", "memory.memsw.max_usage_in_bytes", -1);
        if (stats.memory_peak < 0)
            stats.memory_peak = cg.read_value("memory", "memory.max_usage_in_bytes", -1);
        int64_t usage_ns = cg.read_value("cpuacct", "cpuacct.usage", -1);
        if (usage_ns >= 0) stats.cpu_time = usage_ns / 1e9;
        stats.oom_killed = cg.read_keyed_value("memory", "memory.oom_control", "oom_kill", 0) > 0;
    }
    return stats;
}

struct mount_entry {
    string mount_point;
    string fstype;
    unsigned long flags;
};

static string unescape_mount_path(const string &path) {
    // mountinfo 中空格等字符被转义为 \040 形式的八进制
    string result;
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '\\' && i + 3 < path.size() && isdigit(path[i + 1])) {
            result += (char)stoi(path.substr(i + 1, 3), nullptr, 8);
            i += 3;
        } else {
            result += path[i];
        }
    }
    return result;
}

static vector<mount_entry> read_mounts() {
    vector<mount_entry> mounts;
    ifstream fin("/proc/self/mountinfo");
    string line;
    while (getline(fin, line)) {
        istringstream ss(line);
        string id, parent, dev, root, mount_point, options, token;
        ss >> id >> parent >> dev >> root >> mount_point >> options;
        // 跳过可选字段，直到分隔符 "-"
        while (ss >> token && token != "-") {}
        mount_entry entry;
        entry.mount_point = unescape_mount_path(mount_point);
        ss >> entry.fstype;
        entry.flags = 0;
        istringstream opts(options);
        while (getline(opts, token, ',')) {
            if (token == "nosuid") entry.flags |= MS_NOSUID;
            else if (token == "nodev") entry.flags |= MS_NODEV;
            else if (token == "noexec") entry.flags |= MS_NOEXEC;
            else if (token == "noatime") entry.flags |= MS_NOATIME;
            else if (token == "nodiratime") entry.flags |= MS_NODIRATIME;
            else if (token == "relatime") entry.flags |= MS_RELATIME;
        }
        mounts.push_back(entry);
    }
    return mounts;
}

static bool is_under(const string &path, const string &dir) {
    if (dir == "/") return true;
    return path == dir || (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/');
}

static void remount_read_only(const string &root) {
    for (auto &entry : read_mounts()) {
        if (!is_under(entry.mount_point, root)) continue;

        // 保留 /proc、/sys、/dev 原样，runguard 还需要通过 cgroupfs 清理 cgroup
        string relative = root == "/" ? entry.mount_point : entry.mount_point.substr(root.size());
        if (relative.empty()) relative = "/";
        if (is_under(relative, "/proc") || is_under(relative, "/sys") || is_under(relative, "/dev"))
            continue;
        if (entry.fstype == "cgroup" || entry.fstype == "cgroup2")
            continue;

        if (mount(nullptr, entry.mount_point.c_str(), nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | entry.flags, nullptr) != 0) {
            if (entry.mount_point == root)
                throw system_error(errno, generic_category(), fmt::format("unable to remount {} read-only", root));
            LOG(WARNING) << "unable to remount " << entry.mount_point << " read-only: " << strerror(errno);
        }
    }
}

void setup_filesystem(struct runguard_options &opt) {
    // 私有化所有挂载点，受控程序的挂载操作不会传播到主机
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0)
        throw system_error(errno, generic_category(), "unable to make mounts private");

    string root = opt.chroot_dir.empty() ? "/" : fs::weakly_canonical(opt.chroot_dir).string();
    fs::path root_path(root);

    // 在挂载 tmpfs 之前打开 box 目录，box 目录可能位于即将被遮住的路径下
    int box_fd = -1;
    if (!opt.box_dir.empty()) {
        box_fd = open(opt.box_dir.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC);
        if (box_fd < 0)
            throw system_error(errno, generic_category(), fmt::format("unable to open box directory {}", opt.box_dir));
    }

    if (root != "/") {
        // chroot 目录需要是独立的挂载点才能整体重新挂载为只读
        if (mount(root.c_str(), root.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to bind mount {}", root));
    }

    if (opt.read_only_root) {
        remount_read_only(root);
        LOG(INFO) << "remounted " << root << " read-only";
    }

    fs::path tmp = root_path / "tmp";
    {
        string data = "mode=1777";
        if (opt.scratch_size > 0) data += fmt::format(",size={}", opt.scratch_size);
        if (mount("tmpfs", tmp.c_str(), "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC, data.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to mount scratch tmpfs on {}", tmp.string()));
    }

    if (box_fd >= 0) {
        fs::path target = tmp / "box";
        if (mkdir(target.c_str(), 0755) != 0 && errno != EEXIST)
            throw system_error(errno, generic_category(), "unable to create box mount point");

        string source = fmt::format("/proc/self/fd/{}", box_fd);
        if (mount(source.c_str(), target.c_str(), nullptr, MS_BIND, nullptr) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to bind mount box {}", opt.box_dir));
        close(box_fd);

        unsigned long flags = MS_REMOUNT | MS_BIND | MS_NOSUID | MS_NODEV;
        if (!opt.box_writable) flags |= MS_RDONLY;
        if (mount(nullptr, target.c_str(), nullptr, flags, nullptr) != 0)
            throw system_error(errno, generic_category(), "unable to remount box");

        if (opt.chroot_dir.empty()) {
            // 遮住 box 的上层目录（通常是运行目录），避免看到其他沙箱的文件
            fs::path parent = fs::path(opt.box_dir).parent_path();
            if (parent != "/" && fs::is_directory(parent) && !is_under(parent.string(), "/tmp")) {
                if (mount("tmpfs", parent.c_str(), "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC | MS_RDONLY, "size=4k,mode=0755") != 0)
                    throw system_error(errno, generic_category(), fmt::format("unable to hide {}", parent.string()));
            }
        }

        opt.work_dir = "/tmp/box";
    }
}

void mount_proc(const struct runguard_options &opt) {
    // 再次分离 mount 命名空间，新的 /proc 不会影响 watchdog 进程
    if (unshare(CLONE_NEWNS) != 0)
        throw system_error(errno, generic_category(), "unable to unshare mount namespace");

    fs::path proc = fs::path(opt.chroot_dir.empty() ? "/" : opt.chroot_dir) / "proc";
    if (!fs::is_directory(proc)) {
        LOG(WARNING) << proc << " does not exist, skip mounting proc";
        return;
    }
    if (mount("proc", proc.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0)
        throw system_error(errno, generic_category(), fmt::format("unable to mount {}", proc.string()));
}

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

void set_restrictions(const struct runguard_options &opt) {
    if (!opt.preserve_sys_env) {
        char *path = getenv("PATH");
        string saved_path = path ? path : "";
        clearenv();
        if (!saved_path.empty()) setenv("PATH", saved_path.c_str(), true);
    }

    for (auto &entry : opt.env) {
        std::string env = entry;
        auto idx = env.find('=');
        if (idx == string::npos) continue;
        setenv(env.substr(0, idx).c_str(), env.substr(idx + 1).c_str(), true);
    }
    // 编译器和解释器会在 HOME、TMPDIR 中写入临时文件，这里只有 /tmp 可写
    setenv("HOME", "/tmp", false);
    setenv("TMPDIR", "/tmp", false);

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. The SIGXCPU can be caught, but is
		   not by default and gives us a reliable way to detect if the
		   CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // memory limits(RLIMIT_AS, RLIMIT_DATA) are handled by cgroups
    set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY);
    set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY);

    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    // process limits are handled by the pids controller, RLIMIT_NPROC
    // counts processes of all sandboxes sharing the same run user
    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit + 1);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // put child process in the control group
    cgroup_attach(opt);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    // set root directory and change working directory
    if (!opt.chroot_dir.empty()) {
        if (chroot(opt.chroot_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chroot to {}", opt.chroot_dir));
        if (chdir("/") != 0)
            throw system_error(errno, generic_category(), "unable to chdir to / in chroot");
    }

    if (!opt.work_dir.empty()) {
        if (chdir(opt.work_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));
    }

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[1];
        aux_groups[0] = opt.group_id;
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
    } else {
        if (setuid(getuid()))
            throw system_error(errno, generic_category(), "unable to reset user id");
    }

    if (geteuid() == 0 || getuid() == 0)
        throw runtime_error("you cannot run user command as root");
}

void set_seccomp(const struct runguard_options &opt) {
    if (!opt.use_seccomp) return;

    static const char *denied_syscalls[] = {
        "ptrace", "process_vm_readv", "process_vm_writev",
        "mount", "umount2", "pivot_root", "chroot", "unshare", "setns",
        "reboot", "kexec_load", "kexec_file_load",
        "init_module", "finit_module", "delete_module",
        "swapon", "swapoff", "acct", "settimeofday", "clock_settime",
        "bpf", "perf_event_open", "userfaultfd", "open_by_handle_at",
        "keyctl", "add_key", "request_key"};

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) throw runtime_error("seccomp_init failed");

    auto ensure = [&](int ret, const string &op) {
        if (ret < 0) {
            seccomp_release(ctx);
            throw system_error(-ret, generic_category(), op);
        }
    };

    for (const char *name : denied_syscalls) {
        int nr = seccomp_syscall_resolve_name(name);
        if (nr == __NR_SCMP_ERROR) continue;  // not available on this architecture
        ensure(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), nr, 0), fmt::format("seccomp_rule_add({})", name));
    }

    // 禁止通过 clone 创建新的命名空间
    ensure(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(clone), 1,
                            SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_NEWUSER, CLONE_NEWUSER)),
           "seccomp_rule_add(clone)");
    // clone3 的参数在结构体中无法检查，返回 ENOSYS 让 libc 退回到 clone
    int clone3 = seccomp_syscall_resolve_name("clone3");
    if (clone3 != __NR_SCMP_ERROR)
        ensure(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), clone3, 0), "seccomp_rule_add(clone3)");

    ensure(seccomp_load(ctx), "seccomp_load");
    seccomp_release(ctx);
}
