#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <cerrno>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

extern char **environ;

namespace labjudge {
using namespace std;

static int redirect(const filesystem::path &path, int fd, int flags) {
    if (path.empty()) return 0;
    int file = open(path.c_str(), flags, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (file < 0) return -1;
    if (dup2(file, fd) < 0) return -1;
    close(file);
    return 0;
}

process_result exec_program(const process_options &opt, const char **argv) {
    // 环境变量必须在 fork 之前准备好，子进程中只能调用异步信号安全的函数
    map<string, string> env;
    for (char **e = environ; e && *e; ++e) {
        string entry(*e);
        auto idx = entry.find('=');
        if (idx != string::npos) env[entry.substr(0, idx)] = entry.substr(idx + 1);
    }
    for (auto &[key, value] : opt.env)
        env[key] = value;
    vector<string> env_entries;
    for (auto &[key, value] : env)
        env_entries.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_entries)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0: {  // 子进程
            // 子进程单独成组，超时时可以终止整个进程组
            setpgid(0, 0);
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            sigset_t empty;
            sigemptyset(&empty);
            sigprocmask(SIG_SETMASK, &empty, nullptr);

            if (redirect(opt.stdin_file, STDIN_FILENO, O_RDONLY) < 0 ||
                redirect(opt.stdout_file, STDOUT_FILENO, O_WRONLY | O_CREAT | O_TRUNC) < 0 ||
                redirect(opt.stderr_file, STDERR_FILENO, O_WRONLY | O_CREAT | O_TRUNC) < 0)
                _exit(127);

            execvpe(argv[0], (char **)argv, envp.data());
            _exit(127);
        }
        default:  // 父进程
            break;
    }
    setpgid(pid, pid);

    process_result result;
    int status = 0;
    if (opt.timeout < 0) {
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) throw system_error(errno, system_category(), "waitpid");
        }
    } else {
        elapsed_time timer;
        bool sent_term = false, sent_kill = false;
        double term_at = 0;
        auto interval = chrono::milliseconds(1);
        while (true) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) break;
            if (ret < 0 && errno != EINTR) throw system_error(errno, system_category(), "waitpid");

            double elapsed = timer.duration<chrono::microseconds>().count() / 1e6;
            if (!sent_term && elapsed > opt.timeout) {
                LOG(WARNING) << "process " << argv[0] << " exceeded timeout " << opt.timeout << "s, sending SIGTERM";
                kill(-pid, SIGTERM);
                sent_term = true;
                result.timed_out = true;
                term_at = elapsed;
            } else if (sent_term && !sent_kill && elapsed - term_at > opt.kill_delay) {
                LOG(WARNING) << "process " << argv[0] << " still alive, sending SIGKILL";
                kill(-pid, SIGKILL);
                sent_kill = true;
            }

            this_thread::sleep_for(interval);
            if (interval < chrono::milliseconds(10)) interval *= 2;
        }
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string generate_uuid() {
    // random_generator 不是线程安全的
    static mutex uuid_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(uuid_mutex);
    return boost::uuids::to_string(generator());
}

string format_time(chrono::system_clock::time_point time) {
    time_t t = chrono::system_clock::to_time_t(time);
    struct tm tm;
    gmtime_r(&t, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

chrono::system_clock::time_point parse_time(const string &text) {
    struct tm tm = {};
    const char *end = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (!end)
        throw invalid_argument("Malformed time " + text);
    // 容器运行时给出的时间带有纳秒部分，如 2026-10-17T08:00:00.123456789Z
    chrono::nanoseconds fraction(0);
    if (*end == '.') {
        long long scale = 100000000;
        for (++end; isdigit((unsigned char)*end); ++end) {
            fraction += chrono::nanoseconds((*end - '0') * scale);
            scale /= 10;
        }
    }
    if (*end != 'Z' && *end != '\0')
        throw invalid_argument("Malformed time " + text);
    return chrono::system_clock::from_time_t(timegm(&tm)) +
           chrono::duration_cast<chrono::system_clock::duration>(fraction);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace labjudge
