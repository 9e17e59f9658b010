#include "judgecell/sandbox/runc_runtime.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include "judgecell/common/exceptions.hpp"
#include "judgecell/common/io_utils.hpp"
#include "judgecell/common/utils.hpp"

namespace judgecell {
using namespace std;
namespace fs = std::filesystem;

static constexpr chrono::milliseconds WAIT_INTERVAL(5);

container_runtime::~container_runtime() {}

void become_subreaper() {
    if (prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) < 0)
        throw system_error(errno, system_category(), "unable to become child subreaper");
}

runc_runtime::runc_runtime(const string &runtime_path, const fs::path &cgroup_root)
    : runtime_path(runtime_path), cgroup_root(cgroup_root) {}

pid_t runc_runtime::create(const string &id, const fs::path &bundle, int stdin_fd, int stdout_fd, int stderr_fd) {
    fs::path log_file = bundle / "runc.log";
    fs::path pid_file = bundle / "init.pid";
    vector<string> args = {runtime_path, "--log", log_file.string(),
                           "create", "--bundle", bundle.string(), "--pid-file", pid_file.string(), id};
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid;
    switch (pid = fork()) {
        case -1:
            throw backend_error(string("Unable to fork runc: ") + strerror(errno));
        case 0:  // 子进程
            if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
                dup2(stdout_fd, STDOUT_FILENO) < 0 ||
                dup2(stderr_fd, STDERR_FILENO) < 0)
                _exit(126);
            signal(SIGINT, SIG_IGN);
            execvp(argv[0], argv.data());
            _exit(127);
        default:
            break;
    }

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw backend_error(string("Unable to wait for runc create: ") + strerror(errno));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        string log = read_file_content(log_file, "");
        if (WIFEXITED(status) && WEXITSTATUS(status) == 127)
            throw backend_error("Unable to execute container runtime " + runtime_path);
        throw backend_error(fmt::format("runc create {} failed with status {}: {}", id, status, log));
    }

    pid_t init_pid;
    try {
        init_pid = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(read_file_content(pid_file)));
    } catch (std::exception &e) {
        throw backend_error("Unable to read pid of container " + id + ": " + e.what());
    }

    lock_guard<mutex> lock(mut);
    containers[id] = container_state{init_pid, nullopt};
    return init_pid;
}

void runc_runtime::start(const string &id) {
    int ret = call_process(runtime_path, "start", id);
    if (ret != 0)
        throw backend_error(fmt::format("runc start {} exited with {}", id, ret));
}

pid_t runc_runtime::pid_of(const string &id) {
    lock_guard<mutex> lock(mut);
    auto it = containers.find(id);
    if (it == containers.end())
        throw backend_error("Container " + id + " is not created by this runtime");
    return it->second.pid;
}

optional<container_exit> runc_runtime::wait(const string &id, chrono::milliseconds timeout) {
    pid_t pid = pid_of(id);
    {
        lock_guard<mutex> lock(mut);
        if (containers[id].exit) return containers[id].exit;
    }

    elapsed_time timer;
    while (true) {
        int status;
        struct rusage usage;
        pid_t ret = wait4(pid, &status, WNOHANG, &usage);
        if (ret == pid) {
            container_exit result;
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.signal = WTERMSIG(status);
            }
            result.max_rss_kb = usage.ru_maxrss;
            lock_guard<mutex> lock(mut);
            containers[id].exit = result;
            return result;
        } else if (ret < 0) {
            if (errno == EINTR) continue;
            // ECHILD 说明容器进程没有被托管给本进程
            throw backend_error(fmt::format("Unable to wait for container {}: {}", id, strerror(errno)));
        }

        if (timer.duration<chrono::milliseconds>() >= timeout) return nullopt;
        this_thread::sleep_for(WAIT_INTERVAL);
    }
}

void runc_runtime::terminate(const string &id) {
    pid_t pid = pid_of(id);
    int ret = call_process(runtime_path, "kill", id, "KILL");
    if (ret != 0) {
        // 容器进程可能已经退出，此时 runc kill 会失败
        LOG(WARNING) << "runc kill " << id << " exited with " << ret << ", killing init process " << pid << " directly";
        if (kill(pid, SIGKILL) < 0 && errno != ESRCH)
            throw backend_error(fmt::format("Unable to kill container {}: {}", id, strerror(errno)));
    }
}

static optional<uint64_t> read_counter(const fs::path &file, const string &key) {
    ifstream fin(file.string());
    if (!fin) return nullopt;
    string name;
    uint64_t value;
    if (key.empty()) {
        if (fin >> value) return value;
        return nullopt;
    }
    while (fin >> name >> value)
        if (name == key) return value;
    return nullopt;
}

container_usage runc_runtime::usage(const string &id) {
    container_usage result;
    fs::path v2 = cgroup_root / "judgecell" / id;
    fs::path v1 = cgroup_root / "memory" / "judgecell" / id;

    optional<uint64_t> peak, oom_kills;
    if (fs::exists(v2 / "memory.peak") || fs::exists(v2 / "memory.events")) {
        peak = read_counter(v2 / "memory.peak", "");
        oom_kills = read_counter(v2 / "memory.events", "oom_kill");
    } else if (fs::exists(v1)) {
        peak = read_counter(v1 / "memory.max_usage_in_bytes", "");
        oom_kills = read_counter(v1 / "memory.oom_control", "oom_kill");
    } else {
        LOG(WARNING) << "Unable to find memory cgroup of container " << id;
    }

    if (peak) result.peak_memory_kb = *peak / 1024;
    result.oom_killed = oom_kills.value_or(0) > 0;
    return result;
}

void runc_runtime::remove(const string &id) {
    int ret = call_process(runtime_path, "delete", "--force", id);

    optional<container_state> state;
    {
        lock_guard<mutex> lock(mut);
        auto it = containers.find(id);
        if (it != containers.end()) {
            state = it->second;
            containers.erase(it);
        }
    }
    // delete --force 会杀死仍在运行的容器进程，回收它以免留下僵尸进程
    if (state && !state->exit) {
        elapsed_time timer;
        while (waitpid(state->pid, nullptr, WNOHANG) == 0 && timer.duration<chrono::seconds>() < 1s)
            this_thread::sleep_for(WAIT_INTERVAL);
    }

    if (ret != 0)
        throw backend_error(fmt::format("runc delete {} exited with {}", id, ret));
}

}  // namespace judgecell
