#include "judgecell/sandbox/sandbox.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>
#include "judgecell/common/defer.hpp"
#include "judgecell/common/exceptions.hpp"
#include "judgecell/common/io_utils.hpp"
#include "judgecell/common/utils.hpp"
#include "judgecell/config.hpp"
#include "judgecell/sandbox/rootfs.hpp"

namespace judgecell {
using namespace std;
namespace fs = std::filesystem;

static constexpr int POLL_INTERVAL_MS = 10;
static constexpr size_t BUF_SIZE = 65536;

// 杀死容器后等待其退出的最长时间
static constexpr chrono::milliseconds KILL_TIMEOUT(5000);

// 进程退出后读取管道中剩余输出的最长时间，容器外残留的写端不会阻塞评测
static constexpr chrono::milliseconds DRAIN_TIMEOUT(500);

namespace {

/**
 * @brief 捕获容器进程 stdout 或 stderr 的管道
 */
struct capture_pipe {
    int read_fd = -1;
    int write_fd = -1;

    capture_pipe() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) < 0)
            throw backend_error(string("Unable to create pipe: ") + strerror(errno));
        read_fd = fds[0];
        write_fd = fds[1];
        int flags = fcntl(read_fd, F_GETFL);
        if (flags < 0 || fcntl(read_fd, F_SETFL, flags | O_NONBLOCK) < 0)
            throw backend_error(string("Unable to set pipe non-blocking: ") + strerror(errno));
    }

    capture_pipe(const capture_pipe &) = delete;

    ~capture_pipe() {
        close_read();
        close_write();
    }

    void close_read() {
        if (read_fd >= 0) close(read_fd);
        read_fd = -1;
    }

    void close_write() {
        if (write_fd >= 0) close(write_fd);
        write_fd = -1;
    }
};

/**
 * @brief 带上限的输出缓冲，stdout 与 stderr 共用一个上限
 */
struct capture_buffer {
    size_t limit;
    size_t total = 0;
    bool exceeded = false;

    /**
     * @brief 读取管道中当前可读的全部数据
     * @return 管道是否还未到达 EOF
     */
    bool pump(capture_pipe &pipe, string &target) {
        char buf[BUF_SIZE];
        while (pipe.read_fd >= 0) {
            ssize_t nread = read(pipe.read_fd, buf, BUF_SIZE);
            if (nread > 0) {
                size_t accepted = min((size_t)nread, limit - total);
                target.append(buf, accepted);
                total += accepted;
                // 写满上限即视为超出，之后的数据丢弃，由调用者杀死容器
                if (accepted < (size_t)nread || total == limit) exceeded = true;
            } else if (nread == 0) {
                pipe.close_read();
                return false;
            } else if (errno == EINTR) {
                continue;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            } else {
                LOG(ERROR) << "Unable to read output of sandbox: " << strerror(errno);
                pipe.close_read();
                return false;
            }
        }
        return false;
    }
};

}  // namespace

sandbox::sandbox(container_runtime &runtime, admission_semaphore &semaphore, const fs::path &bundle_root)
    : runtime(runtime), semaphore(semaphore), bundle_root(bundle_root) {}

execution_outcome sandbox::execute(const launch_spec &spec, const string &input, const cancel_token &token) {
    execution_outcome outcome;

    auto permit = semaphore.acquire(token);
    if (!permit) {
        LOG(INFO) << "Cancelled while waiting for a sandbox slot";
        outcome.cancelled = true;
        return outcome;
    }

    // 每次执行都使用新的 id，不同执行之间不会争用 config.json 和容器注册信息
    string id = "judgecell-" + boost::uuids::to_string(generate_uuid());
    outcome.instance_id = id;
    fs::path bundle = bundle_root / id;

    bool registered = false;
    defer {
        if (registered) {
            try {
                runtime.remove(id);
            } catch (std::exception &e) {
                LOG(ERROR) << "Unable to remove container " << id << ": " << e.what();
            }
        }
        if (!DEBUG) {
            error_code ec;
            fs::remove_all(bundle, ec);
            if (ec) LOG(ERROR) << "Unable to remove bundle " << bundle << ": " << ec.message();
        }
    };

    if (fs::exists(bundle))
        throw provision_error("Bundle " + bundle.string() + " already exists");
    provision_rootfs(bundle / "rootfs");

    int stdin_fd;
    try {
        write_file_content(bundle / "stdin", input);
    } catch (system_error &e) {
        throw provision_error(string("Unable to write standard input: ") + e.what());
    }
    if ((stdin_fd = open((bundle / "stdin").c_str(), O_RDONLY | O_CLOEXEC)) < 0)
        throw provision_error(string("Unable to open standard input: ") + strerror(errno));
    defer {
        close(stdin_fd);
    };

    write_runtime_spec(bundle, generate_runtime_spec(spec, id));

    capture_pipe out_pipe, err_pipe;
    registered = true;
    pid_t pid = runtime.create(id, bundle, stdin_fd, out_pipe.write_fd, err_pipe.write_fd);
    // 只保留容器进程持有的写端，容器进程退出后才能读到 EOF
    out_pipe.close_write();
    err_pipe.close_write();
    DLOG(INFO) << "Created container " << id << " with init process " << pid;

    runtime.start(id);
    elapsed_time timer;
    uint64_t deadline_ms = spec.time_limit_ms + GRACE_PERIOD_MS;

    capture_buffer buffer{OUTPUT_LIMIT};
    optional<container_exit> exited;
    bool killed = false;
    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_pipe.read_fd >= 0) fds[nfds++] = {out_pipe.read_fd, POLLIN, 0};
        if (err_pipe.read_fd >= 0) fds[nfds++] = {err_pipe.read_fd, POLLIN, 0};
        if (nfds > 0) {
            if (poll(fds, nfds, POLL_INTERVAL_MS) < 0 && errno != EINTR)
                throw backend_error(string("Unable to poll output of sandbox: ") + strerror(errno));
        } else {
            this_thread::sleep_for(chrono::milliseconds(POLL_INTERVAL_MS));
        }

        buffer.pump(out_pipe, outcome.output);
        buffer.pump(err_pipe, outcome.error_output);

        if (buffer.exceeded) {
            LOG(INFO) << "Container " << id << " exceeded output limit " << OUTPUT_LIMIT;
            outcome.output_limit_exceeded = true;
        } else if ((exited = runtime.wait(id, chrono::milliseconds(0)))) {
            break;
        } else if (token.is_cancelled()) {
            LOG(INFO) << "Container " << id << " is cancelled";
            outcome.cancelled = true;
        } else if (timer.duration<chrono::milliseconds>().count() >= (int64_t)deadline_ms) {
            LOG(INFO) << "Container " << id << " exceeded deadline " << deadline_ms << "ms";
            outcome.timed_out = true;
        } else {
            continue;
        }

        killed = true;
        break;
    }
    outcome.wall_time_ms = timer.duration<chrono::milliseconds>().count();

    if (killed) {
        runtime.terminate(id);
        exited = runtime.wait(id, KILL_TIMEOUT);
        if (!exited) {
            LOG(ERROR) << "Container " << id << " did not exit " << KILL_TIMEOUT.count() << "ms after being killed";
            exited = container_exit{-1, SIGKILL, 0};
        }
    }

    elapsed_time drain_timer;
    while ((out_pipe.read_fd >= 0 || err_pipe.read_fd >= 0) && !buffer.exceeded && drain_timer.duration<chrono::milliseconds>() < DRAIN_TIMEOUT) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_pipe.read_fd >= 0) fds[nfds++] = {out_pipe.read_fd, POLLIN, 0};
        if (err_pipe.read_fd >= 0) fds[nfds++] = {err_pipe.read_fd, POLLIN, 0};
        if (poll(fds, nfds, POLL_INTERVAL_MS) < 0 && errno != EINTR) break;
        buffer.pump(out_pipe, outcome.output);
        buffer.pump(err_pipe, outcome.error_output);
    }
    if (buffer.exceeded && !killed) {
        // 进程在退出前写满了缓冲区
        outcome.output_limit_exceeded = true;
    }

    outcome.exit_code = exited->exit_code;
    outcome.signal = exited->signal;

    container_usage usage = runtime.usage(id);
    outcome.memory_kb = max(exited->max_rss_kb, usage.peak_memory_kb.value_or(0));
    if (usage.oom_killed) {
        outcome.oom_killed = true;
        outcome.memory_kb = max(outcome.memory_kb, spec.memory_limit_kb);
    }

    LOG(INFO) << "Container " << id << " finished: exit code " << outcome.exit_code << ", signal " << outcome.signal
              << ", time " << outcome.wall_time_ms << "ms, memory " << outcome.memory_kb << "KB";
    return outcome;
}

}  // namespace judgecell
