#include "judgecell/common/utils.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid_generators.hpp>
#include <cerrno>
#include <mutex>
#include <system_error>

namespace judgecell {
using namespace std;

int exec_program(const vector<string> &args) {
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork " + args[0]);
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            execvp(argv[0], argv.data());
            _exit(127);
        default: {  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR)
                    throw system_error(errno, system_category(), "waiting for " + args[0]);
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
        }
    }
}

boost::uuids::uuid generate_uuid() {
    // random_generator 不是线程安全的
    static mutex mut;
    static boost::uuids::random_generator generator;
    lock_guard<mutex> lock(mut);
    return generator();
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace judgecell
