#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "judgecell/common/cancellation.hpp"
#include "judgecell/common/exceptions.hpp"
#include "judgecell/common/io_utils.hpp"
#include "judgecell/common/json_utils.hpp"
#include "judgecell/common/semaphore.hpp"
#include "judgecell/config.hpp"
#include "judgecell/judge/classifier.hpp"
#include "judgecell/judge/evaluator.hpp"
#include "judgecell/model/serialization.hpp"
#include "judgecell/sandbox/runc_runtime.hpp"
#include "judgecell/sandbox/sandbox.hpp"
using namespace std;
using nlohmann::json;
namespace po = boost::program_options;

static judgecell::cancel_token stop_token;

/**
 * @brief 按 命令行参数 > 环境变量 的顺序读取配置项，都不存在时保持原值
 */
template <typename T>
void load_option(const po::variables_map &vm, const char *option, const char *env, T &target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
    } else if (getenv(env)) {
        target = boost::lexical_cast<T>(getenv(env));
    }
}

static json outcome_to_json(const judgecell::execution_outcome &outcome) {
    return {
        {"instance_id", outcome.instance_id},
        {"exit_code", outcome.exit_code},
        {"signal", outcome.signal},
        {"wall_time_ms", outcome.wall_time_ms},
        {"memory_kb", outcome.memory_kb},
        {"stdout", judgecell::encode_bytes(outcome.output)},
        {"stderr", judgecell::encode_bytes(outcome.error_output)},
        {"timed_out", outcome.timed_out},
        {"output_limit_exceeded", outcome.output_limit_exceeded},
        {"cancelled", outcome.cancelled},
        {"oom_killed", outcome.oom_killed}};
}

static void write_output(const po::variables_map &vm, const json &document) {
    string text = document.dump(4);
    if (vm.count("output")) {
        judgecell::write_file_content(vm.at("output").as<string>(), text + "\n");
    } else {
        cout << text << endl;
    }
}

static int run_task(const po::variables_map &vm, judgecell::sandbox &box) {
    string path = vm.at("task").as<string>();
    string content = path == "-" ? string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>())
                                 : judgecell::read_file_content(path);

    judgecell::judge_task task;
    try {
        task = json::parse(content).get<judgecell::judge_task>();
    } catch (json::exception &e) {
        cerr << "Malformed judge task " << path << ": " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (invalid_argument &e) {
        cerr << "Invalid judge task " << path << ": " << e.what() << endl;
        return EXIT_FAILURE;
    }

    LOG(INFO) << "Judging submission " << task.submission.id << " with " << task.test_case_count() << " test cases";

    judgecell::evaluator judger(box, judgecell::RUN_DIR / "tasks");
    judgecell::judge_result result = judger.evaluate(task, stop_token);
    write_output(vm, json(result));
    return EXIT_SUCCESS;
}

static int run_command(const po::variables_map &vm, judgecell::sandbox &box) {
    if (!vm.count("command")) {
        cerr << "--exec requires a command after --" << endl;
        return EXIT_FAILURE;
    }

    judgecell::launch_spec spec;
    spec.args = vm.at("command").as<vector<string>>();
    spec.time_limit_ms = vm.at("time-limit").as<uint64_t>();
    spec.memory_limit_kb = vm.at("memory-limit").as<uint64_t>();
    spec.pids_limit = judgecell::PIDS_LIMIT;

    string input;
    if (vm.count("input")) input = judgecell::read_file_content(vm.at("input").as<string>());

    judgecell::execution_outcome outcome = box.execute(spec, input, stop_token);

    judgecell::classify_context context;
    context.time_limit_ms = spec.time_limit_ms;
    context.memory_limit_kb = spec.memory_limit_kb;
    context.mode = judgecell::COMPARE_MODE;
    context.stream_limit = judgecell::OUTPUT_LIMIT;
    auto verdict = judgecell::classify(outcome, context);

    json document = {
        {"outcome", outcome_to_json(outcome)},
        {"status", verdict.status},
        {"error_info", nlohmann::from_optional(verdict.error)}};
    write_output(vm, document);
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("judgecell options");
    po::positional_options_description positional;
    positional.add("command", -1);
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("task", po::value<string>(), "judge the JudgeTask JSON document in the given file, use - to read from stdin")
        ("output", po::value<string>(), "write the result document to the given file instead of stdout")
        ("exec", "run the command given after -- in a fresh sandbox and report what happened")
        ("command", po::value<vector<string>>(), "command to run with --exec")
        ("input", po::value<string>(), "file fed to the standard input of the command run with --exec")
        ("time-limit", po::value<uint64_t>()->default_value(1000), "time limit in milliseconds for --exec")
        ("memory-limit", po::value<uint64_t>()->default_value(262144), "memory limit in KB for --exec")
        ("config", po::value<string>(), "load deployment configuration from the given JSON file. You can either pass it from environ JUDGECELLCONFIG")
        ("run-dir", po::value<string>(), "set the directory to store sandbox bundles and task files. You can either pass it from environ RUNDIR")
        ("runtime", po::value<string>(), "set the path of the OCI container runtime, default to runc. You can either pass it from environ RUNTIME")
        ("sandbox-uid", po::value<unsigned>(), "set the host user the root user in sandbox is mapped to, default to 65534. You can either pass it from environ SANDBOXUID")
        ("sandbox-gid", po::value<unsigned>(), "set the host group the root group in sandbox is mapped to, default to 65534. You can either pass it from environ SANDBOXGID")
        ("max-sandboxes", po::value<size_t>(), "set the maximum number of sandboxes alive at the same time, default to the number of cores. You can either pass it from environ MAXSANDBOXES")
        ("output-limit", po::value<size_t>(), "set the limit in bytes of captured stdout and stderr, default to 67108864(64MB). You can either pass it from environ OUTPUTLIMIT")
        ("grace-period", po::value<uint64_t>(), "set the milliseconds to wait after the time limit before killing, default to 1000. You can either pass it from environ GRACEPERIOD")
        ("compare-mode", po::value<string>(), "set the output comparison policy, diff-all or diff-ign-space. You can either pass it from environ COMPAREMODE")
        ("fail-fast", "stop judging after the first test case not accepted")
        ("parallelism", po::value<size_t>(), "set the number of test cases judged concurrently in a task, default to 1. You can either pass it from environ PARALLELISM")
        ("compile-time-limit", po::value<uint64_t>(), "set time limit in milliseconds for compilation, default to 10000. You can either pass it from environ COMPILETIMELIMIT")
        ("compile-mem-limit", po::value<uint64_t>(), "set memory limit in KB for compilation, default to 524288(512MB). You can either pass it from environ COMPILEMEMLIMIT")
        ("pids-limit", po::value<int64_t>(), "set the maximum number of processes in a sandbox, default to 64. You can either pass it from environ PIDSLIMIT")
        ("retries", po::value<int>(), "set the number of retries for a task ended with system error, default to 1. You can either pass it from environ RETRIES")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode, and not to delete sandbox bundles and task directories.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "judgecell: Judge submissions inside OCI container sandboxes" << endl
             << "This app requires root privilege" << endl
             << "Usage: " << argv[0] << " --task FILE [options]" << endl
             << "       " << argv[0] << " --exec [options] -- CMD ARGS..." << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "judgecell 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("task") && !vm.count("exec")) {
        cerr << "Either --task or --exec should be specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    try {
        if (vm.count("config")) {
            judgecell::load_config(vm.at("config").as<string>());
        } else if (getenv("JUDGECELLCONFIG")) {
            judgecell::load_config(getenv("JUDGECELLCONFIG"));
        }

        if (vm.count("debug") || getenv("DEBUG")) judgecell::DEBUG = true;

        string run_dir = judgecell::RUN_DIR.string();
        load_option(vm, "run-dir", "RUNDIR", run_dir);
        judgecell::RUN_DIR = run_dir;
        load_option(vm, "runtime", "RUNTIME", judgecell::RUNTIME_PATH);
        load_option(vm, "sandbox-uid", "SANDBOXUID", judgecell::SANDBOX_UID);
        load_option(vm, "sandbox-gid", "SANDBOXGID", judgecell::SANDBOX_GID);
        load_option(vm, "max-sandboxes", "MAXSANDBOXES", judgecell::MAX_SANDBOXES);
        load_option(vm, "output-limit", "OUTPUTLIMIT", judgecell::OUTPUT_LIMIT);
        load_option(vm, "grace-period", "GRACEPERIOD", judgecell::GRACE_PERIOD_MS);
        load_option(vm, "parallelism", "PARALLELISM", judgecell::PARALLELISM);
        load_option(vm, "compile-time-limit", "COMPILETIMELIMIT", judgecell::COMPILE_TIME_LIMIT_MS);
        load_option(vm, "compile-mem-limit", "COMPILEMEMLIMIT", judgecell::COMPILE_MEMORY_LIMIT_KB);
        load_option(vm, "pids-limit", "PIDSLIMIT", judgecell::PIDS_LIMIT);
        load_option(vm, "retries", "RETRIES", judgecell::SYSTEM_ERROR_RETRIES);

        string mode = judgecell::to_string(judgecell::COMPARE_MODE);
        load_option(vm, "compare-mode", "COMPAREMODE", mode);
        judgecell::COMPARE_MODE = judgecell::parse_compare_mode(mode);

        if (vm.count("fail-fast") || getenv("FAILFAST")) judgecell::FAIL_FAST = true;
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Invalid value in environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (invalid_argument &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    } catch (system_error &e) {
        cerr << "Unable to read configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (json::exception &e) {
        cerr << "Malformed configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (getuid() != 0) {
        cerr << "You should run this program in privileged mode" << endl;
        if (!judgecell::DEBUG) return EXIT_FAILURE;
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    // 中断时取消正在进行的评测，沙箱由评测线程清理
    judgecell::cancel_on_signals(stop_token);

    try {
        filesystem::create_directories(judgecell::RUN_DIR / "tasks");
        filesystem::create_directories(judgecell::RUN_DIR / "sandboxes");

        // 容器的 init 进程由 runc 创建，需要收养后才能用 wait4 取得退出状态和资源用量
        judgecell::become_subreaper();

        judgecell::runc_runtime runtime(judgecell::RUNTIME_PATH);
        judgecell::admission_semaphore semaphore(judgecell::MAX_SANDBOXES);
        judgecell::sandbox box(runtime, semaphore, judgecell::RUN_DIR / "sandboxes");

        if (vm.count("task"))
            return run_task(vm, box);
        else
            return run_command(vm, box);
    } catch (judgecell::environment_error &e) {
        LOG(ERROR) << e;
        return EXIT_FAILURE;
    } catch (std::exception &e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }
}
