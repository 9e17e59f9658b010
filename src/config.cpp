#include "judgecell/config.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>
#include "judgecell/common/io_utils.hpp"
#include "judgecell/common/json_utils.hpp"

namespace judgecell {
using namespace std;
using namespace nlohmann;

filesystem::path RUN_DIR = "/var/lib/judgecell";
string RUNTIME_PATH = "runc";
unsigned SANDBOX_UID = 65534;
unsigned SANDBOX_GID = 65534;
size_t MAX_SANDBOXES = max(1u, thread::hardware_concurrency());
size_t OUTPUT_LIMIT = 64 << 20;            // 64M
uint64_t GRACE_PERIOD_MS = 1000;           // 1s
compare_mode COMPARE_MODE = compare_mode::IGNORE_TRAILING_SPACE;
bool FAIL_FAST = false;
size_t PARALLELISM = 1;
uint64_t COMPILE_TIME_LIMIT_MS = 10000;    // 10s
uint64_t COMPILE_MEMORY_LIMIT_KB = 1 << 19;  // 512M
int64_t PIDS_LIMIT = 64;
uint64_t SCRATCH_SIZE_KB = 65536;          // 64M
uint64_t DEV_SIZE_KB = 65536;              // 64M
int SYSTEM_ERROR_RETRIES = 1;
vector<string> HOST_BIN_MOUNTS = {"/bin", "/usr/bin", "/lib", "/lib64", "/usr/lib", "/usr/lib64", "/etc/alternatives"};
bool DEBUG = false;

compare_mode parse_compare_mode(const string &name) {
    if (name == "diff-all")
        return compare_mode::EXACT;
    else if (name == "diff-ign-space")
        return compare_mode::IGNORE_TRAILING_SPACE;
    else
        throw invalid_argument("Unrecognized compare mode " + name);
}

string to_string(compare_mode mode) {
    switch (mode) {
        case compare_mode::EXACT: return "diff-all";
        case compare_mode::IGNORE_TRAILING_SPACE: return "diff-ign-space";
    }
    throw invalid_argument("Unrecognized compare mode");
}

void load_config(const filesystem::path &path) {
    json config = json::parse(read_file_content(path));
    if (!config.is_object())
        throw invalid_argument("Deployment configuration " + path.string() + " is not a JSON object");

    RUN_DIR = get_value_def<string>(config, RUN_DIR.string(), "run_dir");
    RUNTIME_PATH = get_value_def<string>(config, RUNTIME_PATH, "runtime_path");
    SANDBOX_UID = get_value_def<unsigned>(config, SANDBOX_UID, "sandbox_uid");
    SANDBOX_GID = get_value_def<unsigned>(config, SANDBOX_GID, "sandbox_gid");
    MAX_SANDBOXES = get_value_def<size_t>(config, MAX_SANDBOXES, "max_sandboxes");
    OUTPUT_LIMIT = get_value_def<size_t>(config, OUTPUT_LIMIT, "output_limit");
    GRACE_PERIOD_MS = get_value_def<uint64_t>(config, GRACE_PERIOD_MS, "grace_period_ms");
    COMPARE_MODE = parse_compare_mode(get_value_def<string>(config, to_string(COMPARE_MODE), "compare_mode"));
    FAIL_FAST = get_value_def<bool>(config, FAIL_FAST, "fail_fast");
    PARALLELISM = get_value_def<size_t>(config, PARALLELISM, "parallelism");
    COMPILE_TIME_LIMIT_MS = get_value_def<uint64_t>(config, COMPILE_TIME_LIMIT_MS, "compile_time_limit_ms");
    COMPILE_MEMORY_LIMIT_KB = get_value_def<uint64_t>(config, COMPILE_MEMORY_LIMIT_KB, "compile_memory_limit_kb");
    PIDS_LIMIT = get_value_def<int64_t>(config, PIDS_LIMIT, "pids_limit");
    SCRATCH_SIZE_KB = get_value_def<uint64_t>(config, SCRATCH_SIZE_KB, "scratch_size_kb");
    DEV_SIZE_KB = get_value_def<uint64_t>(config, DEV_SIZE_KB, "dev_size_kb");
    SYSTEM_ERROR_RETRIES = get_value_def<int>(config, SYSTEM_ERROR_RETRIES, "system_error_retries");
    HOST_BIN_MOUNTS = get_value_def<vector<string>>(config, HOST_BIN_MOUNTS, "host_bin_mounts");
    DEBUG = get_value_def<bool>(config, DEBUG, "debug");

    LOG(INFO) << "Loaded deployment configuration from " << path;
}

}  // namespace judgecell
