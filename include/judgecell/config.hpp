#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace judgecell {

/**
 * @brief 输出比较策略，整个部署使用同一种，不允许按测试点选择
 */
enum class compare_mode {
    /**
     * @brief 精确比较，输出必须逐字节相同
     */
    EXACT,

    /**
     * @brief 忽略行末空白字符和文末空行的比较
     */
    IGNORE_TRAILING_SPACE
};

/**
 * @brief 解析比较策略名称
 * @param name "diff-all" 或 "diff-ign-space"
 * @throw std::invalid_argument 名称无法识别
 */
compare_mode parse_compare_mode(const std::string &name);

std::string to_string(compare_mode mode);

/**
 * @brief 沙箱 bundle 的根目录
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── tasks
 * │   └── 0b5c...  // 评测任务 uuid
 * │       └── program // 选手代码和编译产物，以 /program 挂载进沙箱
 * └── sandboxes
 *     └── judgecell-3f2a... // 沙箱实例 id，每次执行重新生成
 *         ├── config.json // OCI 运行时配置
 *         ├── stdin // 标准输入数据
 *         └── rootfs // 沙箱根文件系统骨架
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 容器运行时（runc）的可执行文件路径
 */
extern std::string RUNTIME_PATH;

/**
 * @brief 沙箱内 root 用户映射到的宿主机用户
 * @defaultValue 65534 (nobody)
 */
extern unsigned SANDBOX_UID;

/**
 * @brief 沙箱内 root 用户组映射到的宿主机用户组
 * @defaultValue 65534 (nogroup)
 */
extern unsigned SANDBOX_GID;

/**
 * @brief 同时存活的沙箱实例数上限
 * @defaultValue 处理器核数
 */
extern std::size_t MAX_SANDBOXES;

/**
 * @brief 一次执行 stdout 与 stderr 合计的捕获上限（字节），超出时立即终止程序
 * @defaultValue 64MB
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 时间限制之外额外等待的时间（毫秒），超过 时间限制 + 宽限时间 仍未结束的程序将被杀死
 */
extern std::uint64_t GRACE_PERIOD_MS;

extern compare_mode COMPARE_MODE;

/**
 * @brief 是否在第一个未通过的测试点之后停止评测
 */
extern bool FAIL_FAST;

/**
 * @brief 一个评测任务中同时评测的测试点数
 */
extern std::size_t PARALLELISM;

extern std::uint64_t COMPILE_TIME_LIMIT_MS;

extern std::uint64_t COMPILE_MEMORY_LIMIT_KB;

/**
 * @brief 沙箱内进程/线程数上限
 */
extern std::int64_t PIDS_LIMIT;

/**
 * @brief 沙箱工作目录 /workspace 的 tmpfs 大小（KB）
 */
extern std::uint64_t SCRATCH_SIZE_KB;

/**
 * @brief 沙箱 /dev 的 tmpfs 大小（KB）
 */
extern std::uint64_t DEV_SIZE_KB;

/**
 * @brief 评测结果为 SystemError 时整个任务的重试次数
 */
extern int SYSTEM_ERROR_RETRIES;

/**
 * @brief 以只读方式挂载进沙箱的宿主机目录，沙箱内路径与宿主机相同
 * 宿主机上不存在的目录将被跳过
 */
extern std::vector<std::string> HOST_BIN_MOUNTS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不再检查程序是否在特权模式下执行，
 * 并且不会删除产生的沙箱目录和任务目录，以便手动检查 config.json 等文件是否符合预期。
 */
extern bool DEBUG;

/**
 * @brief 从 JSON 部署配置文件读取配置，文件中未出现的键保持原值
 * @param path 配置文件路径，键名为全局变量名的小写形式，如 "run_dir"
 * @throw std::invalid_argument 配置项类型不正确
 * @throw std::system_error 文件无法读取
 */
void load_config(const std::filesystem::path &path);

}  // namespace judgecell
