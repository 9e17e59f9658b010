#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace judgecell {

/**
 * @brief 沙箱根文件系统骨架中的目录，相对于 rootfs
 * 宿主机的二进制和库目录挂载到 bin、lib 等目录上，
 * workspace 为选手程序的工作目录（tmpfs），program 挂载选手代码和编译产物。
 */
const std::vector<std::string> &rootfs_skeleton();

/**
 * @brief 创建沙箱根文件系统骨架
 * 对一个已经存在的空骨架重复调用会成功；如果 rootfs 下存在骨架以外的文件，
 * 或者骨架目录不为空，说明有一个未被清理的旧沙箱占用了这个目录，此时直接失败，
 * 不会与旧沙箱的状态合并。
 * @param rootfs 根文件系统路径
 * @throw provision_error 目录被占用或者文件系统操作失败
 */
void provision_rootfs(const std::filesystem::path &rootfs);

}  // namespace judgecell
