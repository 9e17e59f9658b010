#include "judgecell/sandbox/rootfs.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <set>
#include "judgecell/common/exceptions.hpp"

namespace judgecell {
using namespace std;
namespace fs = std::filesystem;

const vector<string> &rootfs_skeleton() {
    static const vector<string> skeleton = {
        "bin", "usr", "usr/bin", "usr/lib", "usr/lib64", "lib", "lib64",
        "etc", "proc", "sys", "dev", "dev/pts", "dev/shm",
        "workspace", "program"};
    return skeleton;
}

/**
 * @brief 检查 rootfs 中是否只有骨架目录
 */
static void check_unoccupied(const fs::path &rootfs) {
    set<string> expected(rootfs_skeleton().begin(), rootfs_skeleton().end());
    for (auto it = fs::recursive_directory_iterator(rootfs); it != fs::recursive_directory_iterator(); ++it) {
        string relative = fs::relative(it->path(), rootfs).generic_string();
        if (!expected.count(relative) || it->is_symlink() || !it->is_directory()) {
            throw provision_error(fmt::format("Rootfs {} is occupied by a previous sandbox: found {}", rootfs.string(), relative));
        }
    }
}

void provision_rootfs(const fs::path &rootfs) {
    try {
        if (fs::exists(fs::symlink_status(rootfs))) {
            if (!fs::is_directory(fs::symlink_status(rootfs)))
                throw provision_error("Rootfs " + rootfs.string() + " exists and is not a directory");
            check_unoccupied(rootfs);
        }

        fs::create_directories(rootfs);
        for (auto &dir : rootfs_skeleton()) {
            fs::create_directories(rootfs / dir);
            fs::permissions(rootfs / dir,
                            fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                            fs::perm_options::replace);
        }
    } catch (fs::filesystem_error &e) {
        LOG(ERROR) << "Unable to provision rootfs " << rootfs << ": " << e.what();
        throw provision_error(string("Unable to provision rootfs: ") + e.what());
    }
}

}  // namespace judgecell
