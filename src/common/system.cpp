#include "common/system.hpp"
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

int get_userid(const char *name) {
    struct passwd pwd, *result = nullptr;
    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(size > 0 ? size : 16384);
    if (getpwnam_r(name, &pwd, buf.data(), buf.size(), &result) != 0 || !result)
        return -1;
    return (int)pwd.pw_uid;
}

int get_groupid(const char *name) {
    struct group grp, *result = nullptr;
    long size = sysconf(_SC_GETGR_R_SIZE_MAX);
    std::vector<char> buf(size > 0 ? size : 16384);
    if (getgrnam_r(name, &grp, buf.data(), buf.size(), &result) != 0 || !result)
        return -1;
    return (int)grp.gr_gid;
}
