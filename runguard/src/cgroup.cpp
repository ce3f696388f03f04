#include "cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <cstdlib>
#include <fstream>
#include <memory>

using namespace std;

cgroup_error::cgroup_error(const string &op, int err) {
    // ECGOTHER 表示底层的系统调用失败，真正的错误码需要另外获取
    const char *reason = err == ECGOTHER ? cgroup_strerror(cgroup_get_last_errno()) : cgroup_strerror(err);
    message = fmt::format("libcgroup: {}: {}", op, reason);
}

const char *cgroup_error::what() const noexcept {
    return message.c_str();
}

void cgroup_error::check(const string &op, int err) {
    if (err != 0) throw cgroup_error(op, err);
}

void execution_cgroup::init() {
    cgroup_error::check("cgroup_init", cgroup_init());
}

static cgroup_controller *add_controller(struct cgroup *cg, const char *name) {
    cgroup_controller *ctrl = cgroup_add_controller(cg, name);
    if (!ctrl) throw cgroup_error(fmt::format("cgroup_add_controller({})", name), ECGOTHER);
    return ctrl;
}

static void set_value(cgroup_controller *ctrl, const char *key, int64_t value) {
    cgroup_error::check(fmt::format("cgroup_add_value_int64({}, {})", key, value),
                        cgroup_add_value_int64(ctrl, key, value));
}

execution_cgroup::execution_cgroup(const string &name, int64_t memory_limit, size_t max_processes, uint32_t net_classid)
    : cgroup_name(name) {
    cg = cgroup_new_cgroup(name.c_str());
    if (!cg) throw cgroup_error(fmt::format("cgroup_new_cgroup({})", name), ECGOTHER);

    try {
        cgroup_controller *memory = add_controller(cg, "memory");
        set_value(memory, "memory.limit_in_bytes", memory_limit >= 0 ? memory_limit : -1);
        set_value(memory, "memory.memsw.limit_in_bytes", memory_limit >= 0 ? memory_limit : -1);

        add_controller(cg, "cpuacct");

        cgroup_controller *pids = add_controller(cg, "pids");
        if (max_processes > 0)
            set_value(pids, "pids.max", (int64_t)max_processes);

        if (net_classid != 0) {
            cgroup_controller *net_cls = add_controller(cg, "net_cls");
            set_value(net_cls, "net_cls.classid", (int64_t)net_classid);
        }

        cgroup_error::check(fmt::format("cgroup_create_cgroup({})", name), cgroup_create_cgroup(cg, 1));
        created = true;
    } catch (...) {
        cgroup_free(&cg);
        throw;
    }
    DLOG(INFO) << "created cgroup " << name;
}

execution_cgroup::~execution_cgroup() {
    if (created) {
        int ret = cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE);
        if (ret != 0)
            LOG(ERROR) << "unable to delete cgroup " << cgroup_name << ": " << cgroup_error("cgroup_delete_cgroup_ext", ret).what();
    }
    cgroup_free(&cg);
}

const string &execution_cgroup::name() const {
    return cgroup_name;
}

void execution_cgroup::attach_self() {
    cgroup_error::check("cgroup_attach_task", cgroup_attach_task(cg));
}

size_t execution_cgroup::kill_all() {
    size_t killed = 0;
    // 进程在被杀死的同时可能还在 fork，重复几轮直到 cgroup 为空
    for (int round = 0; round < 10; ++round) {
        void *handle = nullptr;
        pid_t pid;
        size_t found = 0;
        int ret = cgroup_get_task_begin(cgroup_name.c_str(), "pids", &handle, &pid);
        while (ret == 0) {
            if (kill(pid, SIGKILL) == 0) ++found;
            ret = cgroup_get_task_next(&handle, &pid);
        }
        cgroup_get_task_end(&handle);
        if (ret != ECGEOF)
            LOG(WARNING) << "listing tasks of cgroup " << cgroup_name << ": " << cgroup_strerror(ret);

        killed += found;
        if (found == 0) break;
        struct timespec delay = {0, 10000000L};
        nanosleep(&delay, nullptr);
    }
    return killed;
}

/**
 * @brief 读取 memory.oom_control 中的 oom_kill 计数
 * 较老的内核没有这一项，此时返回 false
 */
static bool read_oom_kill(const string &cgroup_name) {
    char *mount = nullptr;
    if (cgroup_get_subsys_mount_point("memory", &mount) != 0 || !mount) return false;
    unique_ptr<char, decltype(&free)> mount_guard(mount, &free);

    ifstream fin(string(mount) + cgroup_name + "/memory.oom_control");
    string key;
    int64_t value;
    while (fin >> key >> value)
        if (key == "oom_kill") return value > 0;
    return false;
}

cgroup_usage execution_cgroup::usage() const {
    // 需要一个新的 cgroup 结构体来从内核读取当前的值
    unique_ptr<struct cgroup, void (*)(struct cgroup *)> current(
        cgroup_new_cgroup(cgroup_name.c_str()),
        [](struct cgroup *p) { cgroup_free(&p); });
    if (!current) throw cgroup_error(fmt::format("cgroup_new_cgroup({})", cgroup_name), ECGOTHER);
    cgroup_error::check("cgroup_get_cgroup", cgroup_get_cgroup(current.get()));

    cgroup_usage result;
    cgroup_controller *memory = cgroup_get_controller(current.get(), "memory");
    cgroup_controller *cpuacct = cgroup_get_controller(current.get(), "cpuacct");
    if (!memory || !cpuacct)
        throw cgroup_error(fmt::format("cgroup_get_controller({})", cgroup_name), ECGOTHER);

    cgroup_error::check("memory.memsw.max_usage_in_bytes",
                        cgroup_get_value_int64(memory, "memory.memsw.max_usage_in_bytes", &result.memory_peak));
    cgroup_error::check("cpuacct.usage",
                        cgroup_get_value_int64(cpuacct, "cpuacct.usage", &result.cpu_nanos));
    result.oom = read_oom_kill(cgroup_name);
    return result;
}
