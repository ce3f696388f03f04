#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <cstdint>
#include <iostream>
#include "common/system.hpp"
#include "utils.hpp"
#include "watchdog.hpp"

using namespace std;
namespace po = boost::program_options;

/**
 * @brief 时间限制必须是非负的有限值
 */
static double parse_seconds(const po::variables_map &vm, const char *key) {
    double value = vm[key].as<double>();
    if (!isfinite(value) || value < 0)
        throw po::validation_error(po::validation_error::invalid_option_value, key);
    return value;
}

static int64_t parse_kilobytes(const po::variables_map &vm, const char *key) {
    int64_t value = vm[key].as<int64_t>();
    if (value < 0 || value > INT64_MAX / 1024)
        throw po::validation_error(po::validation_error::invalid_option_value, key);
    return value * 1024;
}

/**
 * @brief 用户名或用户编号
 * @return 编号，不存在时返回 -1
 */
static int resolve_id(const string &name, int (*lookup)(const char *)) {
    if (is_number(name)) return boost::lexical_cast<int>(name);
    return lookup(name.c_str());
}

static void fill_options(const po::variables_map &vm, launch_options &opt) {
    resource_limits &limits = opt.limits;
    if (vm.count("wall-time")) limits.wall_time = parse_seconds(vm, "wall-time");
    if (vm.count("cpu-time")) limits.cpu_time = parse_seconds(vm, "cpu-time");
    if (vm.count("memory-limit")) limits.memory_bytes = parse_kilobytes(vm, "memory-limit");
    if (vm.count("file-limit")) limits.file_bytes = parse_kilobytes(vm, "file-limit");
    if (vm.count("stream-size")) limits.stream_bytes = vm["stream-size"].as<int64_t>();
    if (vm.count("nproc")) limits.max_processes = vm["nproc"].as<size_t>();
    limits.no_core_dumps = vm.count("no-core-dumps") > 0;

    isolation &sandbox = opt.sandbox;
    if (vm.count("root")) sandbox.chroot_dir = vm["root"].as<string>();
    if (vm.count("work-dir")) sandbox.work_dir = vm["work-dir"].as<string>();
    if (vm.count("syscalls")) sandbox.syscalls = split_list(vm["syscalls"].as<string>());
    if (vm.count("variable")) sandbox.env = vm["variable"].as<vector<string>>();
    if (vm.count("egress")) sandbox.egress = split_list(vm["egress"].as<string>());
    sandbox.preserve_env = vm.count("environment") > 0;

    string user;
    if (vm.count("user")) {
        user = vm["user"].as<string>();
        sandbox.user_id = resolve_id(user, get_userid);
        if (sandbox.user_id < 0) throw invalid_argument("invalid username or ID specified: " + user);
    }
    // 只给出用户时，用户组默认为同名的用户组
    if (vm.count("group") || !user.empty()) {
        string group = vm.count("group") ? vm["group"].as<string>() : user;
        sandbox.group_id = resolve_id(group, get_groupid);
        if (sandbox.group_id < 0) throw invalid_argument("invalid groupname or ID specified: " + group);
    }

    if (vm.count("standard-output-file")) opt.stdout_file = vm["standard-output-file"].as<string>();
    if (vm.count("standard-error-file")) opt.stderr_file = vm["standard-error-file"].as<string>();
    if (vm.count("out-meta")) opt.meta_file = vm["out-meta"].as<string>();
    opt.command = vm["cmd"].as<vector<string>>();
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("runguard options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("root,r", po::value<string>(), "run command with root directory set to root, the command and work dir are relative to it")
        ("work-dir,w", po::value<string>(), "run command with the working directory set to this path")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id, defaults to the group named after user")
        ("wall-time,T", po::value<double>(), "kill command after this many wall clock seconds")
        ("cpu-time,t", po::value<double>(), "kill command after it consumed this many CPU seconds")
        ("memory-limit,m", po::value<int64_t>(), "maximum memory of the command and its children in KB, swap included")
        ("file-limit,f", po::value<int64_t>(), "maximum size of a file created by the command in KB")
        ("nproc,p", po::value<size_t>(), "maximum number of processes living simultaneously")
        ("no-core-dumps", "disable core dumps")
        ("standard-output-file,o", po::value<string>(), "redirect command standard output to file")
        ("standard-error-file,e", po::value<string>(), "redirect command standard error to file")
        ("stream-size", po::value<int64_t>(), "keep at most this many bytes of each output stream")
        ("syscalls", po::value<string>(), "comma separated system call allowlist, the command is killed on any other system call")
        ("egress", po::value<string>(), "comma separated host:port list the command may connect to, otherwise the command has no network interface")
        ("environment,E", "preserve environment variables, otherwise only PATH is kept")
        ("variable,V", po::value<vector<string>>(), "add an environment variable (e.g. -V KEY=VALUE)")
        ("out-meta,M", po::value<string>(), "write usage and exit information of the command to file")
        ("cmd", po::value<vector<string>>()->composing()->required(), "command and arguments")
        ("help", "display this help text");
    // clang-format on

    pos.add("cmd", -1);

    launch_options opt;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
        if (vm.count("help")) {
            cout << "runguard: run an untrusted command inside an isolated, resource limited sandbox" << endl
                 << "Requires root privilege to create cgroups and namespaces." << endl
                 << "Usage: " << argv[0] << " [options] -- command [args...]" << endl
                 << desc << endl;
            return 0;
        }
        po::notify(vm);
        fill_options(vm, opt);
    } catch (exception &e) {
        cerr << e.what() << endl
             << endl
             << desc << endl;
        return 1;
    }

    return run_guarded(opt);
}
