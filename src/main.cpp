#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "monitor/log_monitor.hpp"
#include "worker.hpp"
using namespace std;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping workers";
    tci::stop_workers();
    // 让读取线程的 getline 立即返回
    close(STDIN_FILENO);
}

/**
 * @brief 配置文件没有给出语言运行时时，注册 exec/run 下所有的语言
 */
static vector<tci::process_runtime_config> default_runtimes(tci::launch_mode mode) {
    vector<tci::process_runtime_config> runtimes;
    filesystem::path run_dir = tci::EXEC_DIR / "run";
    if (!filesystem::is_directory(run_dir)) return runtimes;
    for (auto &p : filesystem::directory_iterator(run_dir)) {
        if (!filesystem::is_regular_file(p.path() / "run")) continue;
        tci::process_runtime_config runtime;
        runtime.language = p.path().filename().string();
        runtime.mode = mode;
        // V8 启动时预留大量虚拟内存
        runtime.limit_address_space = runtime.language != "javascript";
        runtimes.push_back(runtime);
    }
    return runtimes;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    signal(SIGINT, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("tci-engine options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the engine configuration file in JSON. You can either pass it from environ TCICONFIG")
        ("workers", po::value<size_t>(), "set the number of request workers, default to the number of CPU cores. You can either pass it from environ WORKERS")
        ("exec-dir", po::value<string>(), "set the directory with language runtime images. You can either pass it from environ EXECDIR")
        ("sandbox-dir", po::value<string>(), "set the directory to create sandbox instances in. You can either pass it from environ SANDBOXDIR")
        ("runguard", po::value<string>(), "set the location of the runguard executable. You can either pass it from environ RUNGUARD")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("direct", "launch user code without runguard, for development environments without root privilege")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode, and not to delete destroyed sandbox directories to check the files produced by user code.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "tci-engine: Run untrusted code in sandboxed sessions" << endl
             << "Requests are read from stdin as JSON lines, replies are written to stdout" << endl
             << "This app requires root privilege unless --direct is given" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "tci-engine 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        tci::DEBUG = true;
    }

    tci::launch_mode mode = vm.count("direct") ? tci::launch_mode::DIRECT : tci::launch_mode::RUNGUARD;

    if (mode == tci::launch_mode::RUNGUARD && getuid() != 0) {
        cerr << "You should run this program in privileged mode" << endl;
        if (!tci::DEBUG) return EXIT_FAILURE;
    }

    if (vm.count("exec-dir")) {
        tci::EXEC_DIR = filesystem::path(vm.at("exec-dir").as<string>());
    } else if (getenv("EXECDIR")) {
        tci::EXEC_DIR = filesystem::path(getenv("EXECDIR"));
    } else {
        filesystem::path execdir(repo_dir / "exec");
        if (filesystem::exists(execdir)) {
            tci::EXEC_DIR = execdir;
        }
    }
    CHECK(filesystem::is_directory(tci::EXEC_DIR))
        << "Executables directory " << tci::EXEC_DIR << " does not exist";

    for (auto& p : filesystem::recursive_directory_iterator(tci::EXEC_DIR))
        if (filesystem::is_regular_file(p) && p.path().filename() == "run")
            filesystem::permissions(p,
                                    filesystem::perms::group_exec | filesystem::perms::others_exec | filesystem::perms::owner_exec,
                                    filesystem::perm_options::add);

    if (vm.count("sandbox-dir")) {
        tci::SANDBOX_DIR = filesystem::path(vm.at("sandbox-dir").as<string>());
    } else if (getenv("SANDBOXDIR")) {
        tci::SANDBOX_DIR = filesystem::path(getenv("SANDBOXDIR"));
    }
    filesystem::create_directories(tci::SANDBOX_DIR);
    CHECK(filesystem::is_directory(tci::SANDBOX_DIR))
        << "Sandbox directory " << tci::SANDBOX_DIR << " does not exist";

    // 默认情况下，假设运行环境是拉取代码直接编译的环境，此时我们可以假定 runguard 的运行路径
    if (vm.count("runguard")) {
        tci::RUNGUARD = filesystem::path(vm.at("runguard").as<string>());
    } else if (getenv("RUNGUARD")) {
        tci::RUNGUARD = filesystem::path(getenv("RUNGUARD"));
    } else {
        filesystem::path runguard(repo_dir / "runguard" / "bin" / "runguard");
        if (filesystem::exists(runguard)) {
            tci::RUNGUARD = filesystem::weakly_canonical(runguard);
        }
    }
    if (mode == tci::launch_mode::RUNGUARD) {
        CHECK(filesystem::is_regular_file(tci::RUNGUARD))
            << "runguard executable " << tci::RUNGUARD << " does not exist. Specify it by --runguard or RUNGUARD environment variable.";
    }

    if (vm.count("run-user")) {
        tci::RUN_USER = vm["run-user"].as<string>();
    } else if (getenv("RUNUSER")) {
        tci::RUN_USER = getenv("RUNUSER");
    }

    if (vm.count("run-group")) {
        tci::RUN_GROUP = vm["run-group"].as<string>();
    } else if (getenv("RUNGROUP")) {
        tci::RUN_GROUP = getenv("RUNGROUP");
    }

    // 让执行引擎写入的数据只允许当前用户写入
    umask(0022);

    size_t workers = max<size_t>(thread::hardware_concurrency(), 1);
    if (vm.count("workers")) {
        workers = vm["workers"].as<size_t>();
    } else if (getenv("WORKERS")) {
        workers = boost::lexical_cast<size_t>(getenv("WORKERS"));
    }

    tci::engine_config config;
    string config_path;
    if (vm.count("config")) {
        config_path = vm["config"].as<string>();
    } else if (getenv("TCICONFIG")) {
        config_path = getenv("TCICONFIG");
    }
    if (!config_path.empty()) {
        CHECK(filesystem::is_regular_file(config_path))
            << "Configuration file " << config_path << " does not exist";
        try {
            nlohmann::json j = nlohmann::json::parse(tci::read_file_content(config_path));
            j.get_to(config);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << config_path << " is malformed: " << e.what();
        }
    }
    if (config.runtimes.empty()) {
        config.runtimes = default_runtimes(mode);
    } else if (mode == tci::launch_mode::DIRECT) {
        for (auto& runtime : config.runtimes) runtime.mode = mode;
    }
    CHECK(!config.runtimes.empty()) << "No language runtime is available in " << tci::EXEC_DIR;

    tci::register_monitor(make_unique<tci::log_monitor>());

    try {
        tci::engine engine(config);
        engine.start();
        LOG(INFO) << "tci-engine started with " << workers << " workers";

        tci::serve(engine, cin, cout, workers);

        LOG(INFO) << "Shutting down, closing all sessions";
        engine.shutdown();
    } catch (std::exception& e) {
        LOG(ERROR) << "tci-engine crashed: " << e.what() << endl
                   << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    return 0;
}
