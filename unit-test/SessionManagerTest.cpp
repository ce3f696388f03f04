#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <sstream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "session/session_manager.hpp"
#include "store/memory_state_store.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace tci;
using namespace nlohmann;
namespace fs = std::filesystem;

/**
 * @brief 记录写入过元数据的会话编号
 */
struct recording_store : public memory_state_store {
    void put(const string &session_id, const json &metadata) override {
        {
            scoped_lock guard(ids_mut);
            if (std::find(ids.begin(), ids.end(), session_id) == ids.end()) ids.push_back(session_id);
        }
        memory_state_store::put(session_id, metadata);
    }

    vector<string> written() {
        scoped_lock guard(ids_mut);
        return ids;
    }

private:
    mutex ids_mut;
    vector<string> ids;
};

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = make_shared<fake_script>();
        registry.register_runtime("python3", fake_factory("python3", script));
        pool_settings.capacity = 2;
        pool_settings.backpressure = backpressure_mode::FAIL_FAST;
        governor_settings.grace_period = 0.2;
    }

    void TearDown() override {
        if (manager) manager->close_all();
    }

    void start() {
        governor = make_unique<resource_governor>(governor_settings);
        gate = make_unique<security_gate>(security_config());
        reward = make_unique<reward_evaluator>(reward_config());
        pool = make_unique<sandbox_pool>(pool_settings, registry);
        dispatcher = make_unique<execution_dispatcher>(*governor, store, *reward);
        manager = make_unique<session_manager>(session_settings, *pool, *gate, *governor, store, *dispatcher);
    }

    static execution_request make_request(const string &code, const vector<test_case> &tests = {}) {
        execution_request request;
        request.code = code;
        request.tests = tests;
        return request;
    }

    static test_case make_test(const string &name, const string &condition, double weight) {
        test_case test;
        test.name = name;
        test.condition = condition;
        test.weight = weight;
        return test;
    }

    string sandbox_of(const string &session_id) {
        return manager->session_info(session_id)["sandbox_id"].get<string>();
    }

    /**
     * @brief 等待 fake runtime 开始执行第 count 次
     */
    void wait_executed(int count) {
        for (int i = 0; i < 1000 && script->executed < count; ++i)
            this_thread::sleep_for(chrono::milliseconds(5));
        ASSERT_GE(script->executed.load(), count);
    }

    shared_ptr<fake_script> script;
    runtime_registry registry;
    recording_store store;
    pool_config pool_settings;
    governor_config governor_settings;
    session_config session_settings;

    unique_ptr<resource_governor> governor;
    unique_ptr<security_gate> gate;
    unique_ptr<reward_evaluator> reward;
    unique_ptr<sandbox_pool> pool;
    unique_ptr<execution_dispatcher> dispatcher;
    unique_ptr<session_manager> manager;
};

TEST_F(SessionManagerTest, ComputesOverUploadedFile) {
    script->run = [](const runtime_request &request, const atomic<bool> &) {
        istringstream in(read_file_content(request.root / "work" / "data.csv"));
        string line;
        getline(in, line);
        int64_t total = 0;
        while (getline(in, line))
            total += stoll(line.substr(0, line.find(',')));

        runtime_output output = succeeded_output(to_string(total) + "\n");
        output.value = total;
        output.has_value = true;
        return output;
    };
    start();

    string id = manager->create_session("python3", json::object());
    manager->upload_file(id, "data.csv", "col1,col2\n1,2\n3,4");
    auto exec = manager->run_execution(id, make_request("import csv\nsum(int(r['col1']) for r in csv.DictReader(open('data.csv')))"));

    EXPECT_EQ(exec->status, execution_status::SUCCEEDED);
    EXPECT_NE(exec->stdout_text.find("4"), string::npos);
    EXPECT_TRUE(exec->has_value);
    EXPECT_EQ(exec->value, json(4));
    EXPECT_EQ(exec->session_id, id);
    EXPECT_GE(exec->finished_at, exec->started_at);
    EXPECT_EQ(manager->session_info(id)["state"], "Ready");
}

TEST_F(SessionManagerTest, DeadlineTerminatesExecution) {
    script->run = [](const runtime_request &, const atomic<bool> &terminated) {
        return run_until_terminated(terminated);
    };
    start();

    string id = manager->create_session("python3", json::object());
    string sandbox_id = sandbox_of(id);
    execution_request request = make_request("while True: pass");
    request.deadline = 0.2;

    elapsed_time timer;
    auto exec = manager->run_execution(id, request);
    EXPECT_EQ(exec->status, execution_status::TIMED_OUT);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
    EXPECT_EQ(script->terminated.load(), 1);

    // 单纯超时的沙箱会被复用
    EXPECT_EQ(sandbox_of(id), sandbox_id);
    EXPECT_FALSE(pool->is_dead(sandbox_id));
    EXPECT_EQ(manager->session_info(id)["state"], "Ready");
}

TEST_F(SessionManagerTest, TimeoutWithResourceBreachReplacesSandbox) {
    script->run = [](const runtime_request &, const atomic<bool> &terminated) {
        runtime_output output = run_until_terminated(terminated);
        output.usage.oom = true;
        return output;
    };
    start();

    string id = manager->create_session("python3", json::object());
    string sandbox_id = sandbox_of(id);
    execution_request request = make_request("x = [0] * 10**12");
    request.deadline = 0.2;

    auto exec = manager->run_execution(id, request);
    EXPECT_EQ(exec->status, execution_status::TIMED_OUT);
    EXPECT_TRUE(pool->is_dead(sandbox_id));
    EXPECT_NE(sandbox_of(id), sandbox_id);
    EXPECT_EQ(manager->session_info(id)["state"], "Ready");
}

TEST_F(SessionManagerTest, TestsAreScored) {
    script->run = [](const runtime_request &, const atomic<bool> &) {
        runtime_output output = succeeded_output("");
        output.value = 4;
        output.has_value = true;
        return output;
    };
    start();

    string id = manager->create_session("python3", json::object());
    auto exec = manager->run_execution(id, make_request("result = 2 + 2", {make_test("four", "result == 4", 1.0),
                                                                           make_test("five", "result == 5", 1.0)}));
    ASSERT_EQ(exec->test_results.size(), 2u);
    EXPECT_TRUE(exec->test_results[0].passed);
    EXPECT_DOUBLE_EQ(exec->test_results[0].reward, 1.0);
    EXPECT_FALSE(exec->test_results[1].passed);
    EXPECT_DOUBLE_EQ(exec->test_results[1].reward, 0.0);
    EXPECT_DOUBLE_EQ(exec->reward, 1.0);
}

TEST_F(SessionManagerTest, StaticScanRejectsWithoutSandbox) {
    start();
    string id = manager->create_session("python3", json::object());
    auto exec = manager->run_execution(id, make_request("import subprocess\nsubprocess.run(['ls'])", {make_test("t", "True", 1.0)}));

    EXPECT_EQ(exec->status, execution_status::SECURITY_REJECTED);
    ASSERT_FALSE(exec->violations.empty());
    EXPECT_EQ(exec->violations[0].rule, "disallowed_import");
    EXPECT_EQ(script->executed.load(), 0);
    EXPECT_EQ(governor->active(), 0u);
    ASSERT_EQ(exec->test_results.size(), 1u);
    EXPECT_FALSE(exec->test_results[0].passed);
    EXPECT_DOUBLE_EQ(exec->reward, 0);
}

TEST_F(SessionManagerTest, PoolExhaustedFailFast) {
    pool_settings.capacity = 1;
    start();
    manager->create_session("python3", json::object());
    EXPECT_THROW(manager->create_session("python3", json::object()), pool_exhausted);
    EXPECT_EQ(manager->size(), 1u);
    EXPECT_EQ(pool->live(), 1u);
}

TEST_F(SessionManagerTest, PoolBlocksUntilRelease) {
    pool_settings.capacity = 1;
    pool_settings.backpressure = backpressure_mode::BLOCK;
    pool_settings.acquire_timeout = 5;
    start();
    string first = manager->create_session("python3", json::object());

    thread closer([&] {
        this_thread::sleep_for(chrono::milliseconds(100));
        manager->close_session(first);
    });
    string second = manager->create_session("python3", json::object());
    closer.join();

    EXPECT_NE(first, second);
    EXPECT_EQ(manager->size(), 1u);
    EXPECT_LE(pool->live(), 1u);
}

TEST_F(SessionManagerTest, RuntimeViolationQuarantinesSandbox) {
    script->run = [](const runtime_request &request, const atomic<bool> &) {
        write_file_content(request.root / "work" / "evil.txt", "payload");
        runtime_output output;
        output.exitcode = 159;
        output.signal = 31;
        output.violations.push_back({"syscall", "process killed by a disallowed system call", 0});
        return output;
    };
    start();

    string id = manager->create_session("python3", json::object());
    string sandbox_id = sandbox_of(id);
    auto exec = manager->run_execution(id, make_request("print('hi')"));

    EXPECT_EQ(exec->status, execution_status::SECURITY_REJECTED);
    EXPECT_TRUE(pool->is_dead(sandbox_id));
    EXPECT_NE(sandbox_of(id), sandbox_id);
    EXPECT_EQ(manager->session_info(id)["state"], "Ready");
    EXPECT_FALSE(store.get_file(id, "evil.txt").has_value());
}

TEST_F(SessionManagerTest, ResourceBreachReplacesSandbox) {
    script->run = [](const runtime_request &request, const atomic<bool> &) {
        runtime_output output;
        output.exitcode = 137;
        output.signal = 9;
        output.usage.oom = true;
        output.usage.memory_bytes = request.limits.memory_limit * 1024 + 1;
        return output;
    };
    start();

    string id = manager->create_session("python3", json{{"memory_limit", 65536}});
    string sandbox_id = sandbox_of(id);
    auto exec = manager->run_execution(id, make_request("x = ' ' * 10**10"));

    EXPECT_EQ(exec->status, execution_status::RESOURCE_EXCEEDED);
    EXPECT_EQ(exec->limits.memory_limit, 65536);
    EXPECT_TRUE(pool->is_dead(sandbox_id));
    EXPECT_NE(sandbox_of(id), sandbox_id);
}

TEST_F(SessionManagerTest, UserErrorKeepsSandbox) {
    script->run = [](const runtime_request &, const atomic<bool> &) {
        runtime_output output;
        output.exitcode = 1;
        output.stderr_text = "ZeroDivisionError: division by zero\n";
        return output;
    };
    start();

    string id = manager->create_session("python3", json::object());
    string sandbox_id = sandbox_of(id);
    auto exec = manager->run_execution(id, make_request("1 / 0"));
    EXPECT_EQ(exec->status, execution_status::FAILED);
    EXPECT_EQ(exec->exitcode, 1);
    EXPECT_NE(exec->stderr_text.find("ZeroDivisionError"), string::npos);
    EXPECT_EQ(sandbox_of(id), sandbox_id);
}

TEST_F(SessionManagerTest, WorkingDirectoryChangesAreWrittenBack) {
    script->run = [](const runtime_request &request, const atomic<bool> &) {
        write_file_content(request.root / "work" / "result.txt", "done");
        fs::remove(request.root / "work" / "data.csv");
        return succeeded_output("");
    };
    start();

    string id = manager->create_session("python3", json::object());
    manager->upload_file(id, "data.csv", "1,2");
    manager->upload_file(id, "notes/keep.txt", "unchanged");
    auto exec = manager->run_execution(id, make_request("pass"));

    EXPECT_EQ(exec->changed_files, vector<string>{"result.txt"});
    EXPECT_EQ(exec->deleted_files, vector<string>{"data.csv"});
    EXPECT_EQ(manager->download_file(id, "result.txt"), "done");
    EXPECT_EQ(manager->download_file(id, "notes/keep.txt"), "unchanged");
    EXPECT_THROW(manager->download_file(id, "data.csv"), not_found_error);
}

TEST_F(SessionManagerTest, OnlySelectedFilesAreMaterialized) {
    script->run = [](const runtime_request &request, const atomic<bool> &) {
        vector<string> names;
        for (auto &entry : fs::directory_iterator(request.root / "work"))
            names.push_back(entry.path().filename().string());
        sort(names.begin(), names.end());
        string listing;
        for (auto &name : names) listing += name + "\n";
        return succeeded_output(listing);
    };
    start();

    string id = manager->create_session("python3", json::object());
    manager->upload_file(id, "a.txt", "a");
    manager->upload_file(id, "b.txt", "b");

    execution_request request = make_request("import glob");
    request.files = {"a.txt"};
    EXPECT_EQ(manager->run_execution(id, request)->stdout_text, "a.txt\n");
    EXPECT_EQ(manager->run_execution(id, make_request("import glob"))->stdout_text, "a.txt\nb.txt\n");

    request.files = {"missing.txt"};
    EXPECT_THROW(manager->run_execution(id, request), not_found_error);
    EXPECT_EQ(manager->session_info(id)["state"], "Ready");
}

TEST_F(SessionManagerTest, FileOperations) {
    start();
    string id = manager->create_session("python3", json::object());
    manager->upload_file(id, "dir/data.bin", string("\0\xff", 2));
    EXPECT_EQ(manager->download_file(id, "./dir/data.bin"), string("\0\xff", 2));
    EXPECT_EQ(manager->list_files(id)[0].size, 2);
    manager->upload_file(id, "./dir/data.bin", "overwritten");
    EXPECT_EQ(manager->download_file(id, "dir/data.bin"), "overwritten");

    auto files = manager->list_files(id);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].path, "dir/data.bin");
    EXPECT_EQ(files[0].size, 11);

    EXPECT_THROW(manager->upload_file(id, "../escape.txt", "x"), invalid_argument_error);
    EXPECT_THROW(manager->upload_file(id, "/etc/passwd", "x"), invalid_argument_error);
    EXPECT_THROW(manager->download_file(id, "absent.txt"), not_found_error);
    EXPECT_THROW(manager->upload_file("no-such-session", "a.txt", "x"), not_found_error);
    EXPECT_THROW(manager->run_execution("no-such-session", make_request("1")), not_found_error);
}

TEST_F(SessionManagerTest, CloseIsIdempotent) {
    start();
    string id = manager->create_session("python3", json::object());
    manager->upload_file(id, "data.csv", "1");

    manager->close_session(id);
    manager->close_session(id);

    EXPECT_EQ(manager->size(), 0u);
    EXPECT_EQ(pool->leased(), 0u);
    EXPECT_EQ(pool->idle("python3"), 1u);
    EXPECT_TRUE(store.list_files(id).empty());
    ASSERT_TRUE(store.get(id).has_value());
    EXPECT_EQ((*store.get(id))["state"], "Closed");

    EXPECT_THROW(manager->run_execution(id, make_request("1")), session_closed);
    EXPECT_THROW(manager->upload_file(id, "a.txt", "x"), session_closed);
    EXPECT_THROW(manager->close_session("no-such-session"), not_found_error);
}

TEST_F(SessionManagerTest, BusySessionRejects) {
    session_settings.busy = busy_policy::REJECT;
    atomic<bool> proceed{false};
    script->run = [&](const runtime_request &, const atomic<bool> &terminated) {
        while (!proceed && !terminated)
            this_thread::sleep_for(chrono::milliseconds(5));
        return succeeded_output("");
    };
    start();

    string id = manager->create_session("python3", json::object());
    auto running = async(launch::async, [&] { return manager->run_execution(id, make_request("slow()")); });
    wait_executed(1);

    EXPECT_THROW(manager->run_execution(id, make_request("fast()")), session_busy);
    proceed = true;
    EXPECT_EQ(running.get()->status, execution_status::SUCCEEDED);
    EXPECT_EQ(manager->run_execution(id, make_request("fast()"))->status, execution_status::SUCCEEDED);
}

TEST_F(SessionManagerTest, QueuedExecutionsRunOneAtATime) {
    atomic<int> inside{0}, max_inside{0};
    script->run = [&](const runtime_request &, const atomic<bool> &) {
        int now = ++inside;
        int seen = max_inside;
        while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {}
        this_thread::sleep_for(chrono::milliseconds(50));
        --inside;
        return succeeded_output("");
    };
    start();

    string id = manager->create_session("python3", json::object());
    vector<future<shared_ptr<const execution>>> results;
    for (int i = 0; i < 4; ++i)
        results.push_back(async(launch::async, [&] { return manager->run_execution(id, make_request("step()")); }));
    for (auto &result : results)
        EXPECT_EQ(result.get()->status, execution_status::SUCCEEDED);

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(script->executed.load(), 4);
}

TEST_F(SessionManagerTest, CloseCancelsQueuedExecutions) {
    atomic<bool> proceed{false};
    script->run = [&](const runtime_request &, const atomic<bool> &terminated) {
        while (!proceed && !terminated)
            this_thread::sleep_for(chrono::milliseconds(5));
        return succeeded_output("");
    };
    start();

    string id = manager->create_session("python3", json::object());
    auto running = async(launch::async, [&] { return manager->run_execution(id, make_request("first()")); });
    wait_executed(1);
    auto queued = async(launch::async, [&] { return manager->run_execution(id, make_request("second()")); });
    this_thread::sleep_for(chrono::milliseconds(100));

    auto closing = async(launch::async, [&] { manager->close_session(id); });
    this_thread::sleep_for(chrono::milliseconds(100));
    proceed = true;

    EXPECT_THROW(queued.get(), session_closed);
    EXPECT_EQ(running.get()->status, execution_status::SUCCEEDED);
    closing.get();
    EXPECT_EQ(script->executed.load(), 1);
    EXPECT_EQ(manager->size(), 0u);
}

TEST_F(SessionManagerTest, ProvisioningFailure) {
    script->fail_prepare = true;
    start();
    EXPECT_THROW(manager->create_session("python3", json::object()), provisioning_error);
    EXPECT_THROW(manager->create_session("cobol", json::object()), provisioning_error);
    EXPECT_EQ(manager->size(), 0u);
    EXPECT_EQ(pool->live(), 0u);

    // 失败的会话以 Failed 状态保存，之后的请求得到 session_closed
    auto ids = store.written();
    ASSERT_EQ(ids.size(), 2u);
    for (auto &id : ids) {
        auto metadata = store.get(id);
        ASSERT_TRUE(metadata.has_value());
        EXPECT_EQ((*metadata)["state"], "Failed");
        EXPECT_EQ((*metadata)["sandbox_id"], "");
        EXPECT_THROW(manager->session_info(id), session_closed);
        EXPECT_THROW(manager->run_execution(id, make_request("1")), session_closed);
        EXPECT_NO_THROW(manager->close_session(id));
    }
    EXPECT_THROW(manager->close_session("no-such-session"), not_found_error);
}

TEST_F(SessionManagerTest, ClosedSessionsAreAnsweredFromStore) {
    start();
    string id = manager->create_session("python3", json::object());
    manager->close_session(id);
    EXPECT_EQ((*store.get(id))["state"], "Closed");

    // 另一个管理器共享同一个状态存储，也能认出已关闭的会话
    session_manager other(session_settings, *pool, *gate, *governor, store, *dispatcher);
    EXPECT_NO_THROW(other.close_session(id));
    EXPECT_THROW(other.session_info(id), session_closed);
    EXPECT_THROW(other.download_file(id, "a.txt"), session_closed);
    EXPECT_EQ(other.size(), 0u);
}

TEST_F(SessionManagerTest, NetworkRequestIsValidated) {
    start();
    network_request network;
    network.enabled = true;
    EXPECT_THROW(manager->create_session("python3", json::object(), network), invalid_argument_error);
    EXPECT_EQ(pool->live(), 0u);

    network.allowlist = {"pypi.org:443"};
    string id = manager->create_session("python3", json::object(), network);
    json info = manager->session_info(id);
    EXPECT_EQ(info["network"]["enabled"], true);
    EXPECT_EQ(info["network"]["allowlist"][0], "pypi.org:443");
    manager->close_session(id);

    // 不能过滤出站连接的运行时不提供网络
    script->filters_egress = false;
    EXPECT_THROW(manager->create_session("python3", json::object(), network), provisioning_error);
    EXPECT_EQ(manager->size(), 0u);
    EXPECT_EQ(pool->leased(), 0u);
    string offline = manager->create_session("python3", json::object());
    EXPECT_EQ(manager->session_info(offline)["network"]["enabled"], false);
}

TEST_F(SessionManagerTest, MetadataIsReadableDuringRebind) {
    script->run = [](const runtime_request &, const atomic<bool> &) {
        runtime_output output = succeeded_output("");
        output.usage.oom = true;
        return output;
    };
    pool_settings.capacity = 1;
    start();
    string id = manager->create_session("python3", json::object());

    atomic<bool> done{false};
    auto reader = async(launch::async, [&] {
        size_t reads = 0;
        while (!done) {
            json info = manager->session_info(id);
            EXPECT_TRUE(info["sandbox_id"].is_string());
            ++reads;
        }
        return reads;
    });
    string previous = sandbox_of(id);
    for (int i = 0; i < 5; ++i) {
        manager->run_execution(id, make_request("x = [0] * 10**12"));
        string current = sandbox_of(id);
        EXPECT_FALSE(current.empty());
        EXPECT_NE(current, previous);
        previous = current;
    }
    done = true;
    EXPECT_GT(reader.get(), 0u);
    EXPECT_EQ(manager->session_info(id)["state"], "Ready");
}

TEST_F(SessionManagerTest, ResourceProfileIsClamped) {
    start();
    string id = manager->create_session("python3", json{{"cpu_time", 100000}, {"wall_time", 5}});
    json profile = manager->session_info(id)["resource_profile"];
    EXPECT_DOUBLE_EQ(profile["cpu_time"].get<double>(), 60);
    EXPECT_DOUBLE_EQ(profile["wall_time"].get<double>(), 5);
}

TEST_F(SessionManagerTest, ExecutionHistoryIsBounded) {
    session_settings.execution_retention = 2;
    start();
    string id = manager->create_session("python3", json::object());
    for (int i = 0; i < 3; ++i)
        manager->run_execution(id, make_request("1"));
    EXPECT_EQ(manager->session_info(id)["executions"].size(), 2u);
    EXPECT_EQ((*store.get(id))["executions"].size(), 2u);
}

TEST_F(SessionManagerTest, IdleSessionsAreEvicted) {
    session_settings.idle_timeout = 0.05;
    start();
    string idle = manager->create_session("python3", json::object());
    this_thread::sleep_for(chrono::milliseconds(120));
    string fresh = manager->create_session("python3", json::object());

    EXPECT_EQ(manager->evict_idle(), 1u);
    EXPECT_EQ(manager->size(), 1u);
    EXPECT_THROW(manager->session_info(idle), session_closed);
    EXPECT_NO_THROW(manager->session_info(fresh));
}
