#include "engine.hpp"
#include <memory>
#include "common/base64.hpp"
#include "gtest/gtest.h"
#include "store/memory_state_store.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace tci;
using namespace nlohmann;

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = make_shared<fake_script>();
        script->run = [](const runtime_request &request, const atomic<bool> &) {
            runtime_output output = succeeded_output(request.code + "\n");
            output.value = 4;
            output.has_value = true;
            return output;
        };
        config.pool.capacity = 2;
        config.pool.backpressure = backpressure_mode::FAIL_FAST;
        e = make_unique<engine>(config, make_unique<memory_state_store>());
        e->runtimes().register_runtime("python3", fake_factory("python3", script));
    }

    string create_session() {
        json reply = e->handle({{"op", "create_session"}, {"language", "python3"}});
        return reply.at("result").at("session_id").get<string>();
    }

    shared_ptr<fake_script> script;
    engine_config config;
    unique_ptr<engine> e;
};

TEST_F(EngineTest, SessionLifecycle) {
    json created = e->handle({{"id", 7}, {"op", "create_session"}, {"language", "python3"}, {"resource_profile", {{"cpu_time", 2}}}});
    EXPECT_EQ(created["id"], 7);
    ASSERT_TRUE(created.count("result")) << created.dump();
    string id = created["result"]["session_id"];

    json info = e->handle({{"op", "session_info"}, {"session_id", id}});
    EXPECT_EQ(info["result"]["state"], "Ready");
    EXPECT_EQ(info["result"]["language"], "python3");
    EXPECT_DOUBLE_EQ(info["result"]["resource_profile"]["cpu_time"].get<double>(), 2);

    json closed = e->handle({{"op", "close_session"}, {"session_id", id}});
    EXPECT_EQ(closed["result"]["closed"], true);
    EXPECT_EQ(e->handle({{"op", "close_session"}, {"session_id", id}})["result"]["closed"], true);
    EXPECT_EQ(e->sessions().size(), 0u);
}

TEST_F(EngineTest, FilesAreBase64Encoded) {
    string id = create_session();
    string content("a,b\n\x01\xfe", 6);

    json uploaded = e->handle({{"op", "upload_file"}, {"session_id", id}, {"path", "data.bin"}, {"content", base64_encode(content)}});
    EXPECT_EQ(uploaded["result"]["size"], 6);

    json downloaded = e->handle({{"op", "download_file"}, {"session_id", id}, {"path", "data.bin"}});
    EXPECT_EQ(base64_decode(downloaded["result"]["content"].get<string>()), content);
    EXPECT_EQ(downloaded["result"]["size"], 6);

    json listed = e->handle({{"op", "list_files"}, {"session_id", id}});
    ASSERT_EQ(listed["result"]["files"].size(), 1u);
    EXPECT_EQ(listed["result"]["files"][0]["path"], "data.bin");
}

TEST_F(EngineTest, RunExecution) {
    string id = create_session();
    json reply = e->handle({{"op", "run_execution"},
                            {"session_id", id},
                            {"code", "2 + 2"},
                            {"tests", {{{"name", "four"}, {"condition", "result == 4"}, {"weight", 2}}}}});
    ASSERT_TRUE(reply.count("result")) << reply.dump();
    json &exec = reply["result"];
    EXPECT_EQ(exec["status"], "Succeeded");
    EXPECT_EQ(exec["session_id"], id);
    EXPECT_EQ(exec["stdout"], "2 + 2\n");
    EXPECT_EQ(exec["returned_value"], 4);
    EXPECT_EQ(exec["test_results"][0]["passed"], true);
    EXPECT_DOUBLE_EQ(exec["reward"].get<double>(), 2);
    EXPECT_FALSE(exec.count("message"));

    json rejected = e->handle({{"op", "run_execution"}, {"session_id", id}, {"code", "import socket"}});
    EXPECT_EQ(rejected["result"]["status"], "SecurityRejected");
    EXPECT_EQ(rejected["result"]["violations"][0]["rule"], "disallowed_import");
}

TEST_F(EngineTest, ErrorsAreReported) {
    EXPECT_EQ(e->handle({{"op", "explode"}})["error"], "invalid_argument");
    EXPECT_EQ(e->handle({{"language", "python3"}})["error"], "invalid_argument");
    EXPECT_EQ(e->handle(json::array())["error"], "invalid_argument");
    EXPECT_EQ(e->handle({{"op", "create_session"}})["error"], "invalid_argument");
    EXPECT_EQ(e->handle({{"op", "create_session"}, {"language", "cobol"}})["error"], "provisioning_error");
    EXPECT_EQ(e->handle({{"op", "session_info"}, {"session_id", "missing"}})["error"], "not_found");

    string id = create_session();
    EXPECT_EQ(e->handle({{"op", "download_file"}, {"session_id", id}, {"path", "nothing"}})["error"], "not_found");
    EXPECT_EQ(e->handle({{"op", "upload_file"}, {"session_id", id}, {"path", "../x"}, {"content", ""}})["error"], "invalid_argument");
    EXPECT_EQ(e->handle({{"op", "run_execution"}, {"session_id", id}})["error"], "invalid_argument");

    e->handle({{"op", "close_session"}, {"session_id", id}});
    json closed = e->handle({{"id", "x"}, {"op", "run_execution"}, {"session_id", id}, {"code", "1"}});
    EXPECT_EQ(closed["error"], "session_closed");
    EXPECT_EQ(closed["id"], "x");
    EXPECT_FALSE(closed["message"].get<string>().empty());
}

TEST_F(EngineTest, PoolExhaustionIsReported) {
    create_session();
    create_session();
    EXPECT_EQ(e->handle({{"op", "create_session"}, {"language", "python3"}})["error"], "pool_exhausted");
}

TEST_F(EngineTest, HandleLine) {
    json reply = json::parse(e->handle_line(R"({"id": 1, "op": "create_session", "language": "python3"})"));
    EXPECT_EQ(reply["id"], 1);
    EXPECT_TRUE(reply["result"].count("session_id"));

    json bad = json::parse(e->handle_line("{not json"));
    EXPECT_EQ(bad["error"], "invalid_argument");
}

TEST_F(EngineTest, BinaryOutputIsReplied) {
    // 第二个汉字被截断
    const string bytes("\xe4\xbd\xa0\xe5\xa5", 5);
    script->run = [&bytes](const runtime_request &, const atomic<bool> &) {
        runtime_output output = succeeded_output(bytes);
        output.stderr_text = "\xff";
        return output;
    };

    string id = create_session();
    json request = {{"id", 9},
                    {"op", "run_execution"},
                    {"session_id", id},
                    {"code", "print()"},
                    {"tests", {{{"condition", "stdout.startswith('你')"}}}}};
    json reply = json::parse(e->handle_line(request.dump()));
    EXPECT_EQ(reply["id"], 9);
    ASSERT_TRUE(reply.count("result")) << reply.dump();
    json &exec = reply["result"];
    EXPECT_EQ(exec["status"], "Succeeded");
    string text = exec["stdout"].get<string>();
    EXPECT_EQ(text.rfind("你", 0), 0u);
    EXPECT_NE(text.find("\xef\xbf\xbd"), string::npos);
    EXPECT_EQ(base64_decode(exec["stdout_base64"].get<string>()), bytes);
    EXPECT_EQ(base64_decode(exec["stderr_base64"].get<string>()), "\xff");
    EXPECT_EQ(exec["test_results"][0]["passed"], true);
}

TEST_F(EngineTest, TextOutputHasNoBase64Copy) {
    string id = create_session();
    json reply = json::parse(e->handle_line(json({{"op", "run_execution"}, {"session_id", id}, {"code", "print('你')"}}).dump()));
    EXPECT_FALSE(reply["result"].count("stdout_base64"));
    EXPECT_FALSE(reply["result"].count("stderr_base64"));
}

TEST(EngineConfigTest, ParsesSections) {
    json j = {{"pool", {{"capacity", 3}, {"backpressure", "fail_fast"}}},
              {"sessions", {{"busy_policy", "reject"}, {"idle_timeout", 5}}},
              {"store", {{"type", "memory"}}},
              {"runtimes", {{{"language", "python3"}}}}};
    engine_config config = j.get<engine_config>();
    EXPECT_EQ(config.pool.capacity, 3u);
    EXPECT_EQ(config.pool.backpressure, backpressure_mode::FAIL_FAST);
    EXPECT_EQ(config.sessions.busy, busy_policy::REJECT);
    EXPECT_DOUBLE_EQ(config.sessions.idle_timeout, 5);
    ASSERT_EQ(config.runtimes.size(), 1u);
    EXPECT_EQ(config.runtimes[0].language, "python3");

    runtime_registry registry;
    register_process_runtimes(registry, config.runtimes);
    EXPECT_TRUE(registry.supports("python3"));
    EXPECT_FALSE(registry.supports("javascript"));
}
