#include "worker.hpp"
#include <map>
#include <sstream>
#include "gtest/gtest.h"
#include "store/memory_state_store.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace tci;
using namespace nlohmann;

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = make_shared<fake_script>();
        e = make_unique<engine>(config, make_unique<memory_state_store>());
        e->runtimes().register_runtime("python3", fake_factory("python3", script));
    }

    map<int, json> serve_lines(const string &input, size_t workers) {
        istringstream in(input);
        ostringstream out;
        serve(*e, in, out, workers);

        map<int, json> replies;
        istringstream lines(out.str());
        string line;
        while (getline(lines, line)) {
            json reply = json::parse(line);
            replies[reply.value("id", -1)] = reply;
        }
        return replies;
    }

    shared_ptr<fake_script> script;
    engine_config config;
    unique_ptr<engine> e;
};

TEST_F(WorkerTest, RepliesToEveryLine) {
    string input =
        R"({"id": 1, "op": "create_session", "language": "python3"})" "\n"
        "\n"
        R"({"id": 2, "op": "create_session", "language": "python3"})" "\n"
        R"({"id": 3, "op": "no_such_op"})" "\n"
        "   garbage   \n";
    auto replies = serve_lines(input, 2);

    ASSERT_EQ(replies.size(), 4u);
    EXPECT_TRUE(replies[1]["result"].count("session_id"));
    EXPECT_TRUE(replies[2]["result"].count("session_id"));
    EXPECT_NE(replies[1]["result"]["session_id"], replies[2]["result"]["session_id"]);
    EXPECT_EQ(replies[3]["error"], "invalid_argument");
    EXPECT_EQ(replies[-1]["error"], "invalid_argument");
    EXPECT_TRUE(workers_stopped());
    EXPECT_EQ(e->sessions().size(), 2u);
}

TEST_F(WorkerTest, SingleWorkerKeepsOrder) {
    string input =
        R"({"id": 1, "op": "create_session", "language": "python3"})" "\n";
    auto created = serve_lines(input, 1);
    string id = created[1]["result"]["session_id"];

    istringstream in(
        R"({"id": 2, "op": "upload_file", "session_id": ")" + id + R"(", "path": "a.txt", "content": "aGk="})" "\n" +
        R"({"id": 3, "op": "download_file", "session_id": ")" + id + R"(", "path": "a.txt"})" "\n" +
        R"({"id": 4, "op": "close_session", "session_id": ")" + id + R"("})" "\n");
    ostringstream out;
    serve(*e, in, out, 1);

    istringstream lines(out.str());
    vector<json> replies;
    string line;
    while (getline(lines, line)) replies.push_back(json::parse(line));

    ASSERT_EQ(replies.size(), 3u);
    EXPECT_EQ(replies[0]["id"], 2);
    EXPECT_EQ(replies[0]["result"]["size"], 2);
    EXPECT_EQ(replies[1]["result"]["content"], "aGk=");
    EXPECT_EQ(replies[2]["result"]["closed"], true);
}
