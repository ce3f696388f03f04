#include "worker.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <atomic>
#include <vector>
#include "common/defer.hpp"
#include "common/json_utils.hpp"
#include "monitor/monitor.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

bool workers_stopped() {
    return stop;
}

static void reader_loop(istream &in, concurrent_queue<string> &request_queue) {
    string line;
    while (!stop && getline(in, line)) {
        boost::algorithm::trim(line);
        if (line.empty()) continue;
        request_queue.push(line);
    }
    LOG(INFO) << "Request stream closed, stopping workers";
    stop_workers();
}

thread start_reader(istream &in, concurrent_queue<string> &request_queue) {
    return thread([&in, &request_queue] {
        reader_loop(in, request_queue);
    });
}

/**
 * @brief 处理请求时发生意外错误的回复，尽量带上请求的 id
 */
static string failure_reply(const string &line, const string &message) {
    json reply = {{"error", "internal_error"}, {"message", message}};
    json request = json::parse(line, nullptr, false);
    if (request.is_object() && request.count("id")) reply["id"] = request["id"];
    return dump_text(reply);
}

/**
 * @brief worker 线程函数
 * 请求队列为空时等待一小段时间，避免忙等。
 * 如果需要停止 worker，在请求队列为空时自然退出。读取线程在设置停止标记之前
 * 已经把所有请求放入队列，因此不会丢失请求。
 */
static void worker_loop(size_t worker_id, engine &e, concurrent_queue<string> &request_queue, ostream &out, mutex &out_mut) {
    LOG(INFO) << "Worker " << worker_id << " started";
    defer {
        LOG(INFO) << "Worker " << worker_id << " stopped";
    };

    while (true) {
        string line;
        if (!request_queue.pop_for(line, chrono::milliseconds(100))) {
            // 停止标记在最后一条请求入队之后才设置，因此这里需要再检查一次队列
            if (!stop) continue;
            if (!request_queue.try_pop(line)) break;
        }

        string reply;
        try {
            reply = e.handle_line(line);
        } catch (std::exception &ex) {
            // 每个请求都必须有回复，否则调用方会一直等待
            LOG(ERROR) << "Worker " << worker_id << " failed to handle request: " << ex.what();
            report_error(ex.what());
            reply = failure_reply(line, ex.what());
        }

        scoped_lock guard(out_mut);
        out << reply << endl;
    }
}

thread start_worker(size_t worker_id, engine &e, concurrent_queue<string> &request_queue, ostream &out, mutex &out_mut) {
    return thread([worker_id, &e, &request_queue, &out, &out_mut] {
        worker_loop(worker_id, e, request_queue, out, out_mut);
    });
}

void serve(engine &e, istream &in, ostream &out, size_t workers) {
    stop = false;
    concurrent_queue<string> request_queue;
    mutex out_mut;

    vector<thread> threads;
    threads.push_back(start_reader(in, request_queue));
    for (size_t i = 0; i < max<size_t>(workers, 1); ++i)
        threads.push_back(start_worker(i, e, request_queue, out, out_mut));

    for (auto &th : threads) th.join();
}

}  // namespace tci
