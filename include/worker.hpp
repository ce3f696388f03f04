#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "engine.hpp"

/**
 * 请求处理相关函数
 * 接入层通过 stdin 逐行发送 JSON 请求，读取线程把请求放进请求队列，
 * 多个 worker 线程从队列中取出请求交给执行引擎处理，并把结果逐行写入 stdout。
 *
 * 同一会话的执行请求在会话管理器中排队，因此 worker 的数量决定了
 * 可以同时执行代码的会话数量上限（同时还受沙箱池容量限制）。
 * 回复的顺序与请求的顺序无关，接入层通过请求的 id 字段对应回复。
 */
namespace tci {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 会先处理完队列中已有的请求再退出。
 */
void stop_workers();

/**
 * @brief worker 是否被要求停止
 */
bool workers_stopped();

/**
 * @brief 启动读取线程，逐行读取请求并放入请求队列
 * 输入结束时调用 stop_workers
 */
std::thread start_reader(std::istream &in, concurrent_queue<std::string> &request_queue);

/**
 * @brief 启动 worker 线程
 * @param worker_id worker 编号，仅用于日志
 * @param e 执行引擎
 * @param request_queue 请求队列
 * @param out 回复的输出流，所有 worker 共享
 * @param out_mut 保护输出流的锁，保证每行回复完整
 * @return 产生的线程
 */
std::thread start_worker(size_t worker_id, engine &e, concurrent_queue<std::string> &request_queue, std::ostream &out, std::mutex &out_mut);

/**
 * @brief 读取 in 中所有请求，使用 workers 个线程处理，全部处理完成后返回
 */
void serve(engine &e, std::istream &in, std::ostream &out, size_t workers);

}  // namespace tci
