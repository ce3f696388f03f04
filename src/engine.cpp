#include "engine.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/base64.hpp"
#include "common/exceptions.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, engine_config &config) {
    if (j.count("pool")) j.at("pool").get_to(config.pool);
    if (j.count("governor")) j.at("governor").get_to(config.governor);
    if (j.count("security")) j.at("security").get_to(config.security);
    if (j.count("sessions")) j.at("sessions").get_to(config.sessions);
    if (j.count("reward")) j.at("reward").get_to(config.reward);
    if (j.count("store")) j.at("store").get_to(config.store);
    if (j.count("runtimes")) j.at("runtimes").get_to(config.runtimes);
}

void register_process_runtimes(runtime_registry &registry, const vector<process_runtime_config> &runtimes) {
    for (const auto &runtime : runtimes) {
        if (runtime.language.empty())
            throw invalid_argument("runtime configuration requires a language");
        registry.register_runtime(runtime.language, [runtime] {
            return make_unique<process_runtime>(runtime);
        });
    }
}

engine::engine(const engine_config &config, unique_ptr<state_store> custom_store)
    : config(config),
      store(custom_store ? move(custom_store) : make_state_store(config.store)),
      governor(config.governor),
      gate(config.security),
      reward(config.reward),
      sandboxes(config.pool, registry),
      dispatcher(governor, *store, reward),
      manager(config.sessions, sandboxes, gate, governor, *store, dispatcher) {
    register_process_runtimes(registry, config.runtimes);
}

engine::~engine() {
    shutdown();
}

void engine::start() {
    sandboxes.start_warmer();
    manager.start_reaper();
}

void engine::shutdown() {
    manager.stop_reaper();
    sandboxes.stop_warmer();
    manager.close_all();
}

runtime_registry &engine::runtimes() {
    return registry;
}

session_manager &engine::sessions() {
    return manager;
}

sandbox_pool &engine::pool() {
    return sandboxes;
}

json engine::dispatch(const string &op, const json &request) {
    if (op == "create_session") {
        network_request network;
        if (request.count("network")) request.at("network").get_to(network);
        json profile = request.count("resource_profile") ? request.at("resource_profile") : json::object();
        string session_id = manager.create_session(request.at("language").get<string>(), profile, network);
        return {{"session_id", session_id}};
    } else if (op == "close_session") {
        manager.close_session(request.at("session_id").get<string>());
        return {{"closed", true}};
    } else if (op == "upload_file") {
        string content = base64_decode(request.at("content").get<string>());
        manager.upload_file(request.at("session_id").get<string>(), request.at("path").get<string>(), content);
        return {{"size", content.size()}};
    } else if (op == "download_file") {
        string content = manager.download_file(request.at("session_id").get<string>(), request.at("path").get<string>());
        return {{"content", base64_encode(content)}, {"size", content.size()}};
    } else if (op == "list_files") {
        return {{"files", manager.list_files(request.at("session_id").get<string>())}};
    } else if (op == "run_execution") {
        auto exec_request = request.get<execution_request>();
        auto exec = manager.run_execution(request.at("session_id").get<string>(), exec_request);
        return *exec;
    } else if (op == "session_info") {
        return manager.session_info(request.at("session_id").get<string>());
    } else {
        BOOST_THROW_EXCEPTION(invalid_argument_error("unknown operation " + op));
    }
}

json engine::handle(const json &request) {
    json reply = json::object();
    if (request.is_object() && request.count("id")) reply["id"] = request.at("id");

    try {
        if (!request.is_object() || !request.count("op"))
            BOOST_THROW_EXCEPTION(invalid_argument_error("request must be an object with an op field"));
        string op = request.at("op").get<string>();
        DLOG(INFO) << "Handling request " << op;
        reply["result"] = dispatch(op, request);
    } catch (tci_exception &ex) {
        LOG(WARNING) << "Request failed: " << ex.what();
        reply["error"] = ex.kind();
        reply["message"] = ex.what();
    } catch (json::exception &ex) {
        reply["error"] = "invalid_argument";
        reply["message"] = ex.what();
    } catch (std::invalid_argument &ex) {
        reply["error"] = "invalid_argument";
        reply["message"] = ex.what();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Request crashed: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        reply["error"] = "internal_error";
        reply["message"] = ex.what();
    }
    return reply;
}

string engine::handle_line(const string &line) {
    json request;
    try {
        request = json::parse(line);
    } catch (json::parse_error &ex) {
        json reply = {{"error", "invalid_argument"}, {"message", ex.what()}};
        return dump_text(reply);
    }
    return dump_text(handle(request));
}

}  // namespace tci
