#include "store/state_store.hpp"
#include "store/memory_state_store.hpp"
#include "store/redis_state_store.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

state_store::~state_store() {}

void to_json(json &j, const file_info &info) {
    j = {{"path", info.path}, {"size", info.size}, {"modified_at", info.modified_at}};
}

void from_json(const json &j, store_config &config) {
    assign_optional(j, config.type, "type");
    if (exists(j, "redis")) j.at("redis").get_to(config.redis);
    assign_optional(j, config.key_prefix, "key_prefix");
}

unique_ptr<state_store> make_state_store(const store_config &config) {
    if (config.type == "memory")
        return make_unique<memory_state_store>();
    else if (config.type == "redis")
        return make_unique<redis_state_store>(config.redis, config.key_prefix);
    else
        throw invalid_argument("unknown state store " + config.type);
}

}  // namespace tci
