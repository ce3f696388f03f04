#include "runtime/runtime_registry.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace tci {
using namespace std;

void runtime_registry::register_runtime(const string &language, factory runtime_factory) {
    scoped_lock guard(mut);
    LOG(INFO) << "Registered language runtime " << language;
    factories[language] = move(runtime_factory);
}

bool runtime_registry::supports(const string &language) const {
    scoped_lock guard(mut);
    return factories.count(language) > 0;
}

unique_ptr<language_runtime> runtime_registry::create(const string &language) const {
    factory runtime_factory;
    {
        scoped_lock guard(mut);
        auto it = factories.find(language);
        if (it == factories.end())
            BOOST_THROW_EXCEPTION(provisioning_error("unsupported language " + language));
        runtime_factory = it->second;
    }
    auto runtime = runtime_factory();
    if (!runtime)
        BOOST_THROW_EXCEPTION(provisioning_error("runtime factory of " + language + " returned nothing"));
    return runtime;
}

vector<string> runtime_registry::languages() const {
    scoped_lock guard(mut);
    vector<string> result;
    for (auto &[language, runtime_factory] : factories)
        result.push_back(language);
    return result;
}

}  // namespace tci
