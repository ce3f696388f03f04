#include "execution/execution.hpp"
#include "common/base64.hpp"

namespace tci {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &test) {
    test.name = get_value_def<string>(j, "", "name");
    j.at("condition").get_to(test.condition);
    if (exists(j, "weight"))
        test.weight = get_value<double>(j, "weight");
    else if (exists(j, "reward"))
        test.weight = get_value<double>(j, "reward");
}

void to_json(json &j, const test_case &test) {
    j = {{"name", test.name}, {"condition", test.condition}, {"weight", test.weight}};
}

void to_json(json &j, const test_result &result) {
    j = {{"name", result.name},
         {"passed", result.passed},
         {"reward", result.reward},
         {"message", result.message}};
}

/**
 * @brief 输出按文本返回，不是合法的 UTF-8 时另外以 base64 返回原始字节
 */
static void put_output(json &j, const string &key, const string &bytes) {
    string text = to_utf8_text(bytes);
    if (text != bytes) j[key + "_base64"] = base64_encode(bytes);
    j[key] = move(text);
}

void to_json(json &j, const execution &exec) {
    j = {{"execution_id", exec.id},
         {"session_id", exec.session_id},
         {"status", get_display_message(exec.status)},
         {"stdout_truncated", exec.stdout_truncated},
         {"stderr_truncated", exec.stderr_truncated},
         {"returned_value", exec.value},
         {"has_value", exec.has_value},
         {"bindings", exec.bindings},
         {"exitcode", exec.exitcode},
         {"limits", exec.limits},
         {"usage", exec.usage},
         {"violations", exec.violations},
         {"changed_files", exec.changed_files},
         {"deleted_files", exec.deleted_files},
         {"test_results", exec.test_results},
         {"reward", exec.reward},
         {"started_at", exec.started_at},
         {"finished_at", exec.finished_at}};
    put_output(j, "stdout", exec.stdout_text);
    put_output(j, "stderr", exec.stderr_text);
    if (!exec.message.empty()) j["message"] = exec.message;
}

}  // namespace tci
