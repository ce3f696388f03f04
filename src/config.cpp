#include "config.hpp"

namespace tci {
using namespace std;

filesystem::path EXEC_DIR;
filesystem::path SANDBOX_DIR = filesystem::temp_directory_path() / "tci-sandbox";
filesystem::path RUNGUARD;
string RUN_USER;
string RUN_GROUP;
bool DEBUG = false;

}  // namespace tci
