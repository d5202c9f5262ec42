#pragma once
#include <string>

namespace pacduo::paths {

// Resolves config.json: PACDUO_CONFIG_DIR, then the working directory and its
// parents, then the working directory.
std::string configFilePath();

// Sibling file in the directory that holds config.json.
std::string dataFilePath(const std::string& fileName);

#ifdef PACDUO_INTERNAL_TESTING
void pacduo_set_config_path_for_tests(const std::string& p);
#endif
}
