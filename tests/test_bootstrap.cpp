// Catch2 event listener that clears PACDUO_* env before each test case
#include <catch2/catch_test_macros.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <vector>
#include <string>

#if defined(_WIN32)
#  include <windows.h>
#  include <stdlib.h>
#else
extern char** environ;
#  include <cstdlib>
#endif

namespace {
void clear_pacduo_env() {
    std::vector<std::string> to_clear;
#if defined(_WIN32)
    LPCH env = GetEnvironmentStringsA();
    if (!env) return;
    for (LPCH p = env; *p; ) {
        std::string entry(p);
        p += entry.size() + 1;
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        std::string name = entry.substr(0, eq);
        if (name.rfind("PACDUO_", 0) == 0) to_clear.push_back(std::move(name));
    }
    FreeEnvironmentStringsA(env);
    for (auto& n : to_clear) _putenv_s(n.c_str(), "");
#else
    if (!environ) return;
    for (char** e = environ; *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        std::string name = entry.substr(0, eq);
        if (name.rfind("PACDUO_", 0) == 0) to_clear.push_back(std::move(name));
    }
    for (auto& n : to_clear) unsetenv(n.c_str());
#endif
}
}

class EnvBootstrap final : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;
    void testCaseStarting(Catch::TestCaseInfo const&) override {
        clear_pacduo_env();
    }
};

CATCH_REGISTER_LISTENER(EnvBootstrap)
