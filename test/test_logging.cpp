// Copyright (c) 2024 LunaChain
// Quiet console logging for the whole test run

#include "util/logging.hpp"
#include <catch2/catch_test_case_info.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <cstdlib>
#include <string>

namespace {

class TestLoggingListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        // LUNACHAIN_TEST_LOGLEVEL=trace turns every component up
        std::string level = "warn";
        if (const char* env = std::getenv("LUNACHAIN_TEST_LOGLEVEL")) {
            level = env;
        }
        lunachain::util::LogManager::Initialize(level, false, "");
        if (level == "trace") {
            for (const auto& component : lunachain::util::LogManager::Components()) {
                lunachain::util::LogManager::SetComponentLevel(component, "trace");
            }
        }
    }

    void testRunEnded(Catch::TestRunStats const&) override {
        lunachain::util::LogManager::Shutdown();
    }
};

} // namespace

CATCH_REGISTER_LISTENER(TestLoggingListener)
