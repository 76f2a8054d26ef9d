#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"

int main(int argc, char* argv[]) {
    guard_link::test::ensure_logger_initialized();
    return Catch::Session().run(argc, argv);
}
