#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <crabby/log.hpp>

int main(int argc, char* argv[]) {
    // Installer and resolver chatter would drown the test report
    crabby::log::set_level(crabby::log::Warn);
    return Catch::Session().run(argc, argv);
}
