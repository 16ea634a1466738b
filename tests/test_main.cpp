#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "utils/Logger.hpp"

int main(int argc, char** argv) {
    nettrans::Logger::getInstance().setLogLevel(nettrans::LogLevel::ERROR);
    return Catch::Session().run(argc, argv);
}
