#include <catch2/catch.hpp>
#include <knit/log.hpp>
#include "test_helpers.hpp"
#include <cstdio>
#include <string>

using namespace knit;
using namespace knit::log;

// Runs fn against a ConsoleLogger writing to a temp file and returns the text
template<typename F>
static std::string capture(Level level, F fn) {
    std::FILE* f = std::tmpfile();
    REQUIRE(f != nullptr);
    {
        ConsoleLogger logger(level, f);
        logger.set_color_enabled(false);
        fn(logger);
    }
    std::rewind(f);
    std::string out;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        out.append(buf, n);
    }
    std::fclose(f);
    return out;
}

TEST_CASE("level names", "[log]") {
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Verbose)) == "verbose");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts names case-insensitively", "[log]") {
    REQUIRE(parse_level("verbose").value() == Verbose);
    REQUIRE(parse_level("WARN").value() == Warn);
    REQUIRE(parse_level("warning").value() == Warn);

    auto bad = parse_level("loud");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == KnitError::Config);
}

TEST_CASE("console logger suppresses messages below its level", "[log]") {
    auto out = capture(Warn, [](Logger& l) {
        l.info("should not appear");
        l.verbose("nor this");
    });
    REQUIRE(out.empty());
}

TEST_CASE("console logger emits at and above its level", "[log]") {
    auto out = capture(Warn, [](Logger& l) {
        l.warn("this is a warning");
        l.error("this is an error");
    });
    REQUIRE(out.find("warn: this is a warning\n") != std::string::npos);
    REQUIRE(out.find("error: this is an error\n") != std::string::npos);
}

TEST_CASE("console logger formats arguments", "[log]") {
    auto out = capture(Debug, [](Logger& l) {
        l.debug("value: %d, name: %s", 42, "test");
    });
    REQUIRE(out == "debug: value: 42, name: test\n");
}

TEST_CASE("console logger level can change", "[log]") {
    ConsoleLogger logger(Info, stderr);
    REQUIRE_FALSE(logger.enabled(Verbose));
    logger.set_level(Verbose);
    REQUIRE(logger.level() == Verbose);
    REQUIRE(logger.enabled(Verbose));
    REQUIRE_FALSE(logger.enabled(Debug));
}

TEST_CASE("color flag round trip", "[log]") {
    ConsoleLogger logger(Info, stderr);
    logger.set_color_enabled(true);
    REQUIRE(logger.is_color_enabled());
    logger.set_color_enabled(false);
    REQUIRE_FALSE(logger.is_color_enabled());
}

TEST_CASE("null logger is silent and disabled", "[log]") {
    Logger& l = null_logger();
    REQUIRE_FALSE(l.enabled(Error));
    l.error("dropped %s", "quietly");
}

TEST_CASE("recording logger sees long messages whole", "[log]") {
    test::RecordingLogger rec;
    std::string big(2000, 'x');
    rec.info("%s!", big.c_str());
    REQUIRE(rec.messages.size() == 1);
    REQUIRE(rec.messages[0].second.size() == 2001);
}
