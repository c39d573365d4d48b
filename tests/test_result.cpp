#include <catch2/catch.hpp>
#include <knit/result.hpp>
#include <memory>
#include <string>

using namespace knit;

static Result<int> parse_positive(int x) {
    if (x <= 0) return KnitError{KnitError::InvalidArg, "not positive"};
    return Result<int>::ok(x);
}

static Result<int> sum_positive(int a, int b) {
    KNIT_TRY(parse_positive(a));
    KNIT_TRY(parse_positive(b));
    return Result<int>::ok(a + b);
}

TEST_CASE("ok result holds value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == 42);
}

TEST_CASE("err result holds error", "[result]") {
    auto r = Result<int>::err(KnitError{KnitError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == KnitError::NotFound);
    REQUIRE(r.error().message == "missing item");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("KNIT_TRY stops at the first error", "[result]") {
    REQUIRE(sum_positive(2, 3).value() == 5);

    auto r = sum_positive(2, -1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KnitError::InvalidArg);
}

TEST_CASE("Status ok and err", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(KnitError{KnitError::Config, "bad config"});
    REQUIRE(s.error().code == KnitError::Config);
}

TEST_CASE("result with move-only value", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(7));
    auto p = std::move(r).value();
    REQUIRE(*p == 7);
}

TEST_CASE("error format with hint and location", "[error]") {
    KnitError e{KnitError::Descriptor, "package has no name field",
                "add a name", "pkg/package.json", 3};
    auto s = e.format();
    REQUIRE(s.find("error[Descriptor]: package has no name field") != std::string::npos);
    REQUIRE(s.find("hint: add a name") != std::string::npos);
    REQUIRE(s.find("--> pkg/package.json:3") != std::string::npos);
}

TEST_CASE("default error is fully initialized", "[error]") {
    KnitError e;
    REQUIRE(e.code == KnitError::IO);
    REQUIRE(e.line == 0);
    REQUIRE(e.message.empty());
    REQUIRE(e.format() == "error[IO]: ");
}

TEST_CASE("error format without extras", "[error]") {
    KnitError e{KnitError::Cycle, "loop"};
    REQUIRE(e.format() == "error[Cycle]: loop");
}

TEST_CASE("error code names", "[error]") {
    REQUIRE(std::string(KnitError::code_name(KnitError::IO)) == "IO");
    REQUIRE(std::string(KnitError::code_name(KnitError::Parse)) == "Parse");
    REQUIRE(std::string(KnitError::code_name(KnitError::Scan)) == "Scan");
    REQUIRE(std::string(KnitError::code_name(KnitError::Descriptor)) == "Descriptor");
    REQUIRE(std::string(KnitError::code_name(KnitError::Cycle)) == "Cycle");
    REQUIRE(std::string(KnitError::code_name(KnitError::Config)) == "Config");
    REQUIRE(std::string(KnitError::code_name(KnitError::NotFound)) == "NotFound");
    REQUIRE(std::string(KnitError::code_name(KnitError::InvalidArg)) == "InvalidArg");
}
