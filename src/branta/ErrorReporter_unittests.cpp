#include "branta/ErrorReporter.hpp"

#include "doctest/doctest.h"
#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <sstream>
#include <string>

namespace branta {

TEST_CASE("ErrorReporter line numbers") {
    SUBCASE("empty string") {
        ErrorReporter er;
        std::string code("");
        er.setCode(code);
        CHECK(er.getLineNumber(code.data()) == 1);
    }
    SUBCASE("one liner") {
        ErrorReporter er;
        std::string code("start: t0 t0: t1 t2 t1: \"a\" t2: \"b\"");
        er.setCode(code);
        CHECK(er.getLineNumber(code.data()) == 1);
        CHECK(er.getLineNumber(code.data() + 10) == 1);
        CHECK(er.getLineNumber(code.data() + code.size()) == 1);
    }
    SUBCASE("multiline string") {
        ErrorReporter er;
        std::string code("start: t0\nt0: t1\n  | t2\nt1: \"a\"\nt2: \"b\"\n");
        er.setCode(code);
        CHECK(er.getLineNumber(code.data() + 1) == 1);
        CHECK(er.getLineNumber(code.data() + 11) == 2);
        CHECK(er.getLineNumber(code.data() + 19) == 3);
        CHECK(er.getLineNumber(code.data() + 25) == 4);
        CHECK(er.getLineNumber(code.data() + 33) == 5);
    }
    SUBCASE("multiple empty lines") {
        ErrorReporter er;
        std::string code("\n\n\n\n\n\n\n7");
        er.setCode(code);
        CHECK(er.getLineNumber(code.data()) == 1);
        CHECK(er.getLineNumber(code.data() + 1) == 2);
        CHECK(er.getLineNumber(code.data() + 2) == 3);
        CHECK(er.getLineNumber(code.data() + 3) == 4);
        CHECK(er.getLineNumber(code.data() + 4) == 5);
        CHECK(er.getLineNumber(code.data() + 5) == 6);
        CHECK(er.getLineNumber(code.data() + 6) == 7);
    }
    SUBCASE("new code resets line map") {
        ErrorReporter er;
        std::string first("a\nb\nc");
        er.setCode(first);
        CHECK(er.getLineNumber(first.data() + 4) == 3);
        std::string second("abc");
        er.setCode(second);
        CHECK(er.getLineNumber(second.data() + 2) == 1);
    }
}

TEST_CASE("ErrorReporter errors") {
    SUBCASE("starts ok") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK(er.errorCount() == 0);
    }
    SUBCASE("suppressed errors are still recorded") {
        ErrorReporter er(true);
        er.addError("first");
        er.addFileNotFoundError("missing.txt");
        CHECK(!er.ok());
        REQUIRE(er.errorCount() == 2);
        CHECK(er.errors()[0] == "first");
        CHECK(er.errors()[1].find("missing.txt") != std::string::npos);
    }
    SUBCASE("clear") {
        ErrorReporter er(true);
        er.addFileOpenError("a");
        er.addFileReadError("b");
        CHECK(er.errorCount() == 2);
        er.clear();
        CHECK(er.ok());
    }
}

TEST_CASE("ErrorReporter logging") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto previousLogger = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("error_reporter", sink));

    ErrorReporter loud;
    loud.addError("reported to log");
    ErrorReporter quiet(true);
    quiet.addError("kept out of log");

    spdlog::set_default_logger(previousLogger);
    spdlog::drop("error_reporter");

    CHECK(out.str().find("reported to log") != std::string::npos);
    CHECK(out.str().find("kept out of log") == std::string::npos);
    CHECK(quiet.errorCount() == 1);
}

} // namespace branta
