#include <catch2/catch.hpp>
#include "commands.hpp"
#include "test_support.hpp"
#include <cmath>

using testing_support::TempDir;

TEST_CASE("successful command captures stdout", "[commands]") {
    CommandResult r = run_command("echo hello");
    CHECK(r.ok);
    REQUIRE(r.code.has_value());
    CHECK(*r.code == 0);
    CHECK(r.stdout_text == "hello\n");
    CHECK(r.stderr_text.empty());
    CHECK(r.duration_sec >= 0.0);
}

TEST_CASE("non-zero exit is a result, not a failure to run", "[commands]") {
    CommandResult r = run_command("echo oops 1>&2; exit 3");
    CHECK_FALSE(r.ok);
    REQUIRE(r.code.has_value());
    CHECK(*r.code == 3);
    CHECK(r.stderr_text == "oops\n");
}

TEST_CASE("cwd selects the working directory", "[commands]") {
    TempDir tmp;
    CommandResult r = run_command("pwd", std::nullopt, tmp.path.string());
    CHECK(r.ok);
    CHECK(r.stdout_text == std::filesystem::canonical(tmp.path).string() + "\n");
}

TEST_CASE("missing cwd is reported as an error", "[commands]") {
    TempDir tmp;
    CommandResult r = run_command("pwd", std::nullopt, (tmp.path / "nope").string());
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.code.has_value());
    CHECK(r.stderr_text.rfind("ERROR: ", 0) == 0);
}

TEST_CASE("timeout kills the command", "[commands]") {
    CommandResult r = run_command("echo started; sleep 5; echo never", 0.3);
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.code.has_value());
    CHECK(r.stdout_text == "started\n");
    CHECK(r.stderr_text.size() >= 8);
    CHECK(r.stderr_text.compare(r.stderr_text.size() - 8, 8, "\nTIMEOUT") == 0);
    CHECK(r.duration_sec < 3.0);
}

TEST_CASE("out of range timeouts still run the command", "[commands]") {
    for (double t : {1e10, 5e6, 1e300, std::nan("")}) {
        CommandResult r = run_command("echo fine", t);
        CHECK(r.ok);
        REQUIRE(r.code.has_value());
        CHECK(*r.code == 0);
        CHECK(r.stdout_text == "fine\n");
    }

    CommandResult negative = run_command("sleep 2", -1e300);
    CHECK_FALSE(negative.code.has_value());
    CHECK(negative.duration_sec < 1.5);
}

TEST_CASE("to_json reports a null code after timeout", "[commands]") {
    CommandResult r = run_command("sleep 2", 0.1);
    Json::Value j = r.to_json();
    CHECK(j["code"].isNull());
    CHECK(j["ok"].asBool() == false);
    CHECK_FALSE(j.isMember("cmd"));
}

TEST_CASE("batch runs commands in order", "[commands]") {
    std::vector<std::string> cmds{"echo a", "false", "echo c"};

    SECTION("stop_on_error stops at the first failure") {
        BatchResult b = run_commands(cmds, std::nullopt, "", true);
        CHECK_FALSE(b.ok);
        REQUIRE(b.results.size() == 2);
        CHECK(b.results[0].stdout_text == "a\n");
        CHECK(*b.results[1].code == 1);
    }
    SECTION("otherwise every command runs") {
        BatchResult b = run_commands(cmds, std::nullopt, "", false);
        CHECK_FALSE(b.ok);
        REQUIRE(b.results.size() == 3);
        CHECK(b.results[2].stdout_text == "c\n");

        Json::Value j = b.to_json();
        CHECK(j["count"].asUInt() == 3);
        CHECK(j["results"][2]["cmd"].asString() == "echo c");
    }
}

TEST_CASE("batch of successes is ok", "[commands]") {
    BatchResult b = run_commands({"true", "echo x"}, std::nullopt, "", true);
    CHECK(b.ok);
    CHECK(b.results.size() == 2);
}
