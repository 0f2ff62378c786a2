#include <catch2/catch.hpp>
#include "json_util.hpp"
#include "routes.hpp"
#include "test_support.hpp"

using testing_support::TempDir;
using testing_support::read_csv;

namespace {

struct App {
    TempDir tmp;
    Storage storage{tmp.path};
    HttpServer srv;
    App() { register_routes(srv, storage); }

    HttpResponse call(const std::string& method, const std::string& path, const std::string& body = "") {
        HttpRequest req;
        req.method = method;
        req.path = path;
        req.body = body;
        HttpResponse res;
        srv.dispatch(req, res);
        return res;
    }
};

Json::Value json_of(const HttpResponse& res) {
    Json::Value v;
    std::string err;
    REQUIRE(parse_body(res.body, v, err));
    return v;
}

size_t rows_in(const std::filesystem::path& csv) {
    if (!std::filesystem::exists(csv)) return 0;
    return read_csv(csv).size() - 1;
}

}

TEST_CASE("ping always answers pong", "[routes]") {
    App app;
    HttpResponse first = app.call("GET", "/ping");
    HttpResponse second = app.call("GET", "/ping");
    CHECK(first.status == 200);
    CHECK(first.headers["Content-Type"] == "application/json; charset=utf-8");
    CHECK(first.body == second.body);
    Json::Value j = json_of(first);
    CHECK(j["ok"].asBool());
    CHECK(j["message"].asString() == "pong");
}

TEST_CASE("unknown paths are 404 json", "[routes]") {
    App app;
    HttpResponse res = app.call("GET", "/nope");
    CHECK(res.status == 404);
    CHECK(json_of(res)["error"].asString() == "Not found");
    CHECK(app.call("POST", "/ping").status == 404);
}

TEST_CASE("malformed json is a 400", "[routes]") {
    App app;
    for (const char* path : {"/notes", "/transactions", "/weights", "/run", "/scrape"}) {
        HttpResponse res = app.call("POST", path, "{\"title\": ");
        CHECK(res.status == 400);
        Json::Value j = json_of(res);
        CHECK_FALSE(j["ok"].asBool());
        CHECK(j["error"].asString().rfind("Invalid JSON", 0) == 0);
    }
}

TEST_CASE("notes add one row and a markdown file", "[routes]") {
    App app;
    auto csv = app.storage.notes_log().path();
    for (size_t i = 1; i <= 2; i++) {
        HttpResponse res = app.call("POST", "/notes",
            R"({"title": "  Standup  ", "content": "done", "tags": ["work", "daily"]})");
        REQUIRE(res.status == 200);
        Json::Value note = json_of(res)["note"];
        CHECK(note["title"].asString() == "Standup");
        CHECK(note["tags"].asString() == "work,daily");
        CHECK(rows_in(csv) == i);
        CHECK(std::filesystem::exists(app.storage.notes_dir() / note["filename"].asString()));
    }
}

TEST_CASE("falsy tags are stored empty", "[routes]") {
    App app;
    for (const char* tags : {"false", "0", "null", "[]", "\"\""}) {
        HttpResponse res = app.call("POST", "/notes",
            std::string(R"({"title": "t", "tags": )") + tags + "}");
        REQUIRE(res.status == 200);
        CHECK(json_of(res)["note"]["tags"].asString() == "");
    }
    auto rows = read_csv(app.storage.notes_log().path());
    REQUIRE(rows.size() == 6);
    for (size_t i = 1; i < rows.size(); i++) CHECK(rows[i].back() == "");
}

TEST_CASE("notes require a title", "[routes]") {
    App app;
    HttpResponse res = app.call("POST", "/notes", R"({"title": "   ", "content": "x"})");
    CHECK(res.status == 400);
    CHECK(json_of(res)["error"].asString() == "Missing 'title'");
    CHECK(rows_in(app.storage.notes_log().path()) == 0);
}

TEST_CASE("transactions preserve extra keys", "[routes]") {
    App app;
    HttpResponse res = app.call("POST", "/transactions",
        R"({"amount": 9.99, "merchant": "Books", "isbn": "978-0", "gift": true})");
    REQUIRE(res.status == 200);
    Json::Value txn = json_of(res)["transaction"];
    CHECK(txn["amount"].asString() == "9.99");
    CHECK(txn["raw_json"]["isbn"].asString() == "978-0");
    CHECK(txn["raw_json"]["gift"].asBool());

    auto rows = read_csv(app.storage.transactions_log().path());
    REQUIRE(rows.size() == 2);
    Json::Value raw;
    std::string err;
    REQUIRE(parse_body(rows[1].back(), raw, err));
    CHECK(raw["isbn"].asString() == "978-0");
    CHECK(raw["gift"].asBool());
}

TEST_CASE("weights are converted", "[routes]") {
    App app;
    HttpResponse res = app.call("POST", "/weights", R"({"weight": "180 lb", "bodyFat": 21.5})");
    REQUIRE(res.status == 200);
    Json::Value w = json_of(res)["weight"];
    CHECK(w["weight_kg"].asString() == "81.647");
    CHECK(w["body_fat_pct"].asString() == "21.50");
    CHECK(w["raw_json"]["weight"].asString() == "180 lb");
}

TEST_CASE("weights survive a long digit string", "[routes]") {
    App app;
    HttpResponse res = app.call("POST", "/weights",
        "{\"weight\": \"" + std::string(200000, '1') + "\", \"bf\": \"" + std::string(200000, '2') + "\"}");
    CHECK(res.status == 200);
    CHECK(rows_in(app.storage.weights_log().path()) == 1);
}

TEST_CASE("run executes single commands and batches", "[routes]") {
    App app;

    SECTION("single command") {
        Json::Value j = json_of(app.call("POST", "/run", R"({"cmd": "echo hi"})"));
        CHECK(j["ok"].asBool());
        CHECK(j["code"].asInt() == 0);
        CHECK(j["stdout"].asString() == "hi\n");
    }
    SECTION("non-zero exit is still 200") {
        HttpResponse res = app.call("POST", "/run", R"({"command": "exit 4"})");
        CHECK(res.status == 200);
        Json::Value j = json_of(res);
        CHECK_FALSE(j["ok"].asBool());
        CHECK(j["code"].asInt() == 4);
    }
    SECTION("list of commands") {
        Json::Value j = json_of(app.call("POST", "/run",
            R"({"cmds": ["echo a", "exit 2", "echo c"], "stop_on_error": true})"));
        CHECK_FALSE(j["ok"].asBool());
        CHECK(j["count"].asUInt() == 2);
        CHECK(j["results"][1]["code"].asInt() == 2);
    }
    SECTION("cmd given as a list") {
        Json::Value j = json_of(app.call("POST", "/run", R"({"cmd": ["echo a", "echo b"]})"));
        CHECK(j["ok"].asBool());
        CHECK(j["count"].asUInt() == 2);
    }
    SECTION("timeout") {
        Json::Value j = json_of(app.call("POST", "/run", R"({"cmd": "sleep 3", "timeout": 0.2})"));
        CHECK(j["code"].isNull());
        CHECK(j["stderr"].asString().find("TIMEOUT") != std::string::npos);
    }
    SECTION("huge timeout runs without a deadline") {
        HttpResponse res = app.call("POST", "/run", R"({"cmd": "echo ok", "timeout": 1e10})");
        REQUIRE(res.status == 200);
        Json::Value j = json_of(res);
        CHECK(j["ok"].asBool());
        CHECK(j["code"].asInt() == 0);
        CHECK(j["stdout"].asString() == "ok\n");
    }
    SECTION("long numeric timeout text") {
        std::string body = R"({"cmd": "echo ok", "timeout": ")" + std::string(200000, '9') + "\"}";
        Json::Value j = json_of(app.call("POST", "/run", body));
        CHECK(j["code"].asInt() == 0);
    }
    SECTION("form encoded body") {
        Json::Value j = json_of(app.call("POST", "/run", "cmd=echo+form"));
        CHECK(j["stdout"].asString() == "form\n");
    }
    SECTION("missing command") {
        HttpResponse res = app.call("POST", "/run", R"({"cmd": "  "})");
        CHECK(res.status == 400);
        CHECK(json_of(res)["error"].asString() == "Missing 'cmd' or 'cmds'");
    }
}

TEST_CASE("scrape validates and reports fetch failures", "[routes]") {
    App app;
    HttpResponse missing = app.call("POST", "/scrape", "{}");
    CHECK(missing.status == 400);
    CHECK(json_of(missing)["error"].asString() == "Missing 'url'");

    HttpResponse failed = app.call("POST", "/scrape", R"({"url": "http://127.0.0.1:1/"})");
    CHECK(failed.status == 502);
    CHECK(json_of(failed)["error"].asString().rfind("Scrape failed: ", 0) == 0);
    CHECK(rows_in(app.storage.scrapes_log().path()) == 0);
}

TEST_CASE("scrape stores the fetched page", "[routes]") {
    App app;
    HttpServer site;
    site.add_route("GET", "/article", [](const HttpRequest&, HttpResponse& res){
        res.headers["Content-Type"] = "text/html";
        res.body = "<html><head><title>Long Read</title></head><body><p>Para one.</p></body></html>";
    });
    REQUIRE(site.start("127.0.0.1", 0));

    HttpResponse res = app.call("POST", "/scrape",
        "{\"url\": \"http://127.0.0.1:" + std::to_string(site.port()) + "/article\"}");
    site.stop();

    REQUIRE(res.status == 200);
    Json::Value s = json_of(res)["scrape"];
    CHECK(s["title"].asString() == "Long Read");
    CHECK(s["filename_txt"].asString().find("-long-read.txt") != std::string::npos);
    CHECK(testing_support::slurp(app.storage.scrapes_dir() / s["filename_txt"].asString()) ==
          "Long Read\nPara one.");
    CHECK(rows_in(app.storage.scrapes_log().path()) == 1);
}

TEST_CASE("write failures are 500", "[routes]") {
    TempDir tmp;
    std::ofstream(tmp.path / "root").put('x');
    Storage storage(tmp.path / "root");
    HttpServer srv;
    register_routes(srv, storage);

    HttpRequest req;
    req.method = "POST";
    req.path = "/transactions";
    req.body = R"({"amount": 1})";
    HttpResponse res;
    srv.dispatch(req, res);
    CHECK(res.status == 500);
    CHECK(json_of(res)["error"].asString().rfind("Write failed: ", 0) == 0);
}

TEST_CASE("full server round trip", "[routes]") {
    App app;
    REQUIRE(app.srv.start("127.0.0.1", 0));
    std::string body = R"({"title": "From socket"})";
    std::string resp = testing_support::http_roundtrip(app.srv.port(),
        "POST /notes HTTP/1.1\r\nHost: x\r\nContent-Type: application/json\r\nContent-Length: " +
        std::to_string(body.size()) + "\r\n\r\n" + body);
    app.srv.stop();

    CHECK(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(resp.find("application/json; charset=utf-8") != std::string::npos);
    CHECK(rows_in(app.storage.notes_log().path()) == 1);
}
