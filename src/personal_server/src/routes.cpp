#include "routes.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "json_util.hpp"
#include "scraper.hpp"
#include "utils.hpp"

#include <iostream>
#include <optional>

// --- helpers ---
static void reply(HttpResponse& res, const Json::Value& body, int status = 200) {
    res.status = status;
    res.headers["Content-Type"] = "application/json; charset=utf-8";
    res.body = to_compact_json(body);
}

static void reply_error(HttpResponse& res, const std::string& msg, int status) {
    Json::Value j(Json::objectValue);
    j["ok"] = false;
    j["error"] = msg;
    reply(res, j, status);
}

static void reply_record(HttpResponse& res, const char* name, const Json::Value& rec) {
    Json::Value j(Json::objectValue);
    j["ok"] = true;
    j[name] = rec;
    reply(res, j);
}

// Returns false after answering 400 if the body is not a JSON object.
static bool read_body(const HttpRequest& req, HttpResponse& res, Json::Value& body) {
    std::string err;
    if (parse_body(req.body, body, err)) return true;
    reply_error(res, err, 400);
    return false;
}

static std::optional<double> timeout_of(const Json::Value& body) {
    const Json::Value& t = body["timeout"];
    if (t.isNumeric() && !t.isBool()) return t.asDouble();
    if (t.isString()) {
        if (auto v = to_float(t)) return v;
    }
    return std::nullopt;
}

// cmds, commands, or cmd given as a list
static const Json::Value* command_list(const Json::Value& body) {
    for (const char* k : {"cmds", "commands", "cmd"}) {
        if (body[k].isArray()) return &body[k];
    }
    return nullptr;
}

static std::string tags_of(const Json::Value& tags) {
    if (!tags.isArray()) return to_text(tags);
    std::string joined;
    for (Json::ArrayIndex i = 0; i < tags.size(); i++) {
        if (i) joined += ',';
        joined += to_text(tags[i]);
    }
    return joined;
}

// --- register routes ---
void register_routes(HttpServer& srv, Storage& storage) {
    srv.add_route("GET","/ping",[](const HttpRequest&, HttpResponse& res){
        Json::Value j(Json::objectValue);
        j["ok"] = true;
        j["message"] = "pong";
        reply(res, j);
    });

    srv.add_route("POST","/run",[](const HttpRequest& req, HttpResponse& res){
        Json::Value body;
        if (!read_body(req, res, body)) return;
        std::optional<double> timeout = timeout_of(body);
        std::string cwd = to_text(first_truthy(body, {"cwd"}));

        if (const Json::Value* list = command_list(body)) {
            std::vector<std::string> cmds;
            for (auto& c : *list) cmds.push_back(to_text(c));
            bool stop_on_error = truthy(first_truthy(body, {"stop_on_error"}));
            reply(res, run_commands(cmds, timeout, cwd, stop_on_error).to_json());
            return;
        }

        Json::Value cmd = first_truthy(body, {"cmd", "command"});
        std::string text = to_text(cmd);
        if (trim(text).empty()) { reply_error(res, "Missing 'cmd' or 'cmds'", 400); return; }
        reply(res, run_command(text, timeout, cwd).to_json());
    });

    srv.add_route("POST","/notes",[&storage](const HttpRequest& req, HttpResponse& res){
        Json::Value body;
        if (!read_body(req, res, body)) return;
        std::string title = trim(to_text(first_truthy(body, {"title"})));
        if (title.empty()) { reply_error(res, "Missing 'title'", 400); return; }
        std::string content = to_text(first_truthy(body, {"content"}));
        std::string tags = tags_of(first_truthy(body, {"tags"}));
        try {
            reply_record(res, "note", storage.save_note(title, content, tags).to_json());
        } catch (const StorageError& e) {
            std::cerr<<"save_note: "<<e.what()<<"\n";
            reply_error(res, std::string("Write failed: ") + e.what(), 500);
        }
    });

    srv.add_route("POST","/transactions",[&storage](const HttpRequest& req, HttpResponse& res){
        Json::Value body;
        if (!read_body(req, res, body)) return;
        try {
            reply_record(res, "transaction", storage.save_transaction(body).to_json());
        } catch (const StorageError& e) {
            std::cerr<<"save_transaction: "<<e.what()<<"\n";
            reply_error(res, std::string("Write failed: ") + e.what(), 500);
        }
    });

    srv.add_route("POST","/scrape",[&storage](const HttpRequest& req, HttpResponse& res){
        Json::Value body;
        if (!read_body(req, res, body)) return;
        std::string url = to_text(first_truthy(body, {"url"}));
        if (url.empty()) { reply_error(res, "Missing 'url'", 400); return; }
        try {
            FetchResult page = fetch_url(url, cfg::SCRAPE_TIMEOUT_SEC);
            std::string text = html_to_text(page.html);
            reply_record(res, "scrape",
                         storage.save_scrape(page.final_url, page.html, text, page.title).to_json());
        } catch (const ScrapeError& e) {
            std::cerr<<"scrape "<<url<<": "<<e.what()<<"\n";
            reply_error(res, std::string("Scrape failed: ") + e.what(), 502);
        } catch (const StorageError& e) {
            std::cerr<<"save_scrape: "<<e.what()<<"\n";
            reply_error(res, std::string("Write failed: ") + e.what(), 500);
        }
    });

    srv.add_route("POST","/weights",[&storage](const HttpRequest& req, HttpResponse& res){
        Json::Value body;
        if (!read_body(req, res, body)) return;
        try {
            reply_record(res, "weight", storage.save_weight(body).to_json());
        } catch (const StorageError& e) {
            std::cerr<<"save_weight: "<<e.what()<<"\n";
            reply_error(res, std::string("Write failed: ") + e.what(), 500);
        }
    });

    srv.set_fallback([](const HttpRequest&, HttpResponse& res){
        reply_error(res, "Not found", 404);
    });
}
