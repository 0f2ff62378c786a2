#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <thread>
#include <atomic>
#include <condition_variable>
#include <mutex>

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::unordered_map<std::string,std::string> headers; // keys lower-cased
    std::string body;
    std::string peer;

    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::unordered_map<std::string,std::string> headers;
    std::string body;
};

using RouteHandler = std::function<void(const HttpRequest&, HttpResponse&)>;

class HttpServer {
public:
    ~HttpServer();

    // Binds host:port (port 0 picks a free port) and starts the accept loop.
    bool start(const std::string& host, int port);
    // Closes the listener, then waits for requests already being handled.
    void stop();
    int port() const { return port_; }

    // Routes match on method and path prefix, first registered wins.
    void add_route(const std::string& method, const std::string& prefix, RouteHandler h);
    // Used when no route matches.
    void set_fallback(RouteHandler h);

    void dispatch(const HttpRequest& req, HttpResponse& res) const;

    static bool parse_head(const std::string& head, HttpRequest& req);
    static std::string serialize(const HttpResponse& res);
    static const char* reason_phrase(int status);

private:
    struct Route {
        std::string method;
        std::string prefix;
        RouteHandler handler;
    };

    int server_fd_ = -1;
    int port_ = 0;
    std::thread th_;
    std::atomic<bool> run_{false};
    std::vector<Route> routes_;
    RouteHandler fallback_;

    std::mutex active_mu_;
    std::condition_variable active_cv_;
    int active_ = 0;

    void loop();
    void handle_client(int fd, const std::string& peer) const;
    static int read_request(int fd, HttpRequest& req);
    static void send_response(int fd, const HttpResponse& res);
};
