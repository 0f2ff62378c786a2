#include "http_server.hpp"
#include "config.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstring>
#include <sstream>
#include <iostream>

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? std::string() : it->second;
}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(const std::string& host, int port){
    // Clients that disconnect mid-response must not kill the process
    signal(SIGPIPE, SIG_IGN);

    addrinfo hints{}; hints.ai_family = AF_INET; hints.ai_socktype = SOCK_STREAM;
    addrinfo* ai = nullptr;
    int gai = getaddrinfo(host.c_str(), nullptr, &hints, &ai);
    if (gai != 0 || !ai) {
        std::cerr<<"resolve "<<host<<": "<<gai_strerror(gai)<<"\n";
        return false;
    }
    sockaddr_in addr{};
    std::memcpy(&addr, ai->ai_addr, sizeof(addr));
    freeaddrinfo(ai);
    addr.sin_port = htons(port);

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) { perror("socket"); return false; }
    int opt=1; setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr))<0){ perror("bind"); close(server_fd_); server_fd_=-1; return false; }
    if (listen(server_fd_, cfg::LISTEN_BACKLOG)<0){ perror("listen"); close(server_fd_); server_fd_=-1; return false; }

    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, (sockaddr*)&addr, &len) == 0) port_ = ntohs(addr.sin_port);
    else port_ = port;

    run_ = true;
    th_ = std::thread(&HttpServer::loop, this);
    std::cout<<"PersonalServer running on http://"<<host<<":"<<port_<<"\n";
    return true;
}

void HttpServer::stop(){
    run_ = false;
    if (server_fd_>=0){ shutdown(server_fd_, SHUT_RDWR); close(server_fd_); server_fd_=-1; }
    if (th_.joinable()) th_.join();

    std::unique_lock<std::mutex> lk(active_mu_);
    active_cv_.wait(lk, [this]{ return active_ == 0; });
}

void HttpServer::add_route(const std::string& method, const std::string& prefix, RouteHandler h){
    routes_.push_back({method, prefix, std::move(h)});
}

void HttpServer::set_fallback(RouteHandler h){ fallback_ = std::move(h); }

void HttpServer::dispatch(const HttpRequest& req, HttpResponse& res) const {
    for (auto& r : routes_) {
        if (r.method == req.method && req.path.compare(0, r.prefix.size(), r.prefix) == 0) {
            r.handler(req, res);
            return;
        }
    }
    if (fallback_) { fallback_(req, res); return; }
    res.status=404; res.body="Not Found";
}

void HttpServer::loop(){
    while (run_){
        sockaddr_in peer{}; socklen_t plen = sizeof(peer);
        int cfd = accept(server_fd_, (sockaddr*)&peer, &plen);
        if (cfd<0){ if(!run_) break; perror("accept"); continue; }
        char ip[INET_ADDRSTRLEN] = "?";
        inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
        // Handle per connection in a detached thread; stop() waits on active_
        { std::lock_guard<std::mutex> lk(active_mu_); active_++; }
        std::thread([this,cfd,p=std::string(ip)](){
            handle_client(cfd, p);
            close(cfd);
            std::lock_guard<std::mutex> lk(active_mu_);
            if (--active_ == 0) active_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::handle_client(int fd, const std::string& peer) const {
    timeval tv{}; tv.tv_sec = 30;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    HttpRequest req; HttpResponse res;
    int rejected = read_request(fd, req);
    if (rejected < 0) return;
    req.peer = peer;
    if (rejected > 0) {
        res.status = rejected;
        res.body = reason_phrase(rejected);
    } else {
        dispatch(req, res);
    }
    send_response(fd, res);

    std::ostringstream line;
    line<<peer<<" \""<<req.method<<" "<<req.path<<"\" "<<res.status<<"\n";
    std::cout<<line.str()<<std::flush;
}

static bool parse_request_line(const std::string& line, HttpRequest& req){
    std::istringstream iss(line);
    if(!(iss>>req.method)) return false;
    std::string target; if(!(iss>>target)) return false;
    size_t q = target.find('?');
    if (q==std::string::npos){ req.path = target; }
    else { req.path = target.substr(0,q); req.query = target.substr(q+1); }
    return true;
}

bool HttpServer::parse_head(const std::string& head, HttpRequest& req){
    std::istringstream ss(head);
    std::string line; if(!std::getline(ss,line)) return false;
    if (line.size() && line.back()=='\r') line.pop_back();
    if(!parse_request_line(line, req)) return false;

    while (std::getline(ss,line)){
        if (line.size() && line.back()=='\r') line.pop_back();
        size_t c=line.find(':'); if(c!=std::string::npos){
            std::string k=lower(line.substr(0,c)), v=line.substr(c+1);
            while (!v.empty() && (v.front()==' '||v.front()=='\t')) v.erase(v.begin());
            while (!v.empty() && (v.back()==' '||v.back()=='\t')) v.pop_back();
            req.headers[k]=v;
        }
    }
    return true;
}

// 0 when a request was read, -1 if the peer went away, otherwise the
// status to answer with.
int HttpServer::read_request(int fd, HttpRequest& req){
    std::string data; char buf[4096];
    ssize_t n;
    size_t header_end = std::string::npos;
    while (header_end==std::string::npos){
        n=recv(fd,buf,sizeof(buf),0); if(n<=0) return -1;
        data.append(buf,n);
        header_end = data.find("\r\n\r\n");
        if (header_end==std::string::npos && data.size() > cfg::MAX_HEAD_BYTES) return 400;
    }
    if (header_end > cfg::MAX_HEAD_BYTES) return 400;

    if (!parse_head(data.substr(0, header_end), req)) return 400;

    // Body (Content-Length)
    size_t cl=0;
    std::string len = req.header("Content-Length");
    if (!len.empty()) {
        if (len.find_first_not_of("0123456789") != std::string::npos) return 400;
        if (len.size() > 12) return 413;
        cl = std::stoul(len);
        if (cl > cfg::MAX_BODY_BYTES) return 413;
    }
    req.body = data.substr(header_end+4);
    while (req.body.size()<cl){
        n=recv(fd,buf,sizeof(buf),0); if(n<=0) return -1; req.body.append(buf,n);
    }
    if (req.body.size()>cl) req.body.resize(cl);
    return 0;
}

const char* HttpServer::reason_phrase(int status){
    switch (status){
    case 200: return "OK";
    case 302: return "Found";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    default:  return "Unknown";
    }
}

std::string HttpServer::serialize(const HttpResponse& res){
    std::ostringstream hdr;
    hdr<<"HTTP/1.1 "<<res.status<<" "<<reason_phrase(res.status)<<"\r\n";
    hdr<<"Server: PersonalServer/0.1\r\n";
    for (auto &kv: res.headers) hdr<<kv.first<<": "<<kv.second<<"\r\n";
    hdr<<"Content-Length: "<<res.body.size()<<"\r\n";
    hdr<<"Connection: close\r\n\r\n";
    return hdr.str() + res.body;
}

void HttpServer::send_response(int fd, const HttpResponse& res){
    std::string s = serialize(res);
    size_t off = 0;
    while (off < s.size()){
        ssize_t n = send(fd, s.data()+off, s.size()-off, MSG_NOSIGNAL);
        if (n <= 0) return;
        off += (size_t)n;
    }
}
