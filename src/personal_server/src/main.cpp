#include <csignal>
#include <pthread.h>
#include "config.hpp"
#include "http_server.hpp"
#include "routes.hpp"
#include "scraper.hpp"
#include "storage.hpp"
#include <iostream>

// usage: personal_server [host] [port]
int main(int argc, char** argv){
    cfg::Settings settings;
    std::string err;
    if (!cfg::load_settings(settings, err)) {
        std::cerr<<err<<"\n"; return 1;
    }
    if (argc > 1) settings.host = argv[1];
    if (argc > 2 && !cfg::parse_port(argv[2], settings.port)) {
        std::cerr<<"invalid port: "<<argv[2]<<"\n"; return 1;
    }

    // Block SIGINT/SIGTERM in every thread; main waits for them below
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    scraper_global_init();
    Storage storage(settings.root);

    HttpServer srv;
    register_routes(srv, storage);
    if (!srv.start(settings.host, settings.port)) {
        std::cerr<<"Failed to start HTTP server\n";
        scraper_global_cleanup();
        return 1;
    }
    std::cout<<"Data root: "<<settings.root<<"\n";

    int sig = 0;
    sigwait(&sigs, &sig);
    std::cout<<"\nShutting down...\n";
    srv.stop();
    scraper_global_cleanup();
    return 0;
}
