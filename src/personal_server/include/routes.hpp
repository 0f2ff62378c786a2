#pragma once
#include "http_server.hpp"
#include "storage.hpp"

void register_routes(HttpServer& srv, Storage& storage);
