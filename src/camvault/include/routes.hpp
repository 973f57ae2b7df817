#pragma once
#include "config.hpp"
#include "http_server.hpp"
#include "ingest_session.hpp"

void register_routes(HttpServer& srv, const ServiceOptions& opts, ActiveStreams& active);
