#pragma once
#include "cancel_token.hpp"
#include "http_body.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::unordered_map<std::string,std::string> headers;   // lower-case names
    std::unordered_map<std::string,std::string> params;    // from ":name" route segments
    HttpBodyReader* body = nullptr;
    CancelToken* cancel = nullptr;   // fires on server shutdown

    const std::string* header(const std::string& lower_name) const;
};

struct HttpResponse {
    int status = 200;
    std::unordered_map<std::string,std::string> headers;
    std::string body;
    bool is_stream = false; // if true, handler writes directly to socket
};

using RouteHandler = std::function<void(int client_fd, const HttpRequest&, HttpResponse&)>;

class HttpServer {
public:
    ~HttpServer();

    bool start(int port);
    // Cancels in-flight requests and waits for their handlers to return.
    void stop();
    void add_route(const std::string& method, const std::string& pattern, RouteHandler h);

    // "/image/:stream/:ts" against "/image/cam1/42" -> {stream: cam1, ts: 42}
    static bool match_route(const std::string& pattern, const std::string& path,
                            std::unordered_map<std::string,std::string>& params);
    static const char* reason_phrase(int status);
    static void send_response(int fd, const HttpResponse& res);

private:
    struct Route {
        std::string method;
        std::string pattern;
        RouteHandler handler;
    };

    int server_fd_ = -1;
    std::thread th_;
    std::atomic<bool> run_{false};
    std::vector<Route> routes_;
    CancelToken shutdown_;

    std::mutex conn_m_;
    std::condition_variable conn_cv_;
    int active_conns_ = 0;

    void loop();
    void handle_connection(int cfd);
    static bool read_request(int fd, HttpRequest& req, std::string& body_prefix);
};
