#include "http_server.hpp"
#include "utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

static std::vector<std::string> split_path(const std::string& p) {
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i <= p.size()) {
        auto j = p.find('/', i);
        if (j == std::string::npos) j = p.size();
        if (j > i) out.push_back(p.substr(i, j - i));
        i = j + 1;
    }
    return out;
}

const std::string* HttpRequest::header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? nullptr : &it->second;
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(int port){
    // close-on-exec so transcoder children never hold the listener or client sockets
    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) { perror("socket"); return false; }
    int opt=1; setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr{}; addr.sin_family=AF_INET; addr.sin_addr.s_addr=INADDR_ANY; addr.sin_port=htons(port);
    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr))<0){ perror("bind"); close(server_fd_); server_fd_=-1; return false; }
    if (listen(server_fd_, 16)<0){ perror("listen"); close(server_fd_); server_fd_=-1; return false; }
    run_ = true;
    th_ = std::thread(&HttpServer::loop, this);
    log_msg("HTTP server listening on port %d", port);
    return true;
}

void HttpServer::stop(){
    if (!run_.exchange(false)) return;
    // shutdown() wakes the blocked accept(); close() alone does not
    if (server_fd_>=0){ shutdown(server_fd_, SHUT_RDWR); close(server_fd_); server_fd_=-1; }
    if (th_.joinable()) th_.join();

    shutdown_.cancel();
    std::unique_lock<std::mutex> lk(conn_m_);
    conn_cv_.wait(lk, [&]{ return active_conns_ == 0; });
}

void HttpServer::add_route(const std::string& method, const std::string& pattern, RouteHandler h){
    routes_.push_back({method, pattern, std::move(h)});
}

bool HttpServer::match_route(const std::string& pattern, const std::string& path,
                             std::unordered_map<std::string,std::string>& params){
    auto ps = split_path(pattern), xs = split_path(path);
    if (ps.size() != xs.size()) return false;
    std::unordered_map<std::string,std::string> found;
    for (std::size_t i = 0; i < ps.size(); i++){
        if (ps[i][0] == ':') found[ps[i].substr(1)] = xs[i];
        else if (ps[i] != xs[i]) return false;
    }
    params.swap(found);
    return true;
}

void HttpServer::loop(){
    while (run_){
        int cfd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd<0){ if(!run_) break; if (errno == EINTR) continue; perror("accept"); continue; }
        {
            std::lock_guard<std::mutex> lk(conn_m_);
            active_conns_++;
        }
        // Handle per connection in a detached thread
        std::thread([this,cfd](){
            handle_connection(cfd);
            close(cfd);
            // notify under the lock: stop() may return and destroy the server right after
            std::lock_guard<std::mutex> lk(conn_m_);
            active_conns_--;
            conn_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::handle_connection(int cfd){
    HttpRequest req; HttpResponse res;
    std::string prefix;
    if (!read_request(cfd, req, prefix)) return;
    log_msg("Incoming request: Method=%s, Path=%s", req.method.c_str(), req.path.c_str());

    HttpBodyReader::Framing framing = HttpBodyReader::Framing::None;
    uint64_t content_length = 0;
    if (auto te = req.header("transfer-encoding"); te && lower(*te).find("chunked") != std::string::npos) {
        framing = HttpBodyReader::Framing::Chunked;
    } else if (auto cl = req.header("content-length")) {
        int64_t n = 0;
        if (!parse_millis(*cl, n)) {
            res.status = 400; res.body = "Bad Content-Length";
            send_response(cfd, res);
            return;
        }
        framing = HttpBodyReader::Framing::Length;
        content_length = (uint64_t)n;
    }
    HttpBodyReader body([cfd](char* buf, std::size_t n) -> long {
        ssize_t r;
        do { r = recv(cfd, buf, n, 0); } while (r < 0 && errno == EINTR);
        return (long)r;
    }, std::move(prefix), framing, content_length);

    // Server shutdown unblocks any recv()/send() on this connection.
    CancelToken cancel;
    cancel.link_to(shutdown_);
    CancelCallback unblock(cancel, [cfd]{ shutdown(cfd, SHUT_RDWR); });
    req.body = &body;
    req.cancel = &cancel;

    const Route* route = nullptr;
    bool path_known = false;
    for (auto& r : routes_){
        std::unordered_map<std::string,std::string> params;
        if (!match_route(r.pattern, req.path, params)) continue;
        path_known = true;
        if (r.method != req.method) continue;
        route = &r;
        req.params.swap(params);
        break;
    }
    if (route){
        route->handler(cfd, req, res);
        if (!res.is_stream) send_response(cfd, res);
    } else {
        res.status = path_known ? 405 : 404;
        res.body = path_known ? "Method Not Allowed" : "Not Found";
        send_response(cfd, res);
    }
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

bool HttpServer::read_request(int fd, HttpRequest& req, std::string& body_prefix){
    // read until double CRLF; whatever follows belongs to the body
    std::string data; char buf[4096];
    size_t header_end;
    while ((header_end = data.find("\r\n\r\n")) == std::string::npos){
        if (data.size() > 64*1024) return false;
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        data.append(buf, n);
    }

    std::istringstream ss(data.substr(0, header_end));
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
    body_prefix = data.substr(header_end+4);
    return true;
}

const char* HttpServer::reason_phrase(int status){
    switch (status){
    case 200: return "OK";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 500: return "Internal Server Error";
    default:  return "Unknown";
    }
}

void HttpServer::send_response(int fd, const HttpResponse& res){
    std::ostringstream hdr;
    hdr<<"HTTP/1.1 "<<res.status<<" "<<reason_phrase(res.status)<<"\r\n";
    for (auto &kv: res.headers) hdr<<kv.first<<": "<<kv.second<<"\r\n";
    hdr<<"Content-Length: "<<res.body.size()<<"\r\nConnection: close\r\n\r\n";
    auto s = hdr.str();
    if (send(fd, s.data(), s.size(), MSG_NOSIGNAL) < 0) return;
    size_t off = 0;
    while (off < res.body.size()){
        ssize_t n = send(fd, res.body.data()+off, res.body.size()-off, MSG_NOSIGNAL);
        if (n <= 0) break;
        off += (size_t)n;
    }
}
