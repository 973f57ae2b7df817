#include "uploader.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>

bool parse_stream_url(const std::string& url, StreamUrl& out) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) return false;
    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string hostport = rest.substr(0, slash);
    out.path = slash == std::string::npos ? "/" : rest.substr(slash);
    auto colon = hostport.rfind(':');
    if (colon != std::string::npos) {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
        if (out.port.empty()) return false;
    } else {
        out.host = hostport;
        out.port = "80";
    }
    return !out.host.empty();
}

MultipartUploader::MultipartUploader() {
    std::random_device rd; std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;
    char buf[40];
    snprintf(buf, sizeof(buf), "%016llx%016llx", dist(gen), dist(gen));
    boundary_ = buf;
}

MultipartUploader::~MultipartUploader() {
    close();
}

void MultipartUploader::close() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

bool MultipartUploader::send_all(const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) { perror("send"); return false; }
        off += (size_t)n;
    }
    return true;
}

bool MultipartUploader::open(const StreamUrl& url) {
    addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
    if (rc != 0) {
        fprintf(stderr, "resolve %s: %s\n", url.host.c_str(), gai_strerror(rc));
        return false;
    }
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd_ = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ < 0) continue;
        if (connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0) break;
        ::close(fd_); fd_ = -1;
    }
    freeaddrinfo(res);
    if (fd_ < 0) { perror("connect"); return false; }

    std::string hdr = "POST " + url.path + " HTTP/1.1\r\n"
                      "Host: " + url.host + ":" + url.port + "\r\n"
                      "Content-Type: multipart/form-data; boundary=" + boundary_ + "\r\n"
                      "Transfer-Encoding: chunked\r\n"
                      "\r\n";
    first_ = true;
    return send_all(hdr);
}

std::string MultipartUploader::part_header(const std::string& boundary, int64_t timestamp_ms, bool first) {
    return std::string(first ? "" : "\r\n") + "--" + boundary + "\r\n"
           "Content-Type: image/jpeg\r\n"
           "X-Client-Timestamp: " + std::to_string(timestamp_ms) + "\r\n"
           "\r\n";
}

std::string MultipartUploader::chunk(const std::string& part) {
    char size[32];
    snprintf(size, sizeof(size), "%zx\r\n", part.size());
    return size + part + "\r\n";
}

bool MultipartUploader::send_frame(const std::vector<unsigned char>& jpeg, int64_t timestamp_ms) {
    if (fd_ < 0) return false;
    std::string part = part_header(boundary_, timestamp_ms, first_);
    part.append(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
    first_ = false;
    return send_all(chunk(part));
}

int MultipartUploader::finish() {
    if (fd_ < 0) return -1;
    std::string closing = std::string(first_ ? "" : "\r\n") + "--" + boundary_ + "--\r\n";
    if (!send_all(chunk(closing) + "0\r\n\r\n")) return -1;

    // status line only; the body is a short JSON message at most
    std::string resp; char buf[512];
    while (resp.find("\r\n") == std::string::npos) {
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return -1;
        resp.append(buf, n);
    }
    int status = -1;
    if (sscanf(resp.c_str(), "HTTP/%*s %d", &status) != 1) return -1;
    return status;
}
