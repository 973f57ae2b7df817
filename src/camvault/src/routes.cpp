#include "routes.hpp"
#include "frame_retriever.hpp"
#include "multipart.hpp"
#include "transcoder.hpp"
#include "utils.hpp"

#include <jsoncpp/json/json.h>
#include <signal.h>

// Ignore SIGPIPE globally to avoid crashes when a client or ffmpeg goes away
struct SigPipeIgnore {
    SigPipeIgnore() { signal(SIGPIPE, SIG_IGN); }
} _sigpipe_ignore;

// --- helpers ---
static void json_reply(HttpResponse& res, int status, const Json::Value& v) {
    Json::StreamWriterBuilder b; b["indentation"] = "";
    res.status = status;
    res.headers["Content-Type"] = "application/json; charset=utf-8";
    res.body = Json::writeString(b, v);
}

static void json_error(HttpResponse& res, int status, const std::string& msg) {
    Json::Value v;
    v["error"] = msg;
    json_reply(res, status, v);
}

static void handle_stream(const ServiceOptions& opts, ActiveStreams& active,
                          const HttpRequest& req, HttpResponse& res) {
    auto it = req.params.find("stream_name");
    const std::string stream = it == req.params.end() ? std::string() : it->second;
    if (stream.empty()) { json_error(res, 400, "stream_name is required"); return; }
    if (!valid_stream_name(stream)) { json_error(res, 400, "invalid stream_name"); return; }

    std::string boundary;
    const std::string* ct = req.header("content-type");
    if (!ct || !parse_multipart_boundary(*ct, boundary)) {
        json_error(res, 400, "invalid Content-Type, must be multipart/*");
        return;
    }

    if (!active.acquire(stream)) {
        json_error(res, 409, "stream is already being ingested");
        return;
    }
    struct Release {
        ActiveStreams& a; const std::string& s;
        ~Release() { a.release(s); }
    } release{active, stream};

    // Create directories for the streams and clean up old ones
    const std::string jpeg_dir = opts.jpeg_dir(stream);
    const std::string hls_dir = opts.hls_dir(stream);
    if (!reset_dir(jpeg_dir)) { json_error(res, 500, "could not create JPEG stream directory"); return; }
    if (!reset_dir(hls_dir)) { json_error(res, 500, "could not create HLS stream directory"); return; }

    FfmpegTranscoder ffmpeg(opts.ffmpeg_bin, hls_dir, opts.verbose);
    if (!ffmpeg.start()) {
        log_msg("Failed to start ffmpeg for %s", stream.c_str());
        json_error(res, 500, "failed to start ffmpeg");
        return;
    }

    CancelToken cancel;
    cancel.link_to(*req.cancel);

    IngestSession session(stream, jpeg_dir, opts.handoff_capacity, opts.window_ms, ffmpeg, cancel);
    session.start();
    MultipartFrameSource source(*req.body, boundary);
    session.dispatch(source);
    // A broken upload means the client is gone: stop ffmpeg instead of letting it drain.
    if (req.body->failed()) cancel.cancel();
    session.finish();

    res.status = 200;
}

static void handle_image(const ServiceOptions& opts, const HttpRequest& req, HttpResponse& res) {
    const std::string& stream = req.params.at("stream_name");
    int64_t ts = 0;
    if (!parse_millis(req.params.at("timestamp"), ts)) {
        json_error(res, 400, "Invalid timestamp format");
        return;
    }
    if (!valid_stream_name(stream)) { json_error(res, 400, "invalid stream_name"); return; }

    FrameRetriever retriever(opts.data_root + "/" + cfg::JPEG_SUBDIR);
    auto r = retriever.find(stream, ts);
    switch (r.status) {
    case FrameRetriever::Status::Found:
        res.status = 200;
        res.headers["Content-Type"] = "image/jpeg";
        res.body.assign(r.jpeg.begin(), r.jpeg.end());
        break;
    case FrameRetriever::Status::NotFound:
        json_error(res, 404, r.message);
        break;
    case FrameRetriever::Status::ReadError:
        json_error(res, 500, r.message);
        break;
    }
}

// --- register routes ---
void register_routes(HttpServer& srv, const ServiceOptions& opts, ActiveStreams& active) {
    srv.add_route("GET","/health",[](int, const HttpRequest&, HttpResponse& res){
        Json::Value v;
        v["status"] = "ok";
        json_reply(res, 200, v);
    });

    srv.add_route("POST","/stream/:stream_name",[&opts, &active](int, const HttpRequest& req, HttpResponse& res){
        handle_stream(opts, active, req, res);
    });

    srv.add_route("GET","/image/:stream_name/:timestamp",[&opts](int, const HttpRequest& req, HttpResponse& res){
        handle_image(opts, req, res);
    });
}
