#include "config.hpp"
#include "http_server.hpp"
#include "ingest_session.hpp"
#include "routes.hpp"
#include "utils.hpp"

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include <csignal>
#include <iostream>

int main(int argc, char** argv){
    ServiceOptions opts;
    try {
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help", "Produce help message")
            ("port", po::value<int>(&opts.port)->default_value(cfg::SERVER_PORT),
             "Listen for HTTP on PORT")
            ("data-root", po::value<std::string>(&opts.data_root)->default_value(cfg::DATA_ROOT),
             "Store archives under PATH/jpeg and HLS output under PATH/hls")
            ("window-ms", po::value<int64_t>(&opts.window_ms)->default_value(cfg::ARCHIVE_WINDOW_MS),
             "Start a new archive segment every MS milliseconds")
            ("handoff-capacity", po::value<std::size_t>(&opts.handoff_capacity)->default_value(cfg::HANDOFF_CAPACITY),
             "Frames buffered between upload and archive writer before dropping")
            ("ffmpeg", po::value<std::string>(&opts.ffmpeg_bin)->default_value(cfg::FFMPEG_BIN),
             "ffmpeg executable")
            ("verbose", po::bool_switch(&opts.verbose), "Enable verbose ffmpeg logs.")
        ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (opts.window_ms <= 0 || opts.handoff_capacity == 0) {
        std::cerr << "Error: --window-ms and --handoff-capacity must be positive" << std::endl;
        return 1;
    }
    set_verbose(opts.verbose);
    log_msg("Starting camvault");

    if (!ensure_dir(opts.data_root + "/" + cfg::JPEG_SUBDIR) ||
        !ensure_dir(opts.data_root + "/" + cfg::HLS_SUBDIR)) {
        std::cerr << "Failed to create data directories under " << opts.data_root << "\n";
        return 1;
    }

    // Blocked before any thread exists so every thread inherits the mask
    // and the signals wait for sigwait() below.
    sigset_t stop_signals;
    if (!block_signals({SIGINT, SIGTERM}, stop_signals)) return 1;

    ActiveStreams active;
    HttpServer srv;
    register_routes(srv, opts, active);
    if (!srv.start(opts.port)) {
        std::cerr << "Failed to start HTTP server\n"; return 1;
    }

    int sig = wait_for_signal(stop_signals);
    log_msg("Shutting down on signal %d, finalizing open streams", sig);
    srv.stop();
    return 0;
}
