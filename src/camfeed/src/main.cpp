// camfeed: captures a camera with OpenCV and pushes JPEG frames to camvault
// as a streaming multipart upload.
#include "uploader.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

static std::atomic<bool> g_running{true};
static void on_signal(int) { g_running = false; }

static int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int main(int argc, char** argv) {
    std::string cameraId, url;
    int fps = 5, quality = 80, width = 1280, height = 720;
    bool verbose = false;
    try {
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help", "Produce help message")
            ("camera-id", po::value<std::string>(&cameraId),
             "Camera index or device/pipeline string (required)")
            ("url", po::value<std::string>(&url)->default_value("http://localhost:8080/stream"),
             "URL of the camvault stream endpoint")
            ("fps", po::value<int>(&fps)->default_value(5), "Frames per second to upload")
            ("quality", po::value<int>(&quality)->default_value(80), "JPEG quality")
            ("width", po::value<int>(&width)->default_value(1280), "Capture WIDTH")
            ("height", po::value<int>(&height)->default_value(720), "Capture HEIGHT")
            ("verbose", po::bool_switch(&verbose), "Print every uploaded frame")
        ;
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
        if (vm.count("help")) { std::cout << desc << std::endl; return 0; }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (cameraId.empty()) { std::cerr << "camera-id flag is required\n"; return 1; }
    if (fps <= 0) { std::cerr << "fps must be positive\n"; return 1; }

    StreamUrl target;
    if (!parse_stream_url(url, target)) { std::cerr << "Unsupported URL: " << url << "\n"; return 1; }
    const std::string streamKey = "camera_" + cameraId;
    if (target.path.empty() || target.path.back() != '/') target.path += "/";
    target.path += streamKey;
    std::cout << "Starting stream for key '" << streamKey << "' on camera " << cameraId
              << " to " << url << std::endl;

    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);

    cv::VideoCapture cap;
    bool isIndex = cameraId.find_first_not_of("0123456789") == std::string::npos;
    if (isIndex) cap.open(std::stoi(cameraId));
    else cap.open(cameraId);
    if (!cap.isOpened()) { std::cerr << "Failed to open camera " << cameraId << "\n"; return 1; }
    cap.set(cv::CAP_PROP_FRAME_WIDTH, width);
    cap.set(cv::CAP_PROP_FRAME_HEIGHT, height);

    MultipartUploader up;
    if (!up.open(target)) { std::cerr << "Failed to connect to " << url << "\n"; return 1; }

    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    const auto period = std::chrono::milliseconds(1000 / fps);
    auto next = std::chrono::steady_clock::now();
    cv::Mat frame;
    std::vector<uchar> jpeg;
    uint64_t sent = 0;

    while (g_running) {
        if (!cap.read(frame) || frame.empty()) {
            std::cerr << "Camera read failed, stopping\n";
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now < next) continue;   // drop frames above the target rate
        next = now + period;

        const int64_t ts = now_ms();
        if (!cv::imencode(".jpg", frame, jpeg, params)) continue;
        if (!up.send_frame(jpeg, ts)) { std::cerr << "Upload failed, stopping\n"; break; }
        sent++;
        if (verbose) std::cout << "frame " << ts << " (" << jpeg.size() << " bytes)" << std::endl;
    }

    int status = up.finish();
    std::cout << "Stream finished after " << sent << " frames, server status " << status << std::endl;
    return status == 200 ? 0 : 1;
}
