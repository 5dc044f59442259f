#include "line_capture.hpp"
#include "../core/protocol_codec.hpp"

#include <fstream>
#include <boost/algorithm/string.hpp>

namespace qrreceive {
namespace cli {

namespace {

std::vector<std::string> read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        boost::algorithm::trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace

LineCaptureSource::LineCaptureSource(std::string path) : path_(std::move(path)) {
    if (path_ == "-") {
        path_.clear();
    }
}

Result<std::vector<std::string>> LineCaptureSource::read_file() const {
    std::ifstream in(path_);
    if (!in) {
        return QRRECEIVE_ERROR(ErrorCategory::CAPTURE, ErrorCode::FILE_IO_ERROR,
                               "cannot open input " + path_);
    }
    return read_lines(in);
}

Result<std::vector<std::string>> LineCaptureSource::read_all(std::istream& in) {
    std::vector<std::string> lines;
    if (path_.empty()) {
        lines = read_lines(in);
    } else {
        Result<std::vector<std::string>> read = read_file();
        if (!read) {
            return read.error();
        }
        lines = std::move(read).value();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    seen_ = lines;
    return lines;
}

void LineCaptureSource::reacquire(uint32_t index, Handler handler) {
    std::vector<std::string> candidates;
    if (!path_.empty()) {
        Result<std::vector<std::string>> read = read_file();
        if (!read) {
            handler(read.error());
            return;
        }
        candidates = std::move(read).value();
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        candidates = seen_;
    }

    // Latest capture of the block wins
    for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
        Result<Envelope> parsed = ProtocolCodec::parse(*it);
        if (parsed && parsed.value().index == index) {
            handler(*it);
            return;
        }
    }

    handler(QRRECEIVE_ERROR(ErrorCategory::CAPTURE, ErrorCode::CAPTURE_FAILED,
                            "block not present in the captured input", index));
}

} // namespace cli
} // namespace qrreceive
