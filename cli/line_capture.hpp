#ifndef QRRECEIVE_LINE_CAPTURE_HPP
#define QRRECEIVE_LINE_CAPTURE_HPP

#include <cstdint>
#include <istream>
#include <mutex>
#include <string>
#include <vector>
#include "../core/retry_coordinator.hpp"

namespace qrreceive {
namespace cli {

/**
 * @brief Capture source over decoded envelope strings, one per line
 *
 * Re-acquisition re-reads the input file when there is one (a scanner may
 * still be appending to it); for stdin it searches the lines read so far.
 */
class LineCaptureSource : public CaptureSource {
public:
    explicit LineCaptureSource(std::string path);

    // Reads every line from the file, or from in when there is no path
    Result<std::vector<std::string>> read_all(std::istream& in);

    void reacquire(uint32_t index, Handler handler) override;

private:
    Result<std::vector<std::string>> read_file() const;

    std::string path_;
    std::mutex mutex_;
    std::vector<std::string> seen_;
};

} // namespace cli
} // namespace qrreceive

#endif // QRRECEIVE_LINE_CAPTURE_HPP
