#ifndef QRRECEIVE_CLI_OPTIONS_HPP
#define QRRECEIVE_CLI_OPTIONS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include "../core/config.hpp"
#include "../core/transform_provider.hpp"
#include "../crypto/digest.hpp"

namespace qrreceive {
namespace cli {

// Command line options
struct CommandLineOptions {
    std::string input;              // Empty or "-": stdin
    std::string output;             // Empty: filename from the header
    std::string config_file;
    std::vector<std::string> keys;  // <id>=<hex>, or bare <hex> for the default key
    bool verbose = false;

    ReceiverConfig receiver;

    // Parses one --key value into the key store
    static Result<void> add_key(const std::string& entry, StaticKeyStore& store) {
        std::string id;
        std::string hex = entry;
        const auto eq = entry.find('=');
        if (eq != std::string::npos) {
            id = entry.substr(0, eq);
            hex = entry.substr(eq + 1);
        }
        boost::algorithm::trim(id);
        boost::algorithm::trim(hex);

        Result<std::vector<uint8_t>> key = crypto::from_hex(hex);
        if (!key) {
            return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::INVALID_CONFIGURATION,
                                   "key '" + id + "': " + key.error().message);
        }

        KeyMaterial material;
        material.key = std::move(key).value();
        store.add(id, std::move(material));
        return success();
    }
};

} // namespace cli
} // namespace qrreceive

#endif // QRRECEIVE_CLI_OPTIONS_HPP
