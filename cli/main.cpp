#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include "../core/block_storage.hpp"
#include "../core/receiver_session.hpp"
#include "../core/transform_provider.hpp"
#include "line_capture.hpp"
#include "options.hpp"

using namespace qrreceive;
namespace po = boost::program_options;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_INCOMPLETE = 2,
    EXIT_PROCESSING = 3
};

// Parses command line arguments; config file values are loaded first, flags override them
bool parse_arguments(int argc, char** argv, cli::CommandLineOptions& options) {
    size_t memory_threshold = 0;
    uint32_t max_retries = 0;
    std::string spill_dir;

    po::options_description desc("qrreceive - reconstruct a file from captured optical-code blocks\nOptions");
    desc.add_options()
        ("help,h", "Show this help")
        ("input,i", po::value<std::string>(&options.input)->default_value("-"),
         "File with one captured envelope per line, '-' for stdin")
        ("output,o", po::value<std::string>(&options.output),
         "Output path (default: filename from the header block)")
        ("config,c", po::value<std::string>(&options.config_file),
         "INI configuration file with [chunk_store], [retry] and [pipeline] sections")
        ("spill-dir", po::value<std::string>(&spill_dir),
         "Directory for durable block storage")
        ("key,k", po::value<std::vector<std::string>>(&options.keys)->composing(),
         "Decryption key as <id>=<hex>; a bare <hex> sets the default key")
        ("memory-threshold", po::value<size_t>(&memory_threshold),
         "Bytes buffered in memory before spilling to durable storage")
        ("max-retries", po::value<uint32_t>(&max_retries),
         "Re-acquisition attempts per block")
        ("verbose,v", po::bool_switch(&options.verbose)->default_value(false),
         "Verbose logging")
    ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error parsing command line: " << e.what() << std::endl;
        return false;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        std::exit(EXIT_OK);
    }

    if (!options.config_file.empty()) {
        Result<void> loaded = load_config_file(options.config_file, options.receiver);
        if (!loaded) {
            report_error(loaded.error());
            return false;
        }
    }

    if (vm.count("spill-dir")) {
        options.receiver.chunk_store.spill_directory = spill_dir;
    }
    if (vm.count("memory-threshold")) {
        options.receiver.chunk_store.memory_threshold_bytes = memory_threshold;
    }
    if (vm.count("max-retries")) {
        options.receiver.retry.max_retries = max_retries;
    }

    Result<void> valid = options.receiver.validate();
    if (!valid) {
        report_error(valid.error());
        return false;
    }
    return true;
}

bool write_output(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char** argv) {
    cli::CommandLineOptions options;
    if (!parse_arguments(argc, argv, options)) {
        return EXIT_USAGE;
    }
    ErrorManager::instance().set_verbose(options.verbose);

    StaticKeyStore keys;
    for (const std::string& entry : options.keys) {
        Result<void> added = cli::CommandLineOptions::add_key(entry, keys);
        if (!added) {
            report_error(added.error());
            return EXIT_USAGE;
        }
    }

    cli::LineCaptureSource capture(options.input);
    Result<std::vector<std::string>> lines = capture.read_all(std::cin);
    if (!lines) {
        report_error(lines.error());
        return EXIT_USAGE;
    }

    std::shared_ptr<DurableStore> durable;
    if (!options.receiver.chunk_store.spill_directory.empty()) {
        durable = std::make_shared<FileDurableStore>(options.receiver.chunk_store.spill_directory);
    }

    boost::asio::io_context io_context;
    PlatformTransformProvider provider(options.receiver.pipeline.max_decompressed_bytes);
    ReceiverSession session(io_context, options.receiver, capture, provider, keys, durable);

    int exit_code = EXIT_INCOMPLETE;
    ReceiverSession::Handlers handlers;

    handlers.on_transfer_started = [](const TransferInfo& info) {
        std::cout << "Receiving '" << info.filename << "': " << info.total_blocks << " blocks, "
                  << info.file_size << " bytes" << std::endl;
    };
    handlers.on_progress = [&options](const ChunkProgress& progress) {
        if (options.verbose) {
            std::cout << "Progress: " << progress.received << "/" << progress.total << std::endl;
        }
    };
    handlers.on_block_failed = [](uint32_t index, const ErrorInfo&) {
        std::cerr << "Block " << index << " could not be recovered" << std::endl;
    };
    handlers.on_stalled = [&](const std::vector<uint32_t>& failed) {
        std::cerr << "Giving up: " << failed.size() << " block(s) permanently missing" << std::endl;
        exit_code = EXIT_INCOMPLETE;
        session.stop();
        io_context.stop();
    };
    handlers.on_complete = [&](const Result<ReconstructedFile>& result) {
        session.stop();
        io_context.stop();

        if (!result) {
            std::cerr << "Reconstruction failed: " << result.error().to_string() << std::endl;
            exit_code = EXIT_PROCESSING;
            return;
        }

        const ReconstructedFile& file = result.value();
        const std::string path = !options.output.empty() ? options.output
                               : !file.filename.empty() ? file.filename
                               : std::string("qrreceive.out");
        if (!write_output(path, file.bytes)) {
            QRRECEIVE_REPORT(ErrorCategory::STORAGE, ErrorCode::FILE_IO_ERROR, "cannot write " + path);
            exit_code = EXIT_PROCESSING;
            return;
        }

        std::cout << "Wrote " << file.bytes.size() << " bytes to " << path;
        if (file.hash_verified) {
            std::cout << (*file.hash_verified ? " (hash verified)" : " (HASH MISMATCH)");
        }
        if (file.fec.corrected_symbols > 0 || file.fec.uncorrectable_blocks > 0) {
            std::cout << ", FEC corrected " << file.fec.corrected_symbols << " symbols, "
                      << file.fec.uncorrectable_blocks << " uncorrectable blocks";
        }
        std::cout << std::endl;
        exit_code = EXIT_OK;
    };
    session.set_handlers(std::move(handlers));

    // Nothing else runs yet, so blocks are processed directly before the event loop starts
    for (const std::string& line : lines.value()) {
        if (!session.handle_block(line)) {
            log_info("skipped line: " + line.substr(0, 40));
        }
    }

    if (!session.store().has_transfer()) {
        std::cerr << "No header block found in the input" << std::endl;
        return EXIT_INCOMPLETE;
    }

    session.start();
    io_context.run();

    const std::vector<uint32_t> missing = session.store().missing();
    if (exit_code == EXIT_INCOMPLETE && !missing.empty()) {
        std::cerr << missing.size() << " of " << session.store().progress().total
                  << " blocks missing" << std::endl;
    }
    return exit_code;
}
