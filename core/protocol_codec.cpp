#include "protocol_codec.hpp"
#include "../crypto/digest.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace qrreceive {

namespace pt = boost::property_tree;

namespace {

constexpr char FMT_V2[] = "qrfile/v2";
constexpr char FMT_V1[] = "qrfile/v1";

ErrorInfo malformed(const std::string& message) {
    return QRRECEIVE_ERROR(ErrorCategory::PROTOCOL, ErrorCode::MALFORMED_ENVELOPE, message);
}

// Integer field within [min, max]; JSON numbers arrive as their literal text
std::optional<int64_t> read_integer(const pt::ptree& tree, const std::string& key,
                                    int64_t min, int64_t max) {
    auto value = tree.get_optional<int64_t>(key);
    if (!value || *value < min || *value > max) {
        return std::nullopt;
    }
    return *value;
}

// Like read_integer, but an absent field is empty rather than invalid
Result<std::optional<int64_t>> read_optional_integer(const pt::ptree& tree, const std::string& key,
                                                     int64_t min, int64_t max) {
    if (!tree.get_child_optional(key)) {
        return std::optional<int64_t>();
    }
    auto value = read_integer(tree, key, min, max);
    if (!value) {
        return malformed("invalid " + key);
    }
    return value;
}

Result<Envelope> decode_payload(Envelope envelope, const std::string& text) {
    Result<std::vector<uint8_t>> decoded = crypto::base64_decode(text);
    if (!decoded) {
        ErrorInfo error = decoded.error();
        error.block_index = envelope.index;
        return error;
    }
    envelope.payload = std::move(decoded).value();
    return envelope;
}

Result<void> read_transforms(const pt::ptree& tree, TransformMetadata& transforms) {
    if (tree.get<bool>("rs_enabled", false)) {
        auto total = read_optional_integer(tree, "rs_total", 1, 255);
        auto data = read_optional_integer(tree, "rs_data", 1, 255);
        auto parity = read_optional_integer(tree, "rs_parity", 0, 254);
        auto blocks = read_optional_integer(tree, "rs_blocks", 0, std::numeric_limits<uint32_t>::max());
        for (const auto* field : {&total, &data, &parity, &blocks}) {
            if (!*field) {
                return field->error();
            }
        }

        FecParameters fec;
        fec.total_symbols = static_cast<uint32_t>(total.value().value_or(255));
        if (data.value()) {
            fec.data_symbols = static_cast<uint32_t>(*data.value());
        } else if (parity.value() && *parity.value() < fec.total_symbols) {
            fec.data_symbols = fec.total_symbols - static_cast<uint32_t>(*parity.value());
        }
        fec.blocks = static_cast<uint32_t>(blocks.value().value_or(0));
        transforms.fec = fec;
    }

    if (tree.get<bool>("encryption_enabled", false)) {
        EncryptionParameters encryption;
        encryption.algorithm = tree.get<std::string>("encryption_algorithm", "aes-256-gcm");
        encryption.key_ref = tree.get<std::string>("encryption_key_id", "");
        transforms.encryption = encryption;
    }

    auto compression = tree.get_optional<std::string>("compression_algorithm");
    if (compression && !compression->empty()) {
        CompressionParameters params;
        params.algorithm = *compression;
        if (auto ratio = tree.get_optional<double>("compression_ratio")) {
            params.ratio = *ratio;
        }
        transforms.compression = params;
    }
    return success();
}

Result<Envelope> parse_json(const std::string& text) {
    pt::ptree tree;
    try {
        std::istringstream stream(text);
        pt::read_json(stream, tree);
    } catch (const pt::json_parser_error& e) {
        return malformed(std::string("invalid JSON: ") + e.message());
    }

    auto fmt = tree.get_optional<std::string>("fmt");
    if (!fmt) {
        return malformed("missing fmt tag");
    }

    Envelope envelope;
    if (*fmt == FMT_V2) {
        envelope.format = WireFormat::QRFILE_V2;
    } else if (*fmt == FMT_V1) {
        envelope.format = WireFormat::QRFILE_V1;
    } else {
        return malformed("unsupported fmt tag '" + *fmt + "'");
    }

    auto data = tree.get_optional<std::string>("data_b64");
    if (!data) {
        return malformed("missing data_b64");
    }

    try {
        auto index = read_integer(tree, "index", 0, std::numeric_limits<uint32_t>::max());
        if (!index) {
            return malformed("missing or invalid index");
        }
        auto total = read_integer(tree, "total", 1, std::numeric_limits<uint32_t>::max());
        if (!total) {
            return malformed("missing or invalid total");
        }
        envelope.index = static_cast<uint32_t>(*index);
        envelope.total = static_cast<uint32_t>(*total);

        envelope.filename = tree.get<std::string>("name", "");
        auto size = read_optional_integer(tree, "size", 0, std::numeric_limits<int64_t>::max());
        if (!size) {
            return size.error();
        }
        envelope.file_size = static_cast<uint64_t>(size.value().value_or(0));

        if (envelope.format == WireFormat::QRFILE_V2) {
            envelope.chunk_hash = tree.get<std::string>("chunk_sha256", "");
            envelope.file_hash = tree.get<std::string>("file_sha256", "");
            Result<void> transforms = read_transforms(tree, envelope.transforms);
            if (!transforms) {
                return transforms.error();
            }
        } else {
            envelope.chunk_hash = tree.get<std::string>("chunk_hash", "");
        }
    } catch (const pt::ptree_bad_data& e) {
        return malformed(std::string("invalid field value: ") + e.what());
    }

    return decode_payload(std::move(envelope), *data);
}

// F:<name>:I:<index>:T:<total>:D:<base64>; the name may not contain ':'
Result<Envelope> parse_simple(const std::string& text) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (parts.size() < 7 && std::getline(stream, part, ':')) {
        parts.push_back(part);
    }
    std::string data;
    std::getline(stream, data, '\0');

    if (parts.size() < 7 || parts[0] != "F" || parts[2] != "I" ||
        parts[4] != "T" || parts[6] != "D") {
        return malformed("invalid simple format structure");
    }

    auto to_u32 = [](const std::string& s) -> std::optional<uint32_t> {
        if (s.empty() || s.size() > 10 ||
            !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        const unsigned long long v = std::stoull(s);
        if (v > std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(v);
    };

    auto index = to_u32(parts[3]);
    auto total = to_u32(parts[5]);
    if (!index || !total || *total == 0) {
        return malformed("invalid index or total in simple format");
    }

    Envelope envelope;
    envelope.format = WireFormat::SIMPLE;
    envelope.filename = parts[1];
    envelope.index = *index;
    envelope.total = *total;
    return decode_payload(std::move(envelope), data);
}

} // namespace

std::string wire_format_tag(WireFormat format) {
    switch (format) {
        case WireFormat::QRFILE_V2: return FMT_V2;
        case WireFormat::QRFILE_V1: return FMT_V1;
        case WireFormat::SIMPLE: return "simple";
    }
    return "unknown";
}

Result<Envelope> ProtocolCodec::parse(const std::string& raw) {
    const std::string text = boost::algorithm::trim_copy(raw);
    if (text.empty()) {
        return malformed("empty envelope");
    }
    if (text.front() == '{') {
        return parse_json(text);
    }
    if (text.compare(0, 2, "F:") == 0) {
        return parse_simple(text);
    }
    return malformed("unrecognized envelope format");
}

std::string ProtocolCodec::serialize(const Envelope& envelope) {
    const std::string payload = crypto::base64_encode(envelope.payload);

    if (envelope.format == WireFormat::SIMPLE) {
        return "F:" + envelope.filename + ":I:" + std::to_string(envelope.index) +
               ":T:" + std::to_string(envelope.total) + ":D:" + payload;
    }

    pt::ptree tree;
    tree.put("fmt", wire_format_tag(envelope.format));
    tree.put("index", envelope.index);
    tree.put("total", envelope.total);
    tree.put("data_b64", payload);
    tree.put("name", envelope.filename);
    tree.put("size", envelope.file_size);

    if (envelope.format == WireFormat::QRFILE_V1) {
        tree.put("chunk_hash", envelope.chunk_hash);
    } else {
        tree.put("chunk_sha256", envelope.chunk_hash);
        tree.put("file_sha256", envelope.file_hash);

        const TransformMetadata& t = envelope.transforms;
        if (t.compression) {
            tree.put("compression_algorithm", t.compression->algorithm);
            if (t.compression->ratio) {
                tree.put("compression_ratio", *t.compression->ratio);
            }
        }
        if (t.encryption) {
            tree.put("encryption_enabled", true);
            tree.put("encryption_algorithm", t.encryption->algorithm);
            if (!t.encryption->key_ref.empty()) {
                tree.put("encryption_key_id", t.encryption->key_ref);
            }
        }
        if (t.fec) {
            tree.put("rs_enabled", true);
            tree.put("rs_total", t.fec->total_symbols);
            tree.put("rs_data", t.fec->data_symbols);
            tree.put("rs_parity", t.fec->parity_symbols());
            tree.put("rs_blocks", t.fec->blocks);
        }
    }

    std::ostringstream out;
    pt::write_json(out, tree, false);
    std::string text = out.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace qrreceive
