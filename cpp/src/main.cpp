#include "umpcore/base64.hpp"
#include "umpcore/cli_colors.hpp"
#include "umpcore/compression.hpp"
#include "umpcore/config.hpp"
#include "umpcore/errors.hpp"
#include "umpcore/file_io.hpp"
#include "umpcore/log.hpp"
#include "umpcore/onesie.hpp"
#include "umpcore/reader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using umpcore::Bytes;

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  umpcore_cli dump <file> [--key <base64>] [--lenient] [--raw] [--chunk-size <n>] [--out-dir <dir>] [--no-color]\n";
    std::cout << "  umpcore_cli seal <file> --key <base64> [--compress]\n";
    std::cout << "  umpcore_cli open <file> --key <base64> --iv <base64> --hmac <base64> [--compression gzip|brotli|none]\n";
}

struct DumpArgs {
    std::string input;
    std::optional<Bytes> key;
    bool lenient = false;
    bool raw = false;
    std::size_t chunk_size = 0;
    std::string out_dir;
};

struct SealArgs {
    std::string input;
    Bytes key;
    bool compress = false;
};

struct OpenArgs {
    std::string input;
    Bytes key;
    Bytes iv;
    Bytes hmac;
    std::string compression = "gzip";
};

const char* RequireValue(int argc, char** argv, int idx, const char* what) {
    if (idx + 1 >= argc) {
        throw std::runtime_error(std::string("Missing ") + what + " value");
    }
    return argv[idx + 1];
}

DumpArgs ParseDumpArgs(int argc, char** argv, int start_index) {
    DumpArgs opts;
    if (start_index >= argc) {
        throw std::runtime_error("Missing input path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--key" || flag == "-k") {
            opts.key = umpcore::base64::DecodeOrThrow(RequireValue(argc, argv, idx, "key"), "--key");
            idx += 2;
        } else if (flag == "--lenient") {
            opts.lenient = true;
            idx += 1;
        } else if (flag == "--raw") {
            opts.raw = true;
            idx += 1;
        } else if (flag == "--chunk-size") {
            opts.chunk_size = static_cast<std::size_t>(std::stoul(RequireValue(argc, argv, idx, "chunk size")));
            if (opts.chunk_size == 0) {
                throw std::runtime_error("Chunk size must be positive");
            }
            idx += 2;
        } else if (flag == "--out-dir" || flag == "-o") {
            opts.out_dir = RequireValue(argc, argv, idx, "output directory");
            idx += 2;
        } else if (flag == "--no-color") {
            umpcore::cli::SetColorsEnabled(false);
            idx += 1;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

SealArgs ParseSealArgs(int argc, char** argv, int start_index) {
    SealArgs opts;
    if (start_index >= argc) {
        throw std::runtime_error("Missing input path");
    }
    opts.input = argv[start_index];
    bool have_key = false;
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--key" || flag == "-k") {
            opts.key = umpcore::base64::DecodeOrThrow(RequireValue(argc, argv, idx, "key"), "--key");
            have_key = true;
            idx += 2;
        } else if (flag == "--compress") {
            opts.compress = true;
            idx += 1;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    if (!have_key) {
        throw std::runtime_error("--key is required for seal");
    }
    return opts;
}

OpenArgs ParseOpenArgs(int argc, char** argv, int start_index) {
    OpenArgs opts;
    if (start_index >= argc) {
        throw std::runtime_error("Missing input path");
    }
    opts.input = argv[start_index];
    bool have_key = false;
    bool have_iv = false;
    bool have_hmac = false;
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--key" || flag == "-k") {
            opts.key = umpcore::base64::DecodeOrThrow(RequireValue(argc, argv, idx, "key"), "--key");
            have_key = true;
            idx += 2;
        } else if (flag == "--iv") {
            opts.iv = umpcore::base64::DecodeOrThrow(RequireValue(argc, argv, idx, "iv"), "--iv");
            have_iv = true;
            idx += 2;
        } else if (flag == "--hmac") {
            opts.hmac = umpcore::base64::DecodeOrThrow(RequireValue(argc, argv, idx, "hmac"), "--hmac");
            have_hmac = true;
            idx += 2;
        } else if (flag == "--compression") {
            opts.compression = RequireValue(argc, argv, idx, "compression");
            if (opts.compression != "gzip" && opts.compression != "brotli" && opts.compression != "none") {
                throw std::runtime_error("Unknown compression: " + opts.compression);
            }
            idx += 2;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    if (!have_key || !have_iv || !have_hmac) {
        throw std::runtime_error("--key, --iv and --hmac are required for open");
    }
    return opts;
}

std::string Describe(const umpcore::OnesieHeader& header) {
    std::ostringstream line;
    line << umpcore::OnesieHeaderTypeName(header.type);
    if (!header.video_id.empty()) {
        line << " video=" << header.video_id;
    }
    if (!header.itag.empty()) {
        line << " itag=" << header.itag;
    }
    return line.str();
}

std::string Describe(const umpcore::Event& event) {
    using namespace umpcore;
    std::ostringstream line;
    line << cli::Cyan(PartTypeName(event.part_type)) << " ";
    if (const auto* opaque = event.As<OpaquePart>()) {
        line << opaque->payload.size() << " bytes";
    } else if (const auto* onesie = event.As<OnesieHeaderEvent>()) {
        line << Describe(onesie->header);
        if (onesie->awaiting_data) {
            line << cli::Dim(" (awaiting data)");
        }
    } else if (const auto* player = event.As<PlayerResponse>()) {
        line << "player response HTTP " << player->response.http_status << ", "
             << player->response.body.size() << " bytes";
    } else if (const auto* part = event.As<InnertubeResponsePart>()) {
        line << "innertube response part " << part->plaintext.size() << " bytes";
    } else if (const auto* key = event.As<MediaKeyUpdate>()) {
        line << "media key " << key->key_size << " bytes";
    } else if (const auto* failure = event.As<UpstreamFailure>()) {
        line << cli::Yellow("upstream failure") << " proxy status " << failure->proxy_status
             << ", HTTP " << failure->http_status << ": "
             << std::string(failure->body.begin(), failure->body.end());
    } else if (const auto* media = event.As<MediaHeaderEvent>()) {
        line << "id=" << media->header.header_id;
        if (!media->header.video_id.empty()) {
            line << " video=" << media->header.video_id;
        }
        if (media->header.itag) {
            line << " itag=" << *media->header.itag;
        }
        if (media->header.is_init_segment) {
            line << " init";
        }
        if (media->header.IsGzip()) {
            line << " gzip";
        }
        if (!media->opened) {
            line << cli::Dim(" (update)");
        }
    } else if (const auto* chunk = event.As<MediaChunk>()) {
        line << "id=" << chunk->header_id << " " << chunk->data.size() << " bytes";
        if (chunk->encrypted) {
            line << cli::Dim(" (decrypted)");
        }
    } else if (const auto* end = event.As<MediaEnd>()) {
        line << "id=" << end->header_id << " total " << end->total_bytes << " bytes";
        if (end->failed) {
            line << " " << cli::Red("failed");
        } else {
            line << " " << cli::Green("complete");
        }
    }
    return line.str();
}

int RunDump(const DumpArgs& opts) {
    umpcore::Config config = umpcore::Config::FromEnv();
    config.lenient = config.lenient || opts.lenient;
    if (opts.raw) {
        config.continuation = umpcore::ContinuationFraming::kRaw;
    }
    if (opts.chunk_size > 0) {
        config.chunk_size = opts.chunk_size;
    }
    umpcore::log::SetThreshold(config.log_level);
    if (!opts.out_dir.empty() && !config.retain_media) {
        umpcore::log::Warn("media retention is disabled, nothing will be written to " + opts.out_dir);
    }
    config.retain_media = config.retain_media && !opts.out_dir.empty();

    std::ifstream input(opts.input, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + opts.input);
    }
    if (!opts.out_dir.empty()) {
        std::filesystem::create_directories(opts.out_dir);
    }

    umpcore::StreamChunkSource source(input, config.chunk_size);
    umpcore::UmpReader reader(source, config, opts.key ? &*opts.key : nullptr);
    std::size_t events = 0;
    std::map<std::uint32_t, std::size_t> written;
    while (auto event = reader.Next()) {
        std::cout << Describe(*event) << "\n";
        ++events;
        // Finalized streams are written as they complete so none outlive their MEDIA_END.
        while (auto media = reader.PollMedia()) {
            if (!config.retain_media) {
                continue;
            }
            std::uint32_t id = media->header.header_id;
            std::filesystem::path out = std::filesystem::path(opts.out_dir)
                / ("media_" + std::to_string(id) + "_" + std::to_string(written[id]++) + ".bin");
            umpcore::WriteFile(out.string(), media->data);
            std::cout << umpcore::cli::Green("wrote") << " " << out.string() << " (" << media->data.size()
                      << " bytes)\n";
        }
    }

    std::cout << umpcore::cli::Dim(std::to_string(events) + " events") << "\n";
    if (reader.OpenStreams() > 0) {
        umpcore::log::Warn(std::to_string(reader.OpenStreams()) + " media stream(s) left without MEDIA_END");
    }
    return 0;
}

int RunSeal(const SealArgs& opts) {
    Bytes plaintext = umpcore::ReadFile(opts.input);
    umpcore::onesie::SealedPayload sealed = umpcore::onesie::SealRequest(opts.key, plaintext, opts.compress);
    std::cout << "ciphertext: " << umpcore::base64::Encode(sealed.ciphertext) << "\n";
    std::cout << "iv: " << umpcore::base64::Encode(sealed.iv) << "\n";
    std::cout << "hmac: " << umpcore::base64::Encode(sealed.hmac) << "\n";
    return 0;
}

int RunOpen(const OpenArgs& opts) {
    Bytes ciphertext = umpcore::ReadFile(opts.input);
    Bytes plaintext = umpcore::onesie::Open(opts.key, ciphertext, opts.iv, opts.hmac);
    if (opts.compression == "gzip") {
        plaintext = umpcore::compression::GzipDecompress(plaintext);
    } else if (opts.compression == "brotli") {
        plaintext = umpcore::compression::BrotliDecompress(plaintext);
    }
    std::cout.write(reinterpret_cast<const char*>(plaintext.data()), static_cast<std::streamsize>(plaintext.size()));
    std::cout.flush();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "dump") {
            return RunDump(ParseDumpArgs(argc, argv, 2));
        }
        if (command == "seal") {
            return RunSeal(ParseSealArgs(argc, argv, 2));
        }
        if (command == "open") {
            return RunOpen(ParseOpenArgs(argc, argv, 2));
        }
        PrintUsage();
        return 2;
    } catch (const umpcore::UmpError& exc) {
        std::cerr << umpcore::cli::BoldRed("Error", std::cerr) << " (" << umpcore::ErrorKindName(exc.kind())
                  << "): " << exc.what() << "\n";
        return 1;
    } catch (const std::exception& exc) {
        std::cerr << umpcore::cli::BoldRed("Error", std::cerr) << ": " << exc.what() << "\n";
        return 1;
    }
}
