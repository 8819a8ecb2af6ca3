/**
 * @file upload_example.cpp
 * @brief Chunked multipart upload of a local file into an object store
 *
 * This example demonstrates:
 * - Creating a multipart upload with a custom part size
 * - Feeding it arbitrarily sized pieces read from a file
 * - Watching the persisted state advance as parts commit
 * - Completing the upload and verifying the stored object
 */

#include <kcenon/vector_transfer/vector_transfer.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::vector_transfer;

namespace {

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto parse_size(const std::string& size_str) -> uint64_t {
    size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<uint64_t>(value * 1024);
            case 'M': return static_cast<uint64_t>(value * 1024 * 1024);
            case 'G': return static_cast<uint64_t>(value * 1024 * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<uint64_t>(value);
}

/**
 * @brief Generate a deterministic payload when no input file is given
 */
auto make_test_payload(uint64_t size) -> byte_buffer {
    byte_buffer data(static_cast<size_t>(size));
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::byte>('A' + (i % 26));
    }
    return data;
}

auto read_file(const std::filesystem::path& path) -> std::optional<byte_buffer> {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::nullopt;
    }
    auto size = static_cast<size_t>(file.tellg());
    file.seekg(0);
    byte_buffer data(size);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (!file) {
        return std::nullopt;
    }
    return data;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Vector Transfer System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] [local_file]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -b, --bucket <name>     Target bucket (default: vectors)" << std::endl;
    std::cout << "  -k, --key <key>         Target key (default: file name or upload.bin)" << std::endl;
    std::cout << "  -s, --part-size <size>  Part size, e.g. 5M (default: 1M)" << std::endl;
    std::cout << "  -w, --write-size <size> Size of each send() call (default: 64K)" << std::endl;
    std::cout << "  --create-test <size>    Upload a generated payload of this size (default: 10M)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string bucket = "vectors";
    std::string key;
    uint64_t part_size = 1024 * 1024;
    uint64_t write_size = 64 * 1024;
    uint64_t test_size = 10 * 1024 * 1024;
    std::string local_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto require_value = [&](const char* name) -> bool {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                return false;
            }
            return true;
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-b" || arg == "--bucket") {
            if (!require_value("--bucket")) return 1;
            bucket = argv[i];
        } else if (arg == "-k" || arg == "--key") {
            if (!require_value("--key")) return 1;
            key = argv[i];
        } else if (arg == "-s" || arg == "--part-size") {
            if (!require_value("--part-size")) return 1;
            part_size = parse_size(argv[i]);
        } else if (arg == "-w" || arg == "--write-size") {
            if (!require_value("--write-size")) return 1;
            write_size = std::max<uint64_t>(1, parse_size(argv[i]));
        } else if (arg == "--create-test") {
            if (!require_value("--create-test")) return 1;
            test_size = parse_size(argv[i]);
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            local_path = arg;
        }
    }

    byte_buffer payload;
    if (!local_path.empty()) {
        auto data = read_file(local_path);
        if (!data) {
            std::cerr << "Error: Cannot read " << local_path << std::endl;
            return 1;
        }
        payload = std::move(*data);
        if (key.empty()) {
            key = std::filesystem::path(local_path).filename().string();
        }
    } else {
        payload = make_test_payload(test_size);
    }
    if (key.empty()) {
        key = "upload.bin";
    }

    get_logger().initialize();

    auto store = std::make_shared<memory_object_store>();

    std::cout << "Uploading " << format_bytes(payload.size()) << " to "
              << bucket << "/" << key << " in parts of " << format_bytes(part_size)
              << std::endl;

    auto created = multipart_upload::create(store, bucket, key, upload_config{part_size});
    if (!created) {
        std::cerr << "Error: " << created.error().message << std::endl;
        return 1;
    }
    auto upload = std::move(created.value());

    auto start = std::chrono::steady_clock::now();
    size_t committed_parts = 0;
    std::span<const std::byte> remaining(payload);

    while (!remaining.empty()) {
        auto piece = remaining.first(std::min<size_t>(remaining.size(), write_size));
        remaining = remaining.subspan(piece.size());

        auto sent = upload.send(piece);
        if (!sent) {
            std::cerr << "Error: " << sent.error().message << std::endl;
            return 1;
        }

        if (upload.state().parts.size() != committed_parts) {
            committed_parts = upload.state().parts.size();
            std::cout << "  part " << committed_parts << " committed, "
                      << format_bytes(upload.state().uploaded_bytes) << " durable" << std::endl;
        }
    }

    auto done = std::move(upload).complete();
    if (!done) {
        std::cerr << "Error: " << done.error().message << std::endl;
        return 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    auto stored = store->object_data(bucket, key);
    if (!stored || *stored != payload) {
        std::cerr << "Error: stored object does not match the input" << std::endl;
        return 1;
    }

    std::cout << "Upload completed in " << elapsed.count() << " ms, object verified ("
              << format_bytes(stored->size()) << ")" << std::endl;
    return 0;
}
