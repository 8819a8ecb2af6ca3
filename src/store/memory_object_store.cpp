/**
 * @file memory_object_store.cpp
 * @brief Implementation of the in-process object store
 */

#include <kcenon/vector_transfer/store/memory_object_store.h>
#include <kcenon/vector_transfer/core/logging.h>

#include <atomic>
#include <cstdio>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace kcenon::vector_transfer {

namespace {

struct stored_part {
    std::string etag;
    byte_buffer data;
};

struct open_upload {
    std::string bucket;
    std::string key;
    std::map<uint32_t, stored_part> parts;
};

auto object_path(const std::string& bucket, const std::string& key) -> std::string {
    return bucket + "/" + key;
}

}  // namespace

// ============================================================================
// memory_object_store::impl
// ============================================================================

struct memory_object_store::impl {
    memory_store_config config;

    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, byte_buffer> objects;
    std::unordered_map<std::string, open_upload> uploads;

    std::atomic<uint64_t> next_upload_id{1};
    std::atomic<uint64_t> get_calls{0};

    explicit impl(memory_store_config cfg) : config(cfg) {}
};

memory_object_store::memory_object_store(memory_store_config config)
    : impl_(std::make_unique<impl>(config)) {
}

memory_object_store::~memory_object_store() = default;

auto memory_object_store::get_object(
    const std::string& bucket,
    const std::string& key,
    const std::optional<byte_range>& range) -> result<get_object_output> {
    impl_->get_calls.fetch_add(1, std::memory_order_relaxed);

    byte_buffer body;
    {
        std::shared_lock lock(impl_->mutex);
        auto it = impl_->objects.find(object_path(bucket, key));
        if (it == impl_->objects.end()) {
            return unexpected(error{error_code::object_not_found,
                "no such key: " + object_path(bucket, key)});
        }

        const auto& data = it->second;
        uint64_t start = 0;
        uint64_t length = data.size();
        if (range) {
            if (range->start > data.size()) {
                return unexpected(error{error_code::invalid_range,
                    "range " + range->to_header() + " starts beyond object size " +
                    std::to_string(data.size())});
            }
            start = range->start;
            length = range->length_within(data.size());
        }

        auto first = data.begin() + static_cast<std::ptrdiff_t>(start);
        body.assign(first, first + static_cast<std::ptrdiff_t>(length));
    }

    transfer_log_context ctx;
    ctx.bucket = bucket;
    ctx.key = key;
    ctx.bytes = body.size();
    VT_LOG_TRACE_CTX(log_category::store,
        "GET" + (range ? " " + range->to_header() : std::string{}), ctx);

    get_object_output output;
    output.content_length = body.size();
    output.body = std::make_unique<buffered_byte_stream>(
        std::move(body), impl_->config.stream_piece_size);
    return std::move(output);
}

auto memory_object_store::create_multipart_upload(
    const std::string& bucket,
    const std::string& key) -> result<std::string> {
    if (bucket.empty() || key.empty()) {
        return unexpected(error{error_code::invalid_argument,
            "bucket and key must be non-empty"});
    }

    auto upload_id = "upload-" + std::to_string(
        impl_->next_upload_id.fetch_add(1, std::memory_order_relaxed));

    {
        std::unique_lock lock(impl_->mutex);
        impl_->uploads.emplace(upload_id, open_upload{bucket, key, {}});
    }

    transfer_log_context ctx;
    ctx.bucket = bucket;
    ctx.key = key;
    ctx.upload_id = upload_id;
    VT_LOG_DEBUG_CTX(log_category::store, "Opened multipart upload", ctx);
    return upload_id;
}

auto memory_object_store::upload_part(
    const std::string& bucket,
    const std::string& key,
    const std::string& upload_id,
    uint32_t part_number,
    byte_buffer body) -> result<std::string> {
    if (part_number == 0) {
        return unexpected(error{error_code::invalid_part, "part numbers start at 1"});
    }

    auto etag = compute_etag(body);

    std::unique_lock lock(impl_->mutex);
    auto it = impl_->uploads.find(upload_id);
    if (it == impl_->uploads.end()) {
        return unexpected(error{error_code::upload_not_found,
            "no such upload: " + upload_id});
    }
    if (it->second.bucket != bucket || it->second.key != key) {
        return unexpected(error{error_code::upload_not_found,
            "upload " + upload_id + " does not belong to " + object_path(bucket, key)});
    }

    it->second.parts[part_number] = stored_part{etag, std::move(body)};
    return etag;
}

auto memory_object_store::complete_multipart_upload(
    const std::string& bucket,
    const std::string& key,
    const std::string& upload_id,
    const std::vector<completed_part>& parts) -> result<void> {
    std::unique_lock lock(impl_->mutex);
    auto it = impl_->uploads.find(upload_id);
    if (it == impl_->uploads.end()) {
        return unexpected(error{error_code::upload_not_found,
            "no such upload: " + upload_id});
    }
    auto& upload = it->second;
    if (upload.bucket != bucket || upload.key != key) {
        return unexpected(error{error_code::upload_not_found,
            "upload " + upload_id + " does not belong to " + object_path(bucket, key)});
    }

    byte_buffer assembled;
    uint32_t previous = 0;
    for (const auto& part : parts) {
        if (part.part_number <= previous) {
            return unexpected(error{error_code::invalid_part,
                "part numbers must be ascending (got " +
                std::to_string(part.part_number) + " after " +
                std::to_string(previous) + ")"});
        }
        previous = part.part_number;

        auto stored = upload.parts.find(part.part_number);
        if (stored == upload.parts.end() || stored->second.etag != part.etag) {
            return unexpected(error{error_code::invalid_part,
                "part " + std::to_string(part.part_number) +
                " was not uploaded or its etag does not match"});
        }
        assembled.insert(assembled.end(),
                         stored->second.data.begin(), stored->second.data.end());
    }

    auto size = assembled.size();
    impl_->objects[object_path(bucket, key)] = std::move(assembled);
    impl_->uploads.erase(it);
    lock.unlock();

    transfer_log_context ctx;
    ctx.bucket = bucket;
    ctx.key = key;
    ctx.upload_id = upload_id;
    ctx.bytes = size;
    VT_LOG_DEBUG_CTX(log_category::store,
        "Completed multipart upload with " + std::to_string(parts.size()) + " parts", ctx);
    return {};
}

void memory_object_store::put_object(
    const std::string& bucket, const std::string& key, byte_buffer data) {
    std::unique_lock lock(impl_->mutex);
    impl_->objects[object_path(bucket, key)] = std::move(data);
}

auto memory_object_store::object_data(
    const std::string& bucket, const std::string& key) const -> std::optional<byte_buffer> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->objects.find(object_path(bucket, key));
    if (it == impl_->objects.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto memory_object_store::pending_upload_count() const -> std::size_t {
    std::shared_lock lock(impl_->mutex);
    return impl_->uploads.size();
}

auto memory_object_store::uploaded_part_count(const std::string& upload_id) const
    -> std::size_t {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->uploads.find(upload_id);
    return it == impl_->uploads.end() ? 0 : it->second.parts.size();
}

auto memory_object_store::get_object_calls() const -> uint64_t {
    return impl_->get_calls.load(std::memory_order_relaxed);
}

auto memory_object_store::compute_etag(const byte_buffer& body) -> std::string {
    // FNV-1a, 64 bit
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (auto b : body) {
        hash ^= static_cast<uint64_t>(b);
        hash *= 0x100000001b3ULL;
    }

    char buf[40];
    std::snprintf(buf, sizeof(buf), "\"%016llx-%zu\"",
                  static_cast<unsigned long long>(hash), body.size());
    return buf;
}

}  // namespace kcenon::vector_transfer
