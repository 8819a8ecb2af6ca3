// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if VECTOR_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::vector_transfer {

/**
 * @brief Log categories for vector transfer system
 */
struct log_category {
    static constexpr std::string_view download = "vector_transfer.download";
    static constexpr std::string_view upload = "vector_transfer.upload";
    static constexpr std::string_view chunker = "vector_transfer.chunker";
    static constexpr std::string_view prefetch = "vector_transfer.prefetch";
    static constexpr std::string_view state = "vector_transfer.state";
    static constexpr std::string_view store = "vector_transfer.store";
};

/**
 * @brief Log levels for vector transfer system
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for masking object keys and upload ids in logs
 *
 * Object keys often encode tenant or dataset names; upload ids are
 * bearer-like handles for an open multipart upload.
 */
struct masking_config {
    bool mask_keys = false;
    bool mask_upload_ids = false;
    char mask_char = '*';
    std::size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, '*', 4};
    }
};

/**
 * @brief Masks identifiers according to a masking_config
 */
class identifier_masker {
public:
    explicit identifier_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask an object key, keeping the leading characters of its last segment
     */
    [[nodiscard]] auto mask_key(const std::string& key) const -> std::string {
        if (!config_.mask_keys || key.empty()) {
            return key;
        }
        auto last_sep = key.find_last_of('/');
        std::string prefix;
        std::string leaf = key;
        if (last_sep != std::string::npos) {
            prefix = std::string(last_sep, config_.mask_char) + "/";
            leaf = key.substr(last_sep + 1);
        }
        return prefix + keep_leading(leaf);
    }

    /**
     * @brief Mask a multipart upload id
     */
    [[nodiscard]] auto mask_upload_id(const std::string& upload_id) const -> std::string {
        if (!config_.mask_upload_ids) {
            return upload_id;
        }
        return keep_leading(upload_id);
    }

    /**
     * @brief Mask every raw occurrence of a key and an upload id inside free text
     */
    [[nodiscard]] auto scrub(std::string text,
                             const std::string& key,
                             const std::optional<std::string>& upload_id) const -> std::string {
        if (config_.mask_keys && !key.empty()) {
            text = replace_all(std::move(text), key, mask_key(key));
        }
        if (config_.mask_upload_ids && upload_id && !upload_id->empty()) {
            text = replace_all(std::move(text), *upload_id, mask_upload_id(*upload_id));
        }
        return text;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    static auto replace_all(std::string text, const std::string& from, const std::string& to)
        -> std::string {
        std::size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos) {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
        return text;
    }

    [[nodiscard]] auto keep_leading(const std::string& value) const -> std::string {
        if (value.size() <= config_.visible_chars) {
            return value;
        }
        return value.substr(0, config_.visible_chars) +
               std::string(value.size() - config_.visible_chars, config_.mask_char);
    }

    masking_config config_;
};

/**
 * @brief Structured log context for object transfers
 */
struct transfer_log_context {
    std::string bucket;
    std::string key;
    std::optional<std::string> upload_id;
    std::optional<uint32_t> part_number;
    std::optional<uint64_t> record_index;
    std::optional<uint64_t> bytes;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json(const identifier_masker* masker = nullptr) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!bucket.empty()) add_field("bucket", bucket);
        if (!key.empty()) add_field("key", masker ? masker->mask_key(key) : key);
        if (upload_id) {
            add_field("upload_id", masker ? masker->mask_upload_id(*upload_id) : *upload_id);
        }
        if (part_number) add_uint("part_number", *part_number);
        if (record_index) add_uint("record_index", *record_index);
        if (bytes) add_uint("bytes", *bytes);
        if (attempt) add_uint("attempt", *attempt);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message",
                      masker ? masker->scrub(*error_message, key, upload_id) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    /**
     * @brief Convert to a single JSON object, context fields inlined
     */
    [[nodiscard]] auto to_json(const identifier_masker* masker = nullptr) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::warn)
 *     .with_category(log_category::download)
 *     .with_message("Ranged read failed, reissuing")
 *     .with_object("vectors", "shard-0007")
 *     .with_record_index(1024)
 *     .with_attempt(2)
 *     .build();
 *
 * std::string json = entry.to_json();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_object(std::string_view bucket, std::string_view key) -> log_entry_builder& {
        ensure_context();
        entry_.context->bucket = std::string(bucket);
        entry_.context->key = std::string(key);
        return *this;
    }

    auto with_upload_id(std::string_view upload_id) -> log_entry_builder& {
        ensure_context();
        entry_.context->upload_id = std::string(upload_id);
        return *this;
    }

    auto with_part_number(uint32_t part_number) -> log_entry_builder& {
        ensure_context();
        entry_.context->part_number = part_number;
        return *this;
    }

    auto with_record_index(uint64_t index) -> log_entry_builder& {
        ensure_context();
        entry_.context->record_index = index;
        return *this;
    }

    auto with_bytes(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes = bytes;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ensure_context();
        entry_.context->attempt = attempt;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class vector_transfer_logger;

/**
 * @brief Global logger accessor
 */
vector_transfer_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Vector transfer logging interface
 */
class vector_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    vector_transfer_logger() = default;
    ~vector_transfer_logger() = default;

    vector_transfer_logger(const vector_transfer_logger&) = delete;
    vector_transfer_logger& operator=(const vector_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if VECTOR_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if VECTOR_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if VECTOR_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Install a callback receiving every enabled log call
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        identifier_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string text(message);
        if (context) {
            text = current_masker.scrub(std::move(text), context->key, context->upload_id);
        }

        if (format == log_output_format::json) {
            log_json(level, category, text, context, file, line, function, current_masker);
        } else {
            log_text(level, category, text, context, file, line, function, current_masker);
        }
    }

    void flush() {
#if VECTOR_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const identifier_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }
        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#if VECTOR_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), json_str);
            }
        }
#else
        output_to_stderr(json_str);
#endif
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function,
                  const identifier_masker& masker) {

#if VECTOR_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            std::ostringstream oss;
            oss << "[" << category << "] " << message;
            if (context) {
                oss << " " << context->to_json(&masker);
            }
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), oss.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), oss.str());
            }
        }
#else
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << message;
        if (context) {
            oss << " " << context->to_json(&masker);
        }

        output_to_stderr(oss.str());
#endif
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if VECTOR_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    identifier_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline vector_transfer_logger& get_logger() {
    static vector_transfer_logger instance;
    return instance;
}

// Logging macros for convenience
#define VT_LOG(level, category, message) \
    kcenon::vector_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define VT_LOG_CTX(level, category, message, context) \
    kcenon::vector_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define VT_LOG_TRACE(category, message) \
    VT_LOG(kcenon::vector_transfer::log_level::trace, category, message)

#define VT_LOG_DEBUG(category, message) \
    VT_LOG(kcenon::vector_transfer::log_level::debug, category, message)

#define VT_LOG_INFO(category, message) \
    VT_LOG(kcenon::vector_transfer::log_level::info, category, message)

#define VT_LOG_WARN(category, message) \
    VT_LOG(kcenon::vector_transfer::log_level::warn, category, message)

#define VT_LOG_ERROR(category, message) \
    VT_LOG(kcenon::vector_transfer::log_level::error, category, message)

#define VT_LOG_FATAL(category, message) \
    VT_LOG(kcenon::vector_transfer::log_level::fatal, category, message)

#define VT_LOG_TRACE_CTX(category, message, ctx) \
    VT_LOG_CTX(kcenon::vector_transfer::log_level::trace, category, message, ctx)

#define VT_LOG_DEBUG_CTX(category, message, ctx) \
    VT_LOG_CTX(kcenon::vector_transfer::log_level::debug, category, message, ctx)

#define VT_LOG_INFO_CTX(category, message, ctx) \
    VT_LOG_CTX(kcenon::vector_transfer::log_level::info, category, message, ctx)

#define VT_LOG_WARN_CTX(category, message, ctx) \
    VT_LOG_CTX(kcenon::vector_transfer::log_level::warn, category, message, ctx)

#define VT_LOG_ERROR_CTX(category, message, ctx) \
    VT_LOG_CTX(kcenon::vector_transfer::log_level::error, category, message, ctx)

#define VT_LOG_FATAL_CTX(category, message, ctx) \
    VT_LOG_CTX(kcenon::vector_transfer::log_level::fatal, category, message, ctx)

} // namespace kcenon::vector_transfer
