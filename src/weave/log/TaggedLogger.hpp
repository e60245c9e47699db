#pragma once
#ifdef WV_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace WV {

/**
 * Asynchronous tagged logger for debug builds.
 *
 * Messages carry a set of tags ("Runtime", "ERROR", ...) and are written to
 * stderr by a worker thread. Output starts disabled. A message is dropped when
 * any of its tags is skipped, or when an enabled set is given and none of its
 * tags is in it. Destruction writes every queued message before returning.
 */
class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point time;
        std::set<std::string>                 tags;
        std::string                           text;
        std::string                           thread;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto set_thread_name(const std::string& name) -> void;
    auto set_logging_enabled(bool enabled) -> void;
    auto set_tag_filter(std::set<std::string> enabled, std::set<std::string> skipped) -> void;

    // WEAVE_LOG (anything but "0" enables output), WEAVE_LOG_TAGS and
    // WEAVE_LOG_SKIP_TAGS (comma separated). Returns whether output is on.
    auto configure_from_environment() -> bool;

private:
    auto run_worker() -> void;
    auto passes_filter(const Record& record) const -> bool;
    auto thread_name(std::thread::id id) -> std::string;

    std::deque<Record>      pending_;
    std::mutex              pending_mutex_;
    std::condition_variable wake_;
    std::atomic<bool>       running_{true};
    std::atomic<bool>       enabled_{false};

    mutable std::mutex    filter_mutex_;
    std::set<std::string> enabled_tags_;
    std::set<std::string> skipped_tags_;

    std::mutex                                       names_mutex_;
    std::unordered_map<std::thread::id, std::string> thread_names_;
    int                                              next_thread_number_ = 0;

    std::thread worker_;
};

TaggedLogger& logger();

// Serializes stderr/stdout writes between the logger and other console output.
std::mutex& output_mutex();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled_.load(std::memory_order_relaxed))
        return;

    Record record{.time     = std::chrono::system_clock::now(),
                  .tags     = {std::string(std::forward<Tags>(tags))...},
                  .text     = message,
                  .thread   = thread_name(std::this_thread::get_id()),
                  .location = location};
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.push_back(std::move(record));
    }
    wake_.notify_one();
}

#define wv_log(message, ...) ::WV::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace WV

#else
#define wv_log(message, ...) ((void)0)
#endif // WV_LOG_DEBUG
