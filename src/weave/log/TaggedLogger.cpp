#ifdef WV_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace WV {

namespace {

// "dir/file.cpp" keeps log lines short without losing which module logged.
auto short_path(const char* path) -> std::string {
    std::filesystem::path p{path};
    if (p.has_parent_path())
        return (p.parent_path().filename() / p.filename()).string();
    return p.filename().string();
}

auto split_tags(std::string_view list) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto tag   = list.substr(0, comma);
        if (!tag.empty())
            tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return tags;
}

auto format_record(const TaggedLogger::Record& record) -> std::string {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.time.time_since_epoch()) % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(record.time);
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : record.tags)
        line << '[' << tag << ']';
    line << " [" << record.thread << "] [" << short_path(record.location.file_name()) << ':'
         << record.location.line() << "] " << record.text << '\n';
    return line.str();
}

} // namespace

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

TaggedLogger::TaggedLogger()
    : worker_(&TaggedLogger::run_worker, this) {}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        running_ = false;
    }
    wake_.notify_one();
    if (worker_.joinable())
        worker_.join();
}

auto TaggedLogger::set_thread_name(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(names_mutex_);
    thread_names_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::set_logging_enabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::set_tag_filter(std::set<std::string> enabled, std::set<std::string> skipped) -> void {
    std::lock_guard<std::mutex> lock(filter_mutex_);
    enabled_tags_ = std::move(enabled);
    skipped_tags_ = std::move(skipped);
}

auto TaggedLogger::configure_from_environment() -> bool {
    auto const* flag = std::getenv("WEAVE_LOG");
    auto const  on   = flag != nullptr && std::string_view{flag} != "0";

    auto const* enabled = std::getenv("WEAVE_LOG_TAGS");
    auto const* skipped = std::getenv("WEAVE_LOG_SKIP_TAGS");
    set_tag_filter(enabled ? split_tags(enabled) : std::set<std::string>{},
                   skipped ? split_tags(skipped) : std::set<std::string>{});
    set_logging_enabled(on);
    return on;
}

auto TaggedLogger::passes_filter(const Record& record) const -> bool {
    std::lock_guard<std::mutex> lock(filter_mutex_);
    for (auto const& tag : record.tags)
        if (skipped_tags_.contains(tag))
            return false;
    if (enabled_tags_.empty())
        return true;
    for (auto const& tag : record.tags)
        if (enabled_tags_.contains(tag))
            return true;
    return false;
}

auto TaggedLogger::run_worker() -> void {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    while (true) {
        wake_.wait(lock, [this] { return !pending_.empty() || !running_; });
        if (pending_.empty())
            return;

        auto batch = std::move(pending_);
        pending_.clear();
        lock.unlock();
        for (auto const& record : batch) {
            if (!passes_filter(record))
                continue;
            auto line = format_record(record);
            std::lock_guard<std::mutex> out(output_mutex());
            std::cerr << line << std::flush;
        }
        lock.lock();
    }
}

auto TaggedLogger::thread_name(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(names_mutex_);
    auto [it, inserted] = thread_names_.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(next_thread_number_++);
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().set_thread_name(name);
}

void set_logging_enabled(bool enabled) {
    logger().set_logging_enabled(enabled);
}

} // namespace WV
#endif // WV_LOG_DEBUG
