#ifdef JL_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace JL {

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), nextThreadNumber(0) {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return loggingEnabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(std::string_view tagList) -> void {
    std::set<std::string> tags;
    while (!tagList.empty()) {
        auto const comma = tagList.find(',');
        auto       tag   = tagList.substr(0, comma);
        while (!tag.empty() && tag.front() == ' ')
            tag.remove_prefix(1);
        while (!tag.empty() && tag.back() == ' ')
            tag.remove_suffix(1);
        if (!tag.empty())
            tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        tagList.remove_prefix(comma + 1);
    }
    std::lock_guard<std::mutex> lock(this->tagsMutex);
    this->enabledTags = std::move(tags);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drainedCv.wait(lock, [this] { return this->messageQueue.empty() && !this->writing; });
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            return;
        }

        while (!this->messageQueue.empty()) {
            auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            this->writing = true;
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
            this->writing = false;
        }
        this->drainedCv.notify_all();
    }
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    {
        std::lock_guard<std::mutex> lock(this->tagsMutex);
        if (!this->enabledTags.empty()) {
            bool wanted = false;
            for (auto const& tag : msg.tags)
                wanted = wanted || this->enabledTags.contains(tag);
            if (!wanted)
                return;
        }
    }
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    oss << '[';
    bool first = true;
    for (auto const& tag : msg.tags) {
        if (!first)
            oss << "][";
        oss << tag;
        first = false;
    }
    oss << "] ";

    oss << "[" << msg.threadName << "] ";
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    }
    std::string name = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id]  = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

void configure_logging_from_environment() {
    if (auto const* flag = std::getenv("JSONLENS_LOG")) {
        std::string_view value{flag};
        set_logging_enabled(!value.empty() && value != "0" && value != "false" && value != "off");
    }
    if (auto const* tags = std::getenv("JSONLENS_LOG_TAGS")) {
        logger().setEnabledTags(tags);
    }
}

} // namespace JL
#endif // JL_LOG_DEBUG
