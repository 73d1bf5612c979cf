#ifndef LSNP_TEST_SUPPORT_LOG_CAPTURE_HPP
#define LSNP_TEST_SUPPORT_LOG_CAPTURE_HPP

#include <mutex>
#include <string>
#include <vector>

#include "util/logger.hpp"

namespace lsnp {
namespace test {

// Collects log records for the lifetime of the object.
class LogCapture
{
public:
    LogCapture()
    {
        util::logger::Logger::getInstance().setCaptureHook(
            [this](util::logger::LogLevel level, const std::string &msg) {
                std::lock_guard<std::mutex> lock(mutex_);
                records_.emplace_back(level, msg);
            });
    }

    ~LogCapture() { util::logger::Logger::getInstance().setCaptureHook(nullptr); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool contains(util::logger::LogLevel level, const std::string &needle) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &r : records_) {
            if (r.first == level && r.second.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    size_t count(util::logger::LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto &r : records_) {
            if (r.first == level) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<util::logger::LogLevel, std::string>> records_;
};

} // namespace test
} // namespace lsnp

#endif // LSNP_TEST_SUPPORT_LOG_CAPTURE_HPP
