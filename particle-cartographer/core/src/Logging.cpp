#include "pc/core/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace pc {

SimpleLogger::~SimpleLogger()
{
    for (auto& file : files_) {
        if (file.is_open()) {
            file.close();
        }
    }
}

bool SimpleLogger::addFile(const std::filesystem::path& path)
{
    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    files_.push_back(std::move(file));
    return true;
}

std::string SimpleLogger::levelPrefix(Level level)
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

    switch (level) {
        case Level::Trace:    oss << "[TRACE] "; break;
        case Level::Debug:    oss << "[DEBUG] "; break;
        case Level::Info:     oss << "[INFO] "; break;
        case Level::Warn:     oss << "[WARN] "; break;
        case Level::Error:    oss << "[ERROR] "; break;
        case Level::Critical: oss << "[CRITICAL] "; break;
        case Level::Off:      break;
    }

    return oss.str();
}

std::optional<SimpleLogger::Level> SimpleLogger::parseLevel(const std::string& s)
{
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error" || lower == "err") return Level::Error;
    if (lower == "critical" || lower == "crit") return Level::Critical;
    if (lower == "off") return Level::Off;
    return std::nullopt;
}

std::shared_ptr<SimpleLogger> Logger()
{
    static auto logger = std::make_shared<SimpleLogger>();
    return logger;
}

bool AddLogFile(const std::filesystem::path& path)
{
    return Logger()->addFile(path);
}

bool SetLogLevel(const std::string& s)
{
    auto level = SimpleLogger::parseLevel(s);
    if (!level) {
        return false;
    }
    Logger()->setLevel(*level);
    return true;
}

}  // namespace pc
