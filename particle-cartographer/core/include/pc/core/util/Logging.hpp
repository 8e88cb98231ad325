#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace pc {

// Lightweight leveled logger with "{}" placeholders, shared by the library and apps
class SimpleLogger {
public:
    enum class Level {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    SimpleLogger() = default;
    ~SimpleLogger();

    void setLevel(Level level) { currentLevel_.store(level); }
    [[nodiscard]] Level level() const { return currentLevel_.load(); }

    // Returns false if the file could not be opened for appending
    bool addFile(const std::filesystem::path& path);

    template<typename... Args>
    void trace(const std::string& fmt, Args&&... args)
    {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args)
    {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args)
    {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args)
    {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args)
    {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(const std::string& fmt, Args&&... args)
    {
        log(Level::Critical, fmt, std::forward<Args>(args)...);
    }

    static std::optional<Level> parseLevel(const std::string& s);

private:
    template<typename... Args>
    void log(Level level, const std::string& fmt, Args&&... args)
    {
        const Level threshold = currentLevel_.load();
        if (threshold == Level::Off || level < threshold) return;

        std::string msg = formatMessage(fmt, std::forward<Args>(args)...);
        std::string prefix = levelPrefix(level);

        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << prefix << msg << std::endl;

        for (auto& file : files_) {
            if (file.is_open()) {
                file << prefix << msg << '\n';
                file.flush();
            }
        }
    }

    template<typename T>
    static std::string toString(T&& val)
    {
        std::ostringstream oss;
        oss << std::forward<T>(val);
        return oss.str();
    }

    template<typename T, typename... Args>
    static std::string formatMessage(const std::string& fmt, T&& first, Args&&... rest)
    {
        std::string result;
        size_t pos = fmt.find("{}");
        if (pos == std::string::npos) {
            return fmt;
        }
        result = fmt.substr(0, pos) + toString(std::forward<T>(first));
        return result + formatMessage(fmt.substr(pos + 2), std::forward<Args>(rest)...);
    }

    static std::string formatMessage(const std::string& fmt) { return fmt; }

    static std::string levelPrefix(Level level);

    std::atomic<Level> currentLevel_{Level::Info};
    std::mutex mutex_;
    std::vector<std::ofstream> files_;
};

bool AddLogFile(const std::filesystem::path& path);
// Unknown level names leave the current level untouched and return false
bool SetLogLevel(const std::string& s);
std::shared_ptr<SimpleLogger> Logger();

}  // namespace pc
