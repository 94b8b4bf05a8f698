#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

enum LogLevel {
    LOG_QUIET,      /* errors and warnings */
    LOG_INFO,
    LOG_DEBUG,
};

class Logger {
public:
    Logger(const Logger &l) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger &l) = delete;
    Logger& operator=(Logger&&) = delete;

    static Logger& instance();

    static void err(const std::string &s);
    static void warn(const std::string &s);
    static void info(const std::string &s);
    static void debug(const std::string &s);

    void setLevel(LogLevel level);

    /**
     * @brief Mirror every log line to dir/log-<n>.txt
     *
     * Files are rotated once they reach 1 MiB and only the
     * most recent ones are kept.
     */
    void startLogging(const std::string &dir);
    void stopLogging();

private:
    Logger();
    ~Logger() = default;
    void log(LogLevel level, const std::string &prefix, const std::string &s);
    void openFile();

    LogLevel m_level;
    std::string m_dir;
    unsigned long long m_index;
    std::ofstream m_file;
    std::mutex m_mutex;
};

#endif
