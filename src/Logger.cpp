#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <stdexcept>

// singleton get instance
Logger & Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::closeFiles() {
    if (logFileInfo.is_open()) logFileInfo.close();
    if (logFileWarning.is_open()) logFileWarning.close();
    if (logFileDebug.is_open()) logFileDebug.close();
    if (logFileError.is_open()) logFileError.close();
}

void Logger::setLogPath(const std::string & path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (isInitialized) {
        closeFiles();
        isInitialized = false;
    }
    if (path.empty()) {
        return;
    }

    try {
        // Create parent directory if it doesn't exist
        std::filesystem::path log_path(path);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        const std::pair<std::ofstream *, const char *> files[] = {
            {&logFileInfo, "INFO.log"},
            {&logFileWarning, "WARNING.log"},
            {&logFileDebug, "DEBUG.log"},
            {&logFileError, "ERROR.log"},
        };
        for (const auto & file : files) {
            file.first->open(path + file.second, std::ios::app);
            if (!file.first->is_open()) {
                throw std::runtime_error("Failed to open log file: " + path + file.second);
            }
        }
        isInitialized = true;
    }
    catch (const std::exception& e) {
        std::cerr << "Logger initialization error: " << e.what() << std::endl;
        // Continue without file logging, but with console output
        closeFiles();
        isInitialized = false;
    }
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mtx);
    minLevel = level;
}

Logger::Level Logger::parseLevel(const std::string & name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper == "DEBUG") return DEBUG;
    if (upper == "INFO") return INFO;
    if (upper == "WARNING" || upper == "WARN") return WARNING;
    if (upper == "ERROR") return ERROR;
    throw std::invalid_argument("unknown log level: " + name);
}

const char * Logger::levelName(Level level) {
    switch (level) {
        case DEBUG: return "DEBUG";
        case INFO: return "INFO";
        case WARNING: return "WARNING";
        case ERROR: return "ERROR";
    }
    return "INFO";
}

// destructor
Logger::~Logger() {
    closeFiles();
}

void Logger::log(Level level, const std::string & line) {
    std::lock_guard<std::mutex> lock(mtx);
    std::string timestamp = getCurrentTime();
    std::string text = timestamp + " [" + levelName(level) + "] " + line;
    if (level >= minLevel) {
        std::cout << text << std::endl;
    }
    if (!isInitialized) {
        return;
    }
    // an ERROR also lands in WARNING.log, INFO.log and DEBUG.log
    if (level >= ERROR) logFileError << text << std::endl;
    if (level >= WARNING) logFileWarning << text << std::endl;
    if (level >= INFO) logFileInfo << text << std::endl;
    logFileDebug << text << std::endl;
}

void Logger::debug(const std::string & message) {
    log(DEBUG, message);
}

void Logger::info(const std::string & message) {
    log(INFO, message);
}

void Logger::warning(const std::string & message) {
    log(WARNING, message);
}

void Logger::error(const std::string & message) {
    log(ERROR, message);
}

void Logger::debug(int id, const std::string & message) {
    log(DEBUG, std::to_string(id) + ": " + message);
}

void Logger::info(int id, const std::string & message) {
    log(INFO, std::to_string(id) + ": " + message);
}

void Logger::warning(int id, const std::string & message) {
    log(WARNING, std::to_string(id) + ": " + message);
}

void Logger::error(int id, const std::string & message) {
    log(ERROR, std::to_string(id) + ": " + message);
}

std::string Logger::getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&in_time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
