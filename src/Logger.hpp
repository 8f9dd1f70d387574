#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <string>
#include <fstream>
#include <mutex>

class Logger {
public:
    enum Level {
        DEBUG = 0,
        INFO,
        WARNING,
        ERROR
    };

    static Logger & getInstance();

    // log debug level message
    void debug(const std::string & message);

    // log info level message
    void info(const std::string & message);

    // log warning level message
    void warning(const std::string & message);

    // log error level message
    void error(const std::string & message);

    // same as above, tagged with a request id
    void debug(int id, const std::string & message);
    void info(int id, const std::string & message);
    void warning(int id, const std::string & message);
    void error(int id, const std::string & message);

    // get current time
    std::string getCurrentTime();

    // open <path>INFO.log, <path>WARNING.log, ... in append mode
    void setLogPath(const std::string & path);

    // messages below this level are not printed to the console
    void setLevel(Level level);
    Level getLevel() const { return minLevel; }

    static Level parseLevel(const std::string & name);
    static const char * levelName(Level level);

    ~Logger();

private:
    std::ofstream logFileInfo;
    std::ofstream logFileWarning;
    std::ofstream logFileDebug;
    std::ofstream logFileError;
    std::mutex mtx;
    bool isInitialized;
    Level minLevel;

    Logger() : isInitialized(false), minLevel(INFO) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void closeFiles();

    // write one line to the console and to every file at or below level
    void log(Level level, const std::string & line);
};

#endif
