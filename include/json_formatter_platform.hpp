#pragma once

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef JSON_FORMATTER_VERSION
#define JSON_FORMATTER_VERSION "2.0.2"
#endif

// Raised when a file cannot be read or written.
class FileError : public std::runtime_error
{
public:
    FileError(const std::string &path, const std::string &reason)
        : std::runtime_error(path + ": " + reason), filePath(path) {}

    const std::string &path() const { return filePath; }

private:
    std::string filePath;
};

// Settings shared by both front ends.  Command line options win over
// the environment.
struct AppConfig
{
    bool showHelp = false;
    bool showVersion = false;
    bool compact = false;
    bool expandNested = true;
    bool printTree = false;
    std::string findPattern;
    std::string logFile;
    std::string logLevel;
    std::vector<std::string> files;
};

AppConfig parseCommandLine(int argc, char **argv);
void showUsage(const char *progName, bool interactive, std::ostream &out = std::cout);

// Installs the default spdlog logger.  Interactive front ends never log
// to the terminal; they use the configured file or nothing.
void initLogging(const AppConfig &config, bool interactive);

std::string readTextFile(const std::string &path);
void writeTextFile(const std::string &path, const std::string &text);

bool osc52Likely();
std::string getClipboardStatusMessage();
bool copyToClipboard(const std::string &text);
