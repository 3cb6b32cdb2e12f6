// Configuration, logging, file access and clipboard for json-formatter
#include "json_formatter_platform.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

#include "json_formatter_core.hpp"

static std::string requireValue(int &i, int argc, char **argv)
{
    const char *option = argv[i];
    if (i + 1 >= argc)
        throw std::invalid_argument(std::string("option ") + option + " requires a value");
    return argv[++i];
}

AppConfig parseCommandLine(int argc, char **argv)
{
    AppConfig config;
    if (const char *logFile = std::getenv("JSON_FORMATTER_LOG"))
        config.logFile = logFile;
    if (const char *logLevel = std::getenv("JSON_FORMATTER_LOG_LEVEL"))
        config.logLevel = logLevel;

    bool onlyFiles = false;
    for (int i = 1; i < argc; ++i)
    {
        const char *arg = argv[i];
        if (onlyFiles || arg[0] != '-' || std::strcmp(arg, "-") == 0)
        {
            config.files.push_back(arg);
        }
        else if (std::strcmp(arg, "--") == 0)
            onlyFiles = true;
        else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0)
            config.showHelp = true;
        else if (std::strcmp(arg, "--version") == 0)
            config.showVersion = true;
        else if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--compact") == 0)
            config.compact = true;
        else if (std::strcmp(arg, "--no-expand") == 0)
            config.expandNested = false;
        else if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--tree") == 0)
            config.printTree = true;
        else if (std::strcmp(arg, "-f") == 0 || std::strcmp(arg, "--find") == 0)
            config.findPattern = requireValue(i, argc, argv);
        else if (std::strcmp(arg, "--log-file") == 0)
            config.logFile = requireValue(i, argc, argv);
        else if (std::strcmp(arg, "--log-level") == 0)
            config.logLevel = requireValue(i, argc, argv);
        else
            throw std::invalid_argument(std::string("unknown option ") + arg);
    }

    if (!config.logLevel.empty() &&
        spdlog::level::from_str(config.logLevel) == spdlog::level::off && config.logLevel != "off")
        throw std::invalid_argument("unknown log level " + config.logLevel);
    return config;
}

// Display command-line usage information
void showUsage(const char *progName, bool interactive, std::ostream &out)
{
    if (interactive)
    {
        out << "json-formatter-app - JSON formatter with tree view and search\n\n";
        out << "USAGE:\n";
        out << "  " << progName << " [options] [file1.json] [file2.json] ...\n\n";
        out << "DESCRIPTION:\n";
        out << "  Each file opens in its own window.  Text typed into the input pane is\n";
        out << "  parsed as you type; nested JSON strings are expanded into the tree.\n";
        out << "  Selecting a tree node shows the JSON for that node.\n\n";
        out << "KEYS:\n";
        out << "  Ctrl-N    New window\n";
        out << "  F2        Open file\n";
        out << "  F4        Save result\n";
        out << "  F5 / F6   Format / compress\n";
        out << "  Alt-C     Copy result to clipboard\n";
        out << "  Ctrl-F    Search the result, F3 / Shift-F3 next / previous, Esc ends\n";
        out << "  Alt-X     Quit\n\n";
    }
    else
    {
        out << "json-format - Format, compact and inspect JSON documents\n\n";
        out << "USAGE:\n";
        out << "  " << progName << " [options] [file1.json] [file2.json] ...\n";
        out << "  cat data.json | " << progName << " [options]\n\n";
        out << "  -c, --compact        Print compact output\n";
        out << "  --no-expand          Keep nested JSON strings as strings\n";
        out << "  -t, --tree           Print the display tree instead of JSON\n";
        out << "  -f, --find PATTERN   List literal matches in the formatted output\n";
    }
    out << "OPTIONS:\n";
    out << "  -h, --help           Show this help message\n";
    out << "  --version            Show version information\n";
    out << "  --log-file PATH      Write the log to PATH (env JSON_FORMATTER_LOG)\n";
    out << "  --log-level LEVEL    trace, debug, info, warn, error, critical or off\n";
}

void initLogging(const AppConfig &config, bool interactive)
{
    spdlog::drop("json-formatter");
    std::shared_ptr<spdlog::logger> logger;
    if (!config.logFile.empty())
        logger = spdlog::basic_logger_mt("json-formatter", config.logFile);
    else if (interactive)
        logger = spdlog::null_logger_mt("json-formatter");
    else
        logger = spdlog::stderr_color_mt("json-formatter");

    std::string level = config.logLevel;
    if (level.empty())
        level = interactive ? "info" : "warn";
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialised at level {}", level);
}

// Whole-file read.  The content must be valid UTF-8.
std::string readTextFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw FileError(path, std::strerror(errno));
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        throw FileError(path, "read failed");
    std::string contents = ss.str();
    if (!isValidUtf8(contents))
        throw FileError(path, "file is not valid UTF-8 text");
    spdlog::info("Read {} bytes from {}", contents.size(), path);
    return contents;
}

// Whole-file overwrite.
void writeTextFile(const std::string &path, const std::string &text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw FileError(path, std::strerror(errno));
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out)
        throw FileError(path, "write failed");
    spdlog::info("Wrote {} bytes to {}", text.size(), path);
}

// Base64 encoding for OSC 52 clipboard support
static std::string base64Encode(const std::string &input)
{
    static const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    std::string encoded;
    int val = 0, valb = -6;
    for (unsigned char c : input)
    {
        val = ((val << 8) + c) & 0xFFFF;
        valb += 8;
        while (valb >= 0)
        {
            encoded.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6)
        encoded.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (encoded.size() % 4)
        encoded.push_back('=');
    return encoded;
}

// Check if OSC 52 clipboard sequences are likely to be supported
bool osc52Likely()
{
    const char *noOsc52 = std::getenv("NO_OSC52");
    if (noOsc52 && *noOsc52)
        return false;

    const char *term = std::getenv("TERM");
    if (!term)
        return false;

    std::string termStr(term);
    if (termStr == "dumb" || termStr == "linux")
        return false;

    return termStr.find("xterm") != std::string::npos ||
           termStr.find("tmux") != std::string::npos ||
           termStr.find("screen") != std::string::npos ||
           termStr.find("rxvt") != std::string::npos ||
           termStr.find("alacritty") != std::string::npos ||
           termStr.find("foot") != std::string::npos ||
           termStr.find("kitty") != std::string::npos ||
           termStr.find("wezterm") != std::string::npos;
}

std::string getClipboardStatusMessage()
{
    if (osc52Likely())
        return "JSON result copied to clipboard!";
    if (std::getenv("TMUX"))
        return "Clipboard not supported - tmux needs OSC 52 configuration";
    return "Clipboard not supported by this terminal";
}

// Copy text to clipboard using OSC 52 escape sequence.  Returns false
// when nothing was sent.
bool copyToClipboard(const std::string &text)
{
    if (!osc52Likely())
        return false;

    // Limit payload size to prevent issues with muxers/terminals
    constexpr size_t maxOsc52Payload = 100000;
    std::string encoded = base64Encode(text);
    if (encoded.size() > maxOsc52Payload)
    {
        spdlog::warn("Clipboard payload of {} bytes exceeds the OSC 52 limit", encoded.size());
        return false;
    }

    FILE *out = std::fopen("/dev/tty", "w");
    if (!out && isatty(fileno(stdout)))
        out = stdout;
    if (!out)
        return false;

    // BEL terminator instead of ST for better compatibility
    std::fprintf(out, "\033]52;c;%s\a", encoded.c_str());
    std::fflush(out);
    if (out != stdout)
        std::fclose(out);
    spdlog::debug("Copied {} bytes to the clipboard", text.size());
    return true;
}
