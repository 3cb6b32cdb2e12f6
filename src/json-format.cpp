// Command line front end: format, compact, print the display tree or
// search the formatted output of one or more JSON documents.
//
// Pass file names on the command line, or pipe JSON into the program
// with no arguments.  Nested JSON strings are expanded unless
// --no-expand is given.

#include "json_formatter_cli.hpp"

#include <clocale>
#include <iostream>

int main(int argc, char **argv)
{
    // Enable UTF-8 locale so display widths are computed correctly
    setlocale(LC_ALL, "");
    return runCommandLine(argc, argv, std::cin, std::cout, std::cerr);
}
