#pragma once

#include "json_formatter_core.hpp"
#include "json_formatter_platform.hpp"

#include <iostream>
#include <string>

// One outline line per visible node, drawn with the box prefixes.
void printTree(const TreeNode &root, std::ostream &out);

// Prints "name:line:column: text" for every match of pattern in text.
void printMatches(const std::string &name, const std::string &text, const std::string &pattern,
                  std::ostream &out);

// Parses, expands and prints one document as config asks.  Parse errors
// go to err.  Returns false when the document could not be processed.
bool processDocument(const std::string &name, const std::string &contents, const AppConfig &config,
                     std::ostream &out, std::ostream &err);

// The json-format program.  Input named "-" (or no input at all) is read
// from in.  Returns 0 on success, 1 when any input failed and 2 for bad
// arguments.
int runCommandLine(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err);
