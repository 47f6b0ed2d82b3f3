#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Minimal `key = value` settings file reader shared by the game settings and
// the SDL keybindings. Comments start with # or ; and run to end of line.

std::string trimCopy(std::string s);
std::string lowerCopy(std::string s);
std::vector<std::string> splitOn(const std::string& s, char delim);

// Splits one line into a lower-cased key and a trimmed value. Blank lines,
// comment-only lines and lines without '=' yield nothing.
std::optional<std::pair<std::string, std::string>> parseIniLine(const std::string& line);

// Calls fn(key, value) for every entry in the file. Returns false if the file
// could not be opened.
bool forEachIniEntry(const std::string& path,
                     const std::function<void(const std::string&, const std::string&)>& fn);
