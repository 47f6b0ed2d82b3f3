#include "ini.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

std::string trimCopy(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitOn(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, delim)) out.push_back(cur);
    return out;
}

std::optional<std::pair<std::string, std::string>> parseIniLine(const std::string& lineIn) {
    std::string line = lineIn;
    const size_t cut = line.find_first_of("#;");
    if (cut != std::string::npos) line.erase(cut);

    const size_t eq = line.find('=');
    if (eq == std::string::npos) return std::nullopt;

    std::string key = lowerCopy(trimCopy(line.substr(0, eq)));
    if (key.empty()) return std::nullopt;
    return std::make_pair(std::move(key), trimCopy(line.substr(eq + 1)));
}

bool forEachIniEntry(const std::string& path,
                     const std::function<void(const std::string&, const std::string&)>& fn) {
    std::ifstream in(path);
    if (!in) return false;

    std::string line;
    while (std::getline(in, line)) {
        if (auto kv = parseIniLine(line)) fn(kv->first, kv->second);
    }
    return true;
}
