/**
 * @file TextUtils.cpp
 * @brief Implementation of the string helpers.
 */

#include "application/TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <sstream>

namespace dnagraph::application {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string Trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

std::string TrimRight(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> SplitList(const std::string& text, char delimiter) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        item = Trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

std::string EscapeRegex(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

bool HasHeading(const std::string& body, const std::string& section) {
    const std::string heading = "## " + section;
    for (const auto& line : SplitLines(body)) {
        if (TrimRight(line) == heading) return true;
    }
    return false;
}

std::string ExtractSection(const std::string& body, const std::string& section) {
    const std::string heading = "## " + section;
    std::string out;
    bool inside = false;
    for (const auto& line : SplitLines(body)) {
        if (StartsWith(line, "## ")) {
            if (inside) break;
            inside = TrimRight(line) == heading;
            continue;
        }
        if (inside) {
            out += line;
            out += '\n';
        }
    }
    return out;
}

size_t CountOccurrences(const std::string& text, const std::string& needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = text.find(needle, pos + needle.size());
    }
    return count;
}

std::string Today() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm = ToLocalTime(tt);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

} // namespace dnagraph::application
