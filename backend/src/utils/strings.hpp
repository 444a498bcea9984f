#pragma once
#include <string>
#include <vector>
#include <sstream>
#include <algorithm>
#include <cctype>

// Small text helpers shared by the core, the CLI and the exporter.
namespace Text
{
    inline std::string trim(const std::string& s)
    {
        std::string t = s;
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        return t;
    }

    inline std::string lower(const std::string& s)
    {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    // Trimmed, lower-cased tag name; empty when nothing is left.
    inline std::string normalizeTag(const std::string& s)
    {
        return lower(trim(s));
    }

    inline bool iequals(const std::string& a, const std::string& b)
    {
        return lower(a) == lower(b);
    }

    // First `chars` characters of UTF-8 text; never splits a multi-byte sequence.
    inline std::string utf8Prefix(const std::string& s, size_t chars)
    {
        size_t seen = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            bool starts_char = (static_cast<unsigned char>(s[i]) & 0xC0) != 0x80;
            if (starts_char && seen++ == chars) return s.substr(0, i);
        }
        return s;
    }

    inline std::vector<std::string> splitCsv(const std::string& line)
    {
        std::vector<std::string> out;
        std::istringstream iss(line);
        std::string t;
        while (std::getline(iss, t, ',')) {
            t = trim(t);
            if (!t.empty()) out.push_back(t);
        }
        return out;
    }

    inline std::string joinCsv(const std::vector<std::string>& items)
    {
        std::ostringstream oss;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) oss << ", ";
            oss << items[i];
        }
        return oss.str();
    }
}
