#pragma once

#include <string>
#include <algorithm>
#include <sstream>
#include <ctype.h>
#include <vector>

struct StringUtils {

    // Adapted from: http://stackoverflow.com/a/236180/131050
    static size_t split(const std::string& s, std::vector<std::string> & result, const std::string& delim,
                        const bool keep_empty = false, const bool trim_space = true) {
        if (delim.empty()) {
            result.push_back(s);
            return s.size();
        }

        std::string::const_iterator substart = s.begin(), subend;
        size_t end_index = 0;

        while (true) {
            subend = std::search(substart, s.end(), delim.begin(), delim.end());
            std::string temp(substart, subend);

            end_index += temp.size() + delim.size();
            if(trim_space) {
                temp = trim(temp);
            }

            if (keep_empty || !temp.empty()) {
                result.push_back(temp);
            }

            if (subend == s.end()) {
                break;
            }
            substart = subend + delim.size();
        }

        return std::min(end_index, s.size());
    }

    static std::string join(const std::vector<std::string>& vec, const std::string& delimiter,
                            size_t start_index = 0) {
        std::stringstream ss;
        for(size_t i = start_index; i < vec.size(); i++) {
            if(i != start_index) {
                ss << delimiter;
            }
            ss << vec[i];
        }

        return ss.str();
    }

    // trims spaces, tabs and line endings on both sides
    static std::string & trim(std::string & str) {
        while (!str.empty() && isspace(static_cast<unsigned char>(str.back()))) {
            str.pop_back();
        }

        size_t start = 0;
        while (start < str.size() && isspace(static_cast<unsigned char>(str[start]))) {
            start++;
        }

        str.erase(0, start);
        return str;
    }

    static void tolowercase(std::string& str) {
        std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    }

    static void replace_all(std::string& subject, const std::string& search, const std::string& replace);

    static bool starts_with(const std::string& str, const std::string& prefix);

    // one entry per non-blank line, surrounding whitespace removed
    static std::vector<std::string> split_lines(const std::string& text);
};
