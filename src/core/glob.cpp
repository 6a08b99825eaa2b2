#include "glob.hpp"
#include "utils.hpp"
#include <regex>
#include <stdexcept>

static void append_escaped(std::string& out, char c) {
    static const std::string special = "\\^$.|?*+()[]{}";
    if (special.find(c) != std::string::npos) out += '\\';
    out += c;
}

static void append_escaped(std::string& out, const std::string& s) {
    for (char c : s) append_escaped(out, c);
}

static std::string glob_to_regex(const std::string& glob) {
    std::string re = "^";
    size_t i = 0;
    while (i < glob.size()) {
        char c = glob[i];
        switch (c) {
        case '*':
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    re += "(?:.*/)?";
                    i += 2;
                } else {
                    re += ".*";
                    i += 1;
                }
            } else {
                re += "[^/]*";
            }
            break;

        case '?':
            re += "[^/]";
            break;

        case '[': {
            auto end = glob.find(']', i + 1);
            if (end == std::string::npos) {
                append_escaped(re, '[');
                break;
            }
            std::string cls = glob.substr(i + 1, end - i - 1);
            if (cls.empty()) {
                append_escaped(re, "[]");
            } else if (cls[0] == '!') {
                if (cls.size() == 1) {
                    append_escaped(re, "[!]");
                } else {
                    re += "[^" + cls.substr(1) + "]";
                }
            } else {
                re += "[" + cls + "]";
            }
            i = end;
            break;
        }

        default:
            append_escaped(re, c);
            break;
        }
        ++i;
    }
    re += "$";
    return re;
}

bool glob_match(const std::string& pattern, const std::string& path,
                bool case_sensitive) {
    if (pattern.empty()) {
        throw std::invalid_argument("glob pattern must not be empty");
    }
    if (path.empty()) return false;

    auto flags = std::regex::ECMAScript;
    if (!case_sensitive) flags |= std::regex::icase;

    std::regex re(glob_to_regex(normalize_slashes(pattern)), flags);
    return std::regex_match(normalize_slashes(path), re);
}

std::vector<std::string> glob_filter(const std::string& pattern,
                                     const std::vector<std::string>& paths,
                                     bool case_sensitive) {
    std::vector<std::string> out;
    for (const auto& p : paths) {
        if (glob_match(pattern, p, case_sensitive)) out.push_back(p);
    }
    return out;
}

std::string glob_base_path(const std::string& pattern) {
    std::string p = normalize_slashes(pattern);
    auto wildcard = p.find_first_of("*?[");
    if (wildcard == std::string::npos) {
        auto slash = p.rfind('/');
        return slash != std::string::npos ? p.substr(0, slash) : "";
    }
    if (wildcard == 0) return "";
    auto slash = p.rfind('/', wildcard - 1);
    return slash != std::string::npos ? p.substr(0, slash) : "";
}

bool glob_has_wildcard(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}
