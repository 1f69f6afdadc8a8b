/*─────────────────────────────────────────────────────────────
  File: src/plan_io_helpers.cpp
  Shared small utilities for the lora_plan text formats
─────────────────────────────────────────────────────────────
  This file collects small, pure helper routines used by the network
  definition, configuration and failed-connection readers.

  Responsibilities:
    - Whitespace trimming, comment stripping and token normalization
    - Integer range-list parsing (frequency pool selectors)
    - Whole-token numeric parsing with readable error messages
    - Direct-to-gateway flag parsing

  This module has no side effects beyond returning computed values.
─────────────────────────────────────────────────────────────*/
#include "plan_io.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace lplan::io {

/*=====================================================================
  trim

  Remove leading/trailing ASCII whitespace from a string.
=====================================================================*/
std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(start, end - start);
}

/*=====================================================================
  normalize_token

  Keep only alphanumeric characters, lowercased.
=====================================================================*/
std::string normalize_token(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)))
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::vector<std::string> split_tokens(const std::string& line)
{
    std::string body = line;
    size_t hash = body.find('#');
    if (hash != std::string::npos)
        body = body.substr(0, hash);

    std::istringstream iss(body);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok)
        tokens.push_back(tok);
    return tokens;
}

/*=====================================================================
  parse_range_list

  Supported forms (whitespace is trimmed per component):
    - "16"          -> {16}
    - "16-30"       -> {16..30}
    - "30-16"       -> {30..16}, descending
    - "20,16,18-19" -> {20,16,18,19}

  Values come out in the order written; duplicates are kept so that
  validate_config() can reject them. Negative values are not
  supported ('-' is always the range separator).
=====================================================================*/
std::vector<int> parse_range_list(const std::string& token)
{
    std::vector<int> values;
    size_t start = 0;
    while (start < token.size()) {
        size_t comma = token.find(',', start);
        std::string part = trim(token.substr(
            start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!part.empty()) {
            size_t dash = part.find('-');
            if (dash != std::string::npos) {
                const long long a = parse_int(trim(part.substr(0, dash)), "range start");
                const long long b = parse_int(trim(part.substr(dash + 1)), "range end");
                const long long width = (a <= b ? b - a : a - b) + 1;
                if (values.size() + static_cast<size_t>(width) > MAX_RANGE_VALUES)
                    throw std::invalid_argument("Range \"" + part + "\" exceeds " +
                                                std::to_string(MAX_RANGE_VALUES) + " values");
                const long long step = a <= b ? 1 : -1;
                for (long long v = a; v != b + step; v += step)
                    values.push_back(static_cast<int>(v));
            } else {
                if (values.size() >= MAX_RANGE_VALUES)
                    throw std::invalid_argument("Range list exceeds " +
                                                std::to_string(MAX_RANGE_VALUES) + " values");
                values.push_back(parse_int(part, "range value"));
            }
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return values;
}

/*=====================================================================
  Numeric parsing

  std::stod / std::stoi accept trailing garbage ("5km" -> 5); these
  wrappers require the whole token to be consumed.
=====================================================================*/
double parse_double(const std::string& token, const std::string& what)
{
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(token, &used);
    }
    catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + what + " \"" + token + '"');
    }
    if (used != token.size())
        throw std::invalid_argument("Invalid " + what + " \"" + token + '"');
    return v;
}

int parse_int(const std::string& token, const std::string& what)
{
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(token, &used);
    }
    catch (const std::exception&) {
        throw std::invalid_argument("Invalid " + what + " \"" + token + '"');
    }
    if (used != token.size())
        throw std::invalid_argument("Invalid " + what + " \"" + token + '"');
    return v;
}

std::size_t parse_count(const std::string& token, const std::string& what)
{
    int v = parse_int(token, what);
    if (v < 0)
        throw std::invalid_argument(what + " must not be negative (\"" + token + "\")");
    return static_cast<std::size_t>(v);
}

bool parse_flag(const std::string& token)
{
    const std::string t = normalize_token(token);
    if (t == "y" || t == "yes" || t == "true" || t == "1" || t == "direct")
        return true;
    if (t == "n" || t == "no" || t == "false" || t == "0" || t == "nodirect" || t == "relay")
        return false;
    throw std::invalid_argument("Invalid direct-to-gateway flag \"" + token + '"');
}

} // namespace lplan::io
