/**
 * @file NumberParsing.cpp
 * @brief Implementation of the numeric helpers.
 */

#include "domain/text/NumberParsing.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>

namespace provenance::domain::text {

namespace {

const std::string kBullet = "\xE2\x80\xA2";
const std::string kLeftQuote = "\xE2\x80\x9C";
const std::string kRightQuote = "\xE2\x80\x9D";
const std::string kEuro = "\xE2\x82\xAC";
const std::string kPound = "\xC2\xA3";

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool IsTrailingMark(char c) {
    switch (c) {
        case ',': case '.': case '-': case ';': case ')': case ']':
        case ':': case '!': case '?': case '"': case '\'':
            return true;
        default:
            return false;
    }
}

bool IsLeadingMark(char c) {
    return c == '$' || c == '(' || c == '[' || c == '"' || c == '\'';
}

std::string StripTrailing(std::string word) {
    bool changed = true;
    while (changed && !word.empty()) {
        changed = false;
        if (EndsWith(word, kRightQuote) || EndsWith(word, kLeftQuote)) {
            word.erase(word.size() - 3);
            changed = true;
        } else if (IsTrailingMark(word.back())) {
            word.pop_back();
            changed = true;
        }
    }
    return word;
}

std::string StripLeading(std::string word) {
    bool changed = true;
    while (changed && !word.empty()) {
        changed = false;
        if (StartsWith(word, kEuro) || StartsWith(word, kLeftQuote) || StartsWith(word, kRightQuote)) {
            word.erase(0, 3);
            changed = true;
        } else if (StartsWith(word, kPound)) {
            word.erase(0, 2);
            changed = true;
        } else if (IsLeadingMark(word.front())) {
            word.erase(0, 1);
            changed = true;
        }
    }
    return word;
}

std::string RemoveAll(std::string s, const std::string& what) {
    std::size_t pos;
    while ((pos = s.find(what)) != std::string::npos) {
        s.erase(pos, what.size());
    }
    return s;
}

const std::map<std::string, long long>& SmallNumbers() {
    static const std::map<std::string, long long> kSmall = {
        {"zero", 0}, {"one", 1}, {"two", 2}, {"three", 3}, {"four", 4}, {"five", 5},
        {"six", 6}, {"seven", 7}, {"eight", 8}, {"nine", 9}, {"ten", 10},
        {"eleven", 11}, {"twelve", 12}, {"thirteen", 13}, {"fourteen", 14},
        {"fifteen", 15}, {"sixteen", 16}, {"seventeen", 17}, {"eighteen", 18},
        {"nineteen", 19}, {"twenty", 20}, {"thirty", 30}, {"forty", 40},
        {"fifty", 50}, {"sixty", 60}, {"seventy", 70}, {"eighty", 80}, {"ninety", 90}
    };
    return kSmall;
}

const std::map<std::string, long long>& Scales() {
    static const std::map<std::string, long long> kScales = {
        {"thousand", 1000LL}, {"million", 1000000LL},
        {"billion", 1000000000LL}, {"trillion", 1000000000000LL}
    };
    return kScales;
}

bool IsNumberWord(const std::string& w) {
    return SmallNumbers().count(w) > 0 || Scales().count(w) > 0 || w == "hundred";
}

bool IsConnector(const std::string& w) {
    return w == "and" || w == "plus";
}

bool IsPercentWord(const std::string& w) {
    return w == "percent" || w == "percentage";
}

// Lowercased word with surrounding punctuation removed; "twenty-five" is split.
std::vector<std::string> NumberWordParts(const std::string& raw) {
    std::string w;
    for (unsigned char c : raw) {
        if (std::isalpha(c) || c == '-') w.push_back(static_cast<char>(std::tolower(c)));
    }
    std::vector<std::string> parts;
    std::string cur;
    for (char c : w) {
        if (c == '-') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

bool EndsSentence(const std::string& raw) {
    std::string w = raw;
    while (!w.empty() && (w.back() == '"' || w.back() == '\'' || w.back() == ')')) w.pop_back();
    if (w.empty()) return false;
    char c = w.back();
    return c == '.' || c == ',' || c == ';' || c == ':' || c == '!' || c == '?';
}

} // namespace

std::string TrimSentencePunctuation(const std::string& word) {
    std::string out = RemoveAll(word, kBullet);
    while (!out.empty()) {
        char c = out.back();
        if (c == ',' || c == '.' || c == ';' || c == ':' || c == '!' || c == '?' || c == ')' ||
            c == ']' || c == '"' || c == '\n' || c == '\r') {
            out.pop_back();
        } else {
            break;
        }
    }
    return out;
}

std::optional<double> ParseNumericToken(const std::string& word) {
    std::string w = RemoveAll(word, kBullet);
    w = RemoveAll(w, "\n");
    w = RemoveAll(w, "\r");
    w = StripTrailing(w);

    bool percent = false;
    if (!w.empty() && w.back() == '%') {
        percent = true;
        w.pop_back();
        w = StripTrailing(w);
    }
    w = StripLeading(w);
    w = RemoveAll(w, ",");
    w = RemoveAll(w, "-");
    if (w.empty()) return std::nullopt;

    bool sawDot = false;
    bool sawDigit = false;
    for (char c : w) {
        if (c == '.') {
            if (sawDot) return std::nullopt;
            sawDot = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            sawDigit = true;
        } else {
            return std::nullopt;
        }
    }
    if (!sawDigit) return std::nullopt;

    // Digit runs past the double range are not numbers we can compare.
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(w.c_str(), &end);
    if (end != w.c_str() + w.size()) return std::nullopt;
    if (errno == ERANGE && std::fabs(value) == HUGE_VAL) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    if (percent) value /= 100.0;
    return value;
}

bool NumbersEqual(double a, double b) {
    if (a == b) return true;
    double scale = std::max(std::fabs(a), std::fabs(b));
    return std::fabs(a - b) <= 1e-9 * scale;
}

std::optional<double> WordsToNumber(const std::vector<std::string>& words) {
    double total = 0.0;
    double current = 0.0;
    bool any = false;
    for (const auto& raw : words) {
        for (const auto& w : NumberWordParts(raw)) {
            if (IsConnector(w)) continue;
            auto small = SmallNumbers().find(w);
            if (small != SmallNumbers().end()) {
                current += static_cast<double>(small->second);
            } else if (w == "hundred") {
                current = (current == 0.0 ? 1.0 : current) * 100.0;
            } else {
                auto scale = Scales().find(w);
                if (scale == Scales().end()) return std::nullopt;
                total += (current == 0.0 ? 1.0 : current) * static_cast<double>(scale->second);
                current = 0.0;
            }
            any = true;
        }
    }
    if (!any) return std::nullopt;
    const double value = total + current;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

std::vector<NumberMention> FindNumberMentions(const std::vector<WordToken>& tokens, const std::string& text) {
    std::vector<NumberMention> mentions;

    std::vector<std::string> run;
    std::size_t runFirst = 0;
    std::size_t runLast = 0;

    auto flush = [&](bool percent) {
        if (run.empty()) return;
        auto value = WordsToNumber(run);
        if (value) {
            NumberMention m;
            m.firstToken = tokens[runFirst].position;
            m.lastToken = tokens[runLast].position;
            m.start = tokens[runFirst].start;
            m.end = tokens[runLast].end;
            m.surface = text.substr(m.start, m.end - m.start);
            m.spelledOut = true;
            m.value = *value;
            mentions.push_back(m);
            if (percent) {
                m.value = *value / 100.0;
                mentions.push_back(m);
            }
        }
        run.clear();
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];

        auto literal = ParseNumericToken(tok.text);
        if (literal) {
            flush(false);
            NumberMention m;
            m.value = *literal;
            m.firstToken = m.lastToken = tok.position;
            m.start = tok.start;
            m.end = tok.end;
            m.surface = tok.text;
            mentions.push_back(m);
            if (i + 1 < tokens.size() && !EndsSentence(tok.text)) {
                auto next = NumberWordParts(tokens[i + 1].text);
                if (next.size() == 1 && IsPercentWord(next[0])) {
                    m.value = *literal / 100.0;
                    m.lastToken = tokens[i + 1].position;
                    m.end = tokens[i + 1].end;
                    m.surface = text.substr(m.start, m.end - m.start);
                    mentions.push_back(m);
                }
            }
            continue;
        }

        auto parts = NumberWordParts(tok.text);
        bool numberWord = !parts.empty();
        for (const auto& p : parts) {
            if (!IsNumberWord(p)) { numberWord = false; break; }
        }

        if (numberWord) {
            if (run.empty()) runFirst = i;
            runLast = i;
            run.push_back(tok.text);
            if (EndsSentence(tok.text)) flush(false);
        } else if (!run.empty() && parts.size() == 1 && IsPercentWord(parts[0])) {
            runLast = i;
            flush(true);
        } else if (!run.empty() && parts.size() == 1 && IsConnector(parts[0]) && !EndsSentence(tok.text) &&
                   i + 1 < tokens.size()) {
            // Keep the connector only when a number word follows it.
            auto next = NumberWordParts(tokens[i + 1].text);
            bool continues = !next.empty();
            for (const auto& p : next) {
                if (!IsNumberWord(p)) { continues = false; break; }
            }
            if (!continues) flush(false);
        } else {
            flush(false);
        }
    }
    flush(false);
    return mentions;
}

} // namespace provenance::domain::text
