/**
 * @file WordTokenizer.cpp
 * @brief Implementation of WordTokenizer.
 */

#include "domain/text/WordTokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace provenance::domain::text {

namespace {

const std::unordered_set<std::string>& StopWords() {
    static const std::unordered_set<std::string> kStopWords = {
    "a", "able", "about", "above", "accordance", "according", "accordingly", "across", "act", "actually",
    "added", "adj", "affected", "affecting", "affects", "after", "afterwards", "again", "against", "ah",
    "al", "all", "almost", "alone", "along", "already", "also", "although", "always", "am", "among",
    "amongst", "an", "and", "announce", "another", "any", "anybody", "anyhow", "anymore", "anyone",
    "anything", "anyway", "anyways", "anywhere", "apparently", "approximately", "are", "aren", "arent",
    "arise", "around", "as", "aside", "ask", "asked", "asking", "at", "auth", "available", "away", "awfully",
    "b", "back", "basically", "be", "became", "because", "become", "becomes", "becoming", "been", "before",
    "beforehand", "begin", "beginning", "beginnings", "begins", "behind", "being", "believe", "below",
    "beside", "besides", "between", "beyond", "biol", "both", "brief", "briefly", "but", "by", "c", "ca",
    "came", "can", "cannot", "can't", "cant", "cause", "causes", "certain", "certainly", "co", "com", "come",
    "comes", "contain", "containing", "contains", "could", "couldnt", "d", "date", "did", "didnt", "didn't",
    "different", "do", "does", "doesn't", "doesnt", "doing", "done", "don't", "dont", "down", "downwards",
    "due", "during", "e", "each", "ed", "edu", "effect", "eg", "e.g.", "eight", "eighty", "either", "else",
    "elsewhere", "end", "ending", "enough", "especially", "et", "etal", "etc", "even", "ever", "every",
    "everybody", "everyone", "everything", "everywhere", "ex", "except", "f", "far", "few", "ff", "fifth",
    "first", "five", "fix", "followed", "following", "follows", "for", "former", "formerly", "forth",
    "found", "four", "from", "further", "furthermore", "g", "gave", "generally", "get", "gets", "getting",
    "give", "given", "gives", "giving", "go", "goes", "gone", "got", "gotten", "h", "had", "happens",
    "hardly", "has", "hasn't", "have", "haven't", "having", "he", "hed", "hence", "her", "here", "hereafter",
    "hereby", "herein", "heres", "here's", "hereupon", "hers", "herself", "hes", "he's", "hi", "hid", "him",
    "himself", "his", "hither", "home", "how", "howbeit", "however", "hundred", "i", "id", "ie", "i.e.",
    "if", "i'll", "ill", "im", "i'm", "immediate", "immediately", "importance", "important", "in", "inc",
    "inc.", "indeed", "index", "information", "instead", "into", "invention", "inward", "is", "isn't",
    "isnt", "it", "itd", "it'll", "its", "it's", "itself", "i've", "ive", "j", "just", "k", "keep", "keeps",
    "kept", "kg", "km", "know", "known", "knows", "l", "largely", "last", "lately", "later", "latter",
    "latterly", "least", "less", "lest", "let", "lets", "let's", "like", "liked", "likely", "line", "little",
    "'ll", "look", "looking", "looks", "ltd", "m", "made", "mainly", "make", "makes", "many", "may", "maybe",
    "me", "mean", "means", "meantime", "meanwhile", "merely", "mg", "might", "million", "miss", "ml", "more",
    "moreover", "most", "mostly", "mr", "mr.", "mrs", "mrs.", "ms", "ms.", "much", "mug", "must", "my",
    "myself", "n", "na", "name", "namely", "nay", "nd", "near", "nearly", "necessarily", "necessary", "need",
    "needs", "neither", "never", "nevertheless", "new", "next", "nine", "ninety", "no", "nobody", "non",
    "none", "nonetheless", "noone", "nor", "normally", "nos", "not", "note", "noted", "nothing", "now",
    "nowhere", "o", "obtain", "obtained", "obviously", "of", "off", "often", "oh", "ok", "okay", "old",
    "omit", "omitted", "on", "once", "one", "ones", "only", "onto", "or", "ord", "other", "others",
    "otherwise", "ought", "our", "ours", "ourselves", "out", "outside", "over", "overall", "owing", "own",
    "p", "page", "pages", "part", "particular", "particularly", "past", "per", "perhaps", "placed", "please",
    "plus", "poorly", "possible", "possibly", "potentially", "pp", "predominantly", "present", "previously",
    "primarily", "probably", "promptly", "proud", "provide", "provides", "put", "q", "que", "quickly",
    "quite", "qv", "r", "ran", "rather", "rd", "re", "readily", "really", "recent", "recently", "ref",
    "refs", "regarding", "regardless", "regards", "regard", "related", "relative", "relatively", "research",
    "respectively", "resulted", "resulting", "results", "right", "run", "s", "said", "same", "saw", "say",
    "saying", "says", "see", "seeing", "seem", "seemed", "seeming", "seems", "seen", "self", "selves",
    "sent", "seven", "several", "shall", "she", "shed", "she'll", "shes", "she's", "should", "shouldn't",
    "shouldnt", "show", "showed", "shown", "showns", "shows", "significant", "significantly", "similar",
    "similarly", "since", "six", "slightly", "so", "some", "somebody", "somehow", "someone", "somethan",
    "something", "sometime", "sometimes", "somewhat", "somewhere", "soon", "sorry", "specifically",
    "specified", "specify", "specifying", "still", "stop", "strongly", "sub", "substantially",
    "successfully", "such", "sufficiently", "suggest", "sup", "sure", "t", "take", "taken", "taking", "talk",
    "talked", "td", "tell", "tends", "th", "than", "thank", "thanks", "thanx", "that", "that'll", "thats",
    "that've", "the", "their", "theirs", "them", "themselves", "then", "thence", "there", "thereafter",
    "thereby", "thered", "therefore", "therein", "there'll", "thereof", "therere", "theres", "thereto",
    "thereupon", "there've", "these", "they", "theyd", "they'll", "theyre", "they've", "think", "this",
    "those", "thou", "though", "thoughh", "thousand", "throug", "through", "throughout", "thru", "thus",
    "til", "tip", "to", "together", "too", "took", "toward", "towards", "tr", "tried", "tries", "truly",
    "try", "trying", "ts", "twice", "two", "u", "un", "under", "unfortunately", "unless", "unlike",
    "unlikely", "until", "unto", "up", "upon", "ups", "us", "use", "used", "useful", "usefully",
    "usefulness", "uses", "using", "usually", "v", "value", "various", "ve", "very", "via", "viz", "vol",
    "vols", "vs", "w", "want", "wants", "was", "wasnt", "way", "we", "wed", "welcome", "well", "we'll",
    "went", "were", "werent", "we've", "what", "whatever", "what'll", "whats", "when", "whence", "whenever",
    "where", "whereafter", "whereas", "whereby", "wherein", "wheres", "whereupon", "wherever", "whether",
    "which", "while", "whim", "whither", "who", "whod", "whoever", "whole", "who'll", "whom", "whomever",
    "whos", "whose", "why", "widely", "willing", "will", "wish", "with", "within", "without", "wont",
    "words", "world", "would", "wouldnt", "www", "x", "xx", "xxx", "y", "yes", "yet", "you", "youd",
    "you'll", "your", "youre", "yours", "yourself", "yourselves", "you've", "z", "zero", "xoxo", "ii", "iii",
    "iv", "ix", "vi", "vii", "viii", "<th>", "<tr>", "three", "ten", "view", "met", "follow", "consist",
    "lack", "lacks", "base", "based", "ago", "addition", "additional", "depend", "depends", "include",
    "includes", "including", "continue", "bring", "brings", "ahead", "add", "adds", "attribute",
    "attributes", "associated", "associate", "happen", "happened", "happening", "single", "consider",
    "considered", "looked", "involve", "involves", "involved", "thing", "things", "going", "brought", "lot"
    };
    return kStopWords;
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsPunctuationMark(char c) {
    switch (c) {
        case '-': case ',': case '\'': case '/': case ':':
        case '.': case '?': case '%': case '[': case ']':
            return true;
        default:
            return false;
    }
}

bool IsAllDigits(const std::string& word) {
    return !word.empty() && std::all_of(word.begin(), word.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

WordTokenizer::WordTokenizer(WordTokenizerOptions options) : m_options(options) {}

std::vector<WordToken> WordTokenizer::SplitOnWhitespace(const std::string& text) {
    std::vector<WordToken> tokens;
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        while (i < n && IsSpace(text[i])) ++i;
        if (i >= n) break;
        std::size_t start = i;
        while (i < n && !IsSpace(text[i])) ++i;
        WordToken tok;
        tok.text = text.substr(start, i - start);
        tok.start = start;
        tok.end = i;
        tok.position = tokens.size();
        tokens.push_back(std::move(tok));
    }
    return tokens;
}

std::string WordTokenizer::StripPunctuation(const std::string& word) {
    std::string out;
    out.reserve(word.size());
    for (char c : word) {
        if (!IsPunctuationMark(c)) out.push_back(c);
    }
    return out;
}

std::string WordTokenizer::ToLower(const std::string& word) {
    std::string out;
    out.reserve(word.size());
    for (unsigned char c : word) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool WordTokenizer::IsStopWord(const std::string& word) {
    return StopWords().count(ToLower(word)) > 0;
}

std::vector<WordToken> WordTokenizer::tokenize(const std::string& text) const {
    std::vector<WordToken> out;
    for (auto& tok : SplitOnWhitespace(text)) {
        if (m_options.removePunctuation) {
            tok.text = StripPunctuation(tok.text);
            if (tok.text.empty()) continue;
        }
        if (m_options.lowerCase) {
            tok.text = ToLower(tok.text);
        }
        if (m_options.removeStopWords && IsStopWord(tok.text)) continue;
        if (m_options.removeNumbers && IsAllDigits(tok.text)) continue;
        if (m_options.oneLetterRemoval && tok.text.size() <= 1) continue;
        out.push_back(std::move(tok));
    }
    return out;
}

std::vector<std::string> WordTokenizer::words(const std::string& text) const {
    std::vector<std::string> out;
    for (auto& tok : tokenize(text)) {
        out.push_back(std::move(tok.text));
    }
    return out;
}

} // namespace provenance::domain::text
