#include "core/WordSequence.h"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace wordpulse {

WordSequence WordSequence::fromText(const std::string& text) {
    // Whitespace splitting only: no case folding, no punctuation stripping
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        words.push_back(std::move(word));
    }
    return WordSequence(std::move(words));
}

std::optional<WordSequence> WordSequence::loadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::ostringstream contents;
    contents << file.rdbuf();
    return fromText(contents.str());
}

int WordSequence::clampStartIndex(int oneBased) const {
    if (words_.empty()) return 1;
    return std::max(1, std::min(oneBased, size()));
}

} // namespace wordpulse
