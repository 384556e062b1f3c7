#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wordpulse {

/// Ordered list of display tokens. Immutable once loaded.
class WordSequence {
public:
    WordSequence() = default;
    explicit WordSequence(std::vector<std::string> words) : words_(std::move(words)) {}

    /// Split UTF-8 text on whitespace. Empty input gives an empty sequence.
    static WordSequence fromText(const std::string& text);

    /// Read a UTF-8 text file. Returns nullopt if the file can't be read.
    static std::optional<WordSequence> loadFile(const std::string& path);

    int size() const { return static_cast<int>(words_.size()); }
    bool empty() const { return words_.empty(); }

    /// Word at a 0-based index
    const std::string& at(int index) const { return words_[static_cast<size_t>(index)]; }

    const std::vector<std::string>& words() const { return words_; }

    /// Clamp a 1-based start index to [1, size()] (1 for an empty sequence)
    int clampStartIndex(int oneBased) const;

private:
    std::vector<std::string> words_;
};

} // namespace wordpulse
