#include "extractor.hpp"
#include "util.hpp"

namespace memora {

static constexpr size_t kMinTopicWord = 4;

std::optional<std::string> KeywordExtractor::matching_topic(
        const std::string& text, const std::vector<std::string>& topics) {
    std::string lower = to_lower(text);

    for (const auto& topic : topics) {
        std::string phrase = to_lower(trim(topic));
        if (phrase.empty()) continue;
        if (lower.find(phrase) != std::string::npos) return topic;

        for (const auto& word : tokenize(phrase)) {
            if (word.size() >= kMinTopicWord && lower.find(word) != std::string::npos) {
                return topic;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> KeywordExtractor::extract(const std::string& text,
                                                     const std::vector<std::string>& topics) {
    if (trim(text).empty()) return std::nullopt;
    if (!matching_topic(text, topics)) return std::nullopt;
    return text;
}

} // namespace memora
