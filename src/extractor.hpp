#pragma once
#include <string>
#include <vector>
#include <optional>

namespace memora {

// Pulls the part of a conversation worth remembering for any of the given
// topics. Implementations may call out to a language model; they must be
// callable from several threads.
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual std::string name() const = 0;

    // nullopt when nothing in the text relates to a topic.
    virtual std::optional<std::string> extract(const std::string& text,
                                               const std::vector<std::string>& topics) = 0;
};

// Case-insensitive keyword match. A topic matches when its whole phrase
// occurs in the text, or any of its words of four or more letters does.
// The extracted span is the whole text.
class KeywordExtractor : public Extractor {
public:
    std::string name() const override { return "keyword"; }

    std::optional<std::string> extract(const std::string& text,
                                       const std::vector<std::string>& topics) override;

    // Topic that matched first, if any
    static std::optional<std::string> matching_topic(const std::string& text,
                                                     const std::vector<std::string>& topics);
};

} // namespace memora
