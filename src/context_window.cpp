#include "context_window.hpp"

namespace memora {

uint32_t estimate_tokens(const std::vector<Message>& messages) {
    size_t total_chars = 0;
    for (const auto& msg : messages) {
        total_chars += msg.content.size();
    }
    return static_cast<uint32_t>(total_chars / 4);
}

std::vector<Message> truncate_history(const std::vector<Message>& history,
                                      uint32_t max_tokens) {
    // Budget in characters, floored once over the whole kept set so the
    // result never estimates above max_tokens (unless system alone does).
    std::vector<bool> keep(history.size(), false);
    size_t kept_chars = 0;
    for (size_t i = 0; i < history.size(); ++i) {
        if (history[i].role == Role::System) {
            keep[i] = true;
            kept_chars += history[i].content.size();
        }
    }

    for (size_t i = history.size(); i-- > 0;) {
        if (history[i].role == Role::System) continue;
        size_t len = history[i].content.size();
        if ((kept_chars + len) / 4 > max_tokens) break;
        kept_chars += len;
        keep[i] = true;
    }

    std::vector<Message> result;
    for (size_t i = 0; i < history.size(); ++i) {
        if (keep[i]) result.push_back(history[i]);
    }
    return result;
}

size_t manage_context_window(std::vector<Message>& history, uint32_t max_tokens) {
    if (estimate_tokens(history) <= max_tokens) return 0;

    size_t before = history.size();
    history = truncate_history(history, max_tokens);
    return before - history.size();
}

} // namespace memora
