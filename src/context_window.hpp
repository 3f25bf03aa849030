#pragma once
#include "session.hpp"
#include <vector>
#include <cstdint>

namespace memora {

// Estimated tokens for a run of messages: total content characters / 4.
// An approximation, not a tokenizer; used consistently for budgeting.
uint32_t estimate_tokens(const std::vector<Message>& messages);

// Hard truncation to a token budget.
//
// System messages are always kept in full. Non-system messages are taken
// newest-first while (system chars + kept chars) / 4 stays within max_tokens;
// the first one that does not fit ends the walk, so the kept non-system
// messages are a contiguous suffix, possibly empty. Kept messages stay in
// their original relative order.
std::vector<Message> truncate_history(const std::vector<Message>& history,
                                      uint32_t max_tokens);

// Apply truncate_history only when the estimate exceeds the budget.
// Returns the number of messages dropped.
size_t manage_context_window(std::vector<Message>& history, uint32_t max_tokens);

} // namespace memora
