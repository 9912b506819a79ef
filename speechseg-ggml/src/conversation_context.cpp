#include "conversation_context.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace speechseg {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

ConversationContext::ConversationContext(int history_size, int max_prompt_chars)
    : history_size_(std::max(1, history_size)),
      max_prompt_chars_(std::max(0, max_prompt_chars)) {}

void ConversationContext::add(double start, double end, const std::string& text,
                              const std::string& speaker_id) {
    std::string t = trim(text);
    if (t.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mtx_);

    // Streams release independently, so entries may arrive out of time order
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), start,
                                [](double s, const ContextEntry& e) { return s < e.start; });
    entries_.insert(pos, ContextEntry{start, end, std::move(t), speaker_id});

    while (static_cast<int>(entries_.size()) > history_size_) {
        entries_.pop_front();
    }
}

std::string ConversationContext::build_prompt(double before_time) const {
    std::lock_guard<std::mutex> lock(mtx_);

    std::string prompt;
    for (const auto& e : entries_) {
        if (e.end > before_time) {
            continue;
        }
        if (!prompt.empty()) {
            prompt += ' ';
        }
        prompt += e.text;
    }

    if (static_cast<int>(prompt.size()) > max_prompt_chars_) {
        size_t cut = prompt.size() - static_cast<size_t>(max_prompt_chars_);
        // Do not start the prompt in the middle of a word
        while (cut < prompt.size() && prompt[cut] != ' ') cut++;
        while (cut < prompt.size() && prompt[cut] == ' ') cut++;
        prompt = prompt.substr(cut);
    }
    return prompt;
}

int ConversationContext::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<int>(entries_.size());
}

void ConversationContext::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
}

}  // namespace speechseg
