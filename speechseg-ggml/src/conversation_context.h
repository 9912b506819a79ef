#pragma once

#include <deque>
#include <mutex>
#include <string>

// Recent transcript of the whole session, shared by all streams.
// Released text from every speaker is kept in start-time order so that the
// recognition prompt for one speaker includes what the others just said.

namespace speechseg {

struct ContextEntry {
    double start;
    double end;
    std::string text;
    std::string speaker_id;
};

class ConversationContext {
public:
    explicit ConversationContext(int history_size = 30, int max_prompt_chars = 800);

    void add(double start, double end, const std::string& text, const std::string& speaker_id);

    // Text of the entries that ended at or before `before_time`, oldest
    // first, trimmed from the front to at most max_prompt_chars.
    std::string build_prompt(double before_time) const;

    int size() const;
    void clear();

private:
    mutable std::mutex mtx_;
    std::deque<ContextEntry> entries_;
    int history_size_;
    int max_prompt_chars_;
};

}  // namespace speechseg
