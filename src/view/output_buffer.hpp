/**
 * OutputBuffer — Ordered, tagged output collected during one command cycle.
 *
 * The rule core never formats text for display. It appends items carrying a
 * semantic tag and hands the whole batch to the presentation layer when the
 * Turn Coordinator flushes.
 */

#ifndef STORY_VIEW_OUTPUT_BUFFER_HPP
#define STORY_VIEW_OUTPUT_BUFFER_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace story {

enum class OutputTag {
    SUCCESS,
    FAILURE,
    ERROR,
    TRIGGERED,      // authored trigger / scheduled event text
    AMBIENT,        // spinner and atmosphere lines
    DIALOGUE,
    POINTS,
    STATUS,         // health and status effects
    TRANSIT,        // NPCs entering / leaving, player movement
    SYSTEM          // developer console, engine notices
};

const char* output_tag_name(OutputTag tag);

struct OutputItem {
    OutputTag tag = OutputTag::TRIGGERED;
    std::string text;
    std::string speaker;    // DIALOGUE only
};

class OutputBuffer {
public:
    using Sink = std::function<void(const std::vector<OutputItem>&)>;

    void push(OutputTag tag, const std::string& text, const std::string& speaker = "");

    const std::vector<OutputItem>& items() const { return items_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    /** Called with each flushed batch (not called for empty batches). */
    void set_sink(Sink sink) { sink_ = std::move(sink); }

    /** Hand pending items to the sink, clear the buffer and return the batch. */
    std::vector<OutputItem> flush();

    /** Number of flushes that delivered at least one item. */
    size_t flush_count() const { return flush_count_; }

private:
    std::vector<OutputItem> items_;
    Sink sink_;
    size_t flush_count_ = 0;
};

} // namespace story

#endif // STORY_VIEW_OUTPUT_BUFFER_HPP
