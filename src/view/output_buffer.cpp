#include "view/output_buffer.hpp"
#include <utility>

namespace story {

const char* output_tag_name(OutputTag tag) {
    switch (tag) {
        case OutputTag::SUCCESS:   return "success";
        case OutputTag::FAILURE:   return "failure";
        case OutputTag::ERROR:     return "error";
        case OutputTag::TRIGGERED: return "triggered";
        case OutputTag::AMBIENT:   return "ambient";
        case OutputTag::DIALOGUE:  return "dialogue";
        case OutputTag::POINTS:    return "points";
        case OutputTag::STATUS:    return "status";
        case OutputTag::TRANSIT:   return "transit";
        case OutputTag::SYSTEM:    return "system";
    }
    return "triggered";
}

void OutputBuffer::push(OutputTag tag, const std::string& text, const std::string& speaker) {
    items_.push_back({tag, text, speaker});
}

std::vector<OutputItem> OutputBuffer::flush() {
    std::vector<OutputItem> batch;
    batch.swap(items_);
    if (!batch.empty()) {
        flush_count_++;
        if (sink_) sink_(batch);
    }
    return batch;
}

} // namespace story
