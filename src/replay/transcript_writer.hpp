/**
 * TranscriptWriter — Collects per-command results and writes transcript JSON.
 *
 * Each script command contributes one entry: the turn it ended on, the
 * triggers it fired and the tagged output it flushed. The final section
 * summarises score, health and the scheduler queue.
 */

#ifndef STORY_REPLAY_TRANSCRIPT_WRITER_HPP
#define STORY_REPLAY_TRANSCRIPT_WRITER_HPP

#include "replay/script_runner.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace story {

class TranscriptWriter {
public:
    TranscriptWriter() = default;

    void record(const TranscriptEntry& entry);
    void record_all(const std::vector<TranscriptEntry>& entries);

    size_t size() const { return entries_.size(); }

    /**
     * Write the complete transcript JSON to the output stream.
     */
    void write_json(std::ostream& out, const ReplayConfig& config, const World& world,
                    const rules::Scheduler& scheduler) const;

    /** Plain-text rendering, one "[tag] text" line per output item. */
    void write_text(std::ostream& out) const;

private:
    std::vector<TranscriptEntry> entries_;
};

} // namespace story

#endif // STORY_REPLAY_TRANSCRIPT_WRITER_HPP
