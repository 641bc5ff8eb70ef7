#include "replay/transcript_writer.hpp"
#include "io/json_writer.hpp"

namespace story {

void TranscriptWriter::record(const TranscriptEntry& entry) {
    entries_.push_back(entry);
}

void TranscriptWriter::record_all(const std::vector<TranscriptEntry>& entries) {
    entries_.insert(entries_.end(), entries.begin(), entries.end());
}

void TranscriptWriter::write_json(std::ostream& out, const ReplayConfig& config,
                                  const World& world, const rules::Scheduler& scheduler) const {
    JsonWriter w(out);

    w.begin_object();

    // ── format ──
    w.kv("format", "transcript_v1");

    // ── config ──
    w.key("config").begin_object();
    w.kv("world", config.world_path);
    w.kv("script", config.script_path);
    if (config.load_path.empty()) {
        w.key("load").null_value();
    } else {
        w.kv("load", config.load_path);
    }
    w.kv("seed", world.rng.seed());
    w.kv("tombstoneRetention", config.core.tombstone_retention);
    w.end_object();

    // ── commands ──
    w.key("commands").begin_array();
    for (const auto& e : entries_) {
        w.begin_object();
        w.kv("index", e.index);
        w.kv("cmd", e.command);
        w.kv("turn", e.turn);
        w.kv("turnAdvanced", e.turn_advanced);
        w.key("fired").string_array(e.fired);

        w.key("output").begin_array();
        for (const auto& item : e.output) {
            w.begin_object();
            w.kv("tag", output_tag_name(item.tag));
            w.kv("text", item.text);
            if (!item.speaker.empty()) w.kv("speaker", item.speaker);
            w.end_object();
        }
        w.end_array();

        w.end_object();
    }
    w.end_array();

    // ── final ──
    w.key("final").begin_object();
    w.kv("turn", world.turn_count);
    w.kv("room", world.player_room());
    w.kv("score", world.player.score);
    w.kv("hp", world.player.health.current_hp());
    w.kv("alive", world.player.health.alive());
    w.kv("pendingEvents", scheduler.pending_count());
    w.kv("tombstones", scheduler.tombstone_count());
    w.end_object();

    w.end_object();
    out << '\n';
}

void TranscriptWriter::write_text(std::ostream& out) const {
    for (const auto& e : entries_) {
        out << "> " << e.command << "  (turn " << e.turn << ")\n";
        for (const auto& item : e.output) {
            out << "  [" << output_tag_name(item.tag) << "] ";
            if (!item.speaker.empty()) out << item.speaker << ": ";
            out << item.text << '\n';
        }
    }
}

} // namespace story
