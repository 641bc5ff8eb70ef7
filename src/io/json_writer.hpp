/**
 * Lightweight JSON Writer (header-only)
 *
 * Produces well-formed JSON, pretty-printed or compact (indent_size = 0).
 * Writes straight to an ostream; used for transcripts and snapshots.
 *
 * Usage:
 *   std::ofstream f("save.json");
 *   JsonWriter w(f);
 *   w.begin_object();
 *     w.kv("turn_count", world.turn_count);
 *     w.key("pending").begin_array();
 *       ...
 *     w.end_array();
 *   w.end_object();
 */

#ifndef STORY_IO_JSON_WRITER_HPP
#define STORY_IO_JSON_WRITER_HPP

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace story {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    // ── Structure ──

    JsonWriter& begin_object() {
        if (!expect_value_) write_separator();
        os_ << '{';
        expect_value_ = false;
        push_scope(OBJECT);
        return *this;
    }

    JsonWriter& end_object() {
        bool had_items = pop_scope();
        if (had_items) newline();
        os_ << '}';
        return *this;
    }

    JsonWriter& begin_array() {
        if (!expect_value_) write_separator();
        os_ << '[';
        expect_value_ = false;
        push_scope(ARRAY);
        return *this;
    }

    JsonWriter& end_array() {
        bool had_items = pop_scope();
        if (had_items) newline();
        os_ << ']';
        return *this;
    }

    // ── Keys (object members) ──

    JsonWriter& key(const std::string& k) {
        write_separator();
        os_ << '"';
        write_escaped(k);
        os_ << (indent_size_ > 0 ? "\": " : "\":");
        expect_value_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        if (!expect_value_) write_separator();
        os_ << '"';
        write_escaped(v);
        os_ << '"';
        expect_value_ = false;
        return *this;
    }

    JsonWriter& value(const char* v) {
        return value(std::string(v));
    }

    // Every integral width: turns and event ids are uint64_t.
    template<typename T,
             typename std::enable_if<std::is_integral<T>::value &&
                                     !std::is_same<T, bool>::value, int>::type = 0>
    JsonWriter& value(T v) {
        if (!expect_value_) write_separator();
        os_ << v;
        expect_value_ = false;
        return *this;
    }

    JsonWriter& value(double v) {
        if (!expect_value_) write_separator();
        if (std::isnan(v) || std::isinf(v)) {
            os_ << "null";
        } else {
            os_ << std::setprecision(15) << v;
        }
        expect_value_ = false;
        return *this;
    }

    JsonWriter& value(bool v) {
        if (!expect_value_) write_separator();
        os_ << (v ? "true" : "false");
        expect_value_ = false;
        return *this;
    }

    JsonWriter& null_value() {
        if (!expect_value_) write_separator();
        os_ << "null";
        expect_value_ = false;
        return *this;
    }

    JsonWriter& string_array(const std::vector<std::string>& items) {
        begin_array();
        for (const auto& s : items) value(s);
        return end_array();
    }

    // ── Convenience: key-value pair ──

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        value(v);
        return *this;
    }

private:
    enum ScopeType { OBJECT, ARRAY };

    struct Scope {
        ScopeType type;
        int count = 0;  // Number of items written at this level
    };

    std::ostream& os_;
    int indent_size_;
    std::vector<Scope> stack_;
    bool expect_value_ = false;

    void push_scope(ScopeType type) {
        stack_.push_back({type, 0});
    }

    bool pop_scope() {
        bool had_items = false;
        if (!stack_.empty()) {
            had_items = stack_.back().count > 0;
            stack_.pop_back();
        }
        return had_items;
    }

    void write_separator() {
        if (expect_value_) return;  // After key: no comma/newline needed

        if (!stack_.empty()) {
            auto& scope = stack_.back();
            if (scope.count > 0) {
                os_ << ',';
            }
            newline();
            scope.count++;
        }
    }

    void newline() {
        if (indent_size_ <= 0) return;
        os_ << '\n';
        int depth = static_cast<int>(stack_.size());
        for (int i = 0; i < depth * indent_size_; i++) {
            os_ << ' ';
        }
    }

    void write_escaped(const std::string& s) {
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\b': os_ << "\\b";  break;
                case '\f': os_ << "\\f";  break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
    }
};

}  // namespace story

#endif  // STORY_IO_JSON_WRITER_HPP
