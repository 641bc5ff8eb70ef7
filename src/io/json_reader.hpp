/**
 * Lightweight JSON Reader
 *
 * Recursive-descent parser producing a tree of JsonValue nodes.
 * Handles objects, arrays, strings, numbers (including scientific notation),
 * booleans, and null. No external dependencies.
 *
 * Integer literals keep their exact 64-bit value next to the double, so turn
 * counters and event ids survive a save/load cycle bit-for-bit. Object
 * members remember their source order.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("bundle.json");
 *   uint64_t turn = root["turn_count"].as_u64();
 *   std::string name = root["rooms"][0]["name"].as_string();
 */

#ifndef STORY_IO_JSON_READER_HPP
#define STORY_IO_JSON_READER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <stdexcept>

namespace story {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

class JsonValue {
public:
    JsonType type = JsonType::NIL;

    // Constructors
    JsonValue() = default;
    explicit JsonValue(bool v) : type(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(int64_t v)
        : type(JsonType::NUMBER), num_val_(static_cast<double>(v)),
          int_val_(v), is_integer_(true) {}
    explicit JsonValue(const std::string& v) : type(JsonType::STRING), str_val_(v) {}
    explicit JsonValue(std::string&& v) : type(JsonType::STRING), str_val_(std::move(v)) {}

    // Type checks
    bool is_null()    const { return type == JsonType::NIL; }
    bool is_bool()    const { return type == JsonType::BOOL; }
    bool is_number()  const { return type == JsonType::NUMBER; }
    bool is_integer() const { return type == JsonType::NUMBER && is_integer_; }
    bool is_string()  const { return type == JsonType::STRING; }
    bool is_object()  const { return type == JsonType::OBJECT; }
    bool is_array()   const { return type == JsonType::ARRAY; }

    // Value accessors (throw on type mismatch)
    bool as_bool() const {
        if (type != JsonType::BOOL) throw std::runtime_error("JsonValue: not a bool");
        return bool_val_;
    }

    double as_number() const {
        if (type != JsonType::NUMBER) throw std::runtime_error("JsonValue: not a number");
        return num_val_;
    }

    int as_int() const { return static_cast<int>(as_i64()); }

    int64_t as_i64() const {
        if (type != JsonType::NUMBER) throw std::runtime_error("JsonValue: not a number");
        return is_integer_ ? int_val_ : static_cast<int64_t>(num_val_);
    }

    uint64_t as_u64() const {
        int64_t v = as_i64();
        if (v < 0) throw std::runtime_error("JsonValue: negative value where unsigned expected");
        return static_cast<uint64_t>(v);
    }

    const std::string& as_string() const {
        if (type != JsonType::STRING) throw std::runtime_error("JsonValue: not a string");
        return str_val_;
    }

    // Safe accessors (return defaults on type mismatch)
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() ? static_cast<int>(as_i64()) : def; }
    int64_t get_i64(int64_t def = 0) const { return is_number() ? as_i64() : def; }
    uint64_t get_u64(uint64_t def = 0) const {
        return (is_number() && as_i64() >= 0) ? static_cast<uint64_t>(as_i64()) : def;
    }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    // Object access
    const JsonValue& operator[](const std::string& key) const {
        if (type != JsonType::OBJECT) return null_value();
        auto it = obj_map_.find(key);
        if (it == obj_map_.end()) return null_value();
        return it->second;
    }

    bool has(const std::string& key) const {
        if (type != JsonType::OBJECT) return false;
        return obj_map_.count(key) > 0;
    }

    const std::unordered_map<std::string, JsonValue>& as_object() const {
        return obj_map_;
    }

    /** Member names in the order they appeared in the source text. */
    const std::vector<std::string>& keys() const { return obj_keys_; }

    // Array access
    const JsonValue& operator[](size_t index) const {
        if (type != JsonType::ARRAY || index >= arr_val_.size()) return null_value();
        return arr_val_[index];
    }

    size_t size() const {
        if (type == JsonType::ARRAY) return arr_val_.size();
        if (type == JsonType::OBJECT) return obj_map_.size();
        return 0;
    }

    const std::vector<JsonValue>& as_array() const {
        return arr_val_;
    }

    // Mutators (for building values during parse)
    void set_object() { type = JsonType::OBJECT; }
    void set_array()  { type = JsonType::ARRAY; }

    void add_member(const std::string& key, JsonValue&& val) {
        if (obj_map_.count(key) == 0) obj_keys_.push_back(key);
        obj_map_[key] = std::move(val);
    }

    void add_element(JsonValue&& val) {
        arr_val_.push_back(std::move(val));
    }

private:
    bool bool_val_ = false;
    double num_val_ = 0.0;
    int64_t int_val_ = 0;
    bool is_integer_ = false;
    std::string str_val_;
    std::unordered_map<std::string, JsonValue> obj_map_;
    std::vector<std::string> obj_keys_;
    std::vector<JsonValue> arr_val_;

    static const JsonValue& null_value() {
        static JsonValue nil;
        return nil;
    }
};

class JsonReader {
public:
    /**
     * Parse a JSON string into a JsonValue tree.
     * @throws std::runtime_error on parse errors (message carries line:column)
     */
    static JsonValue parse(const std::string& json);

    /**
     * Parse a JSON file into a JsonValue tree.
     * @throws std::runtime_error on file or parse errors
     */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace story

#endif  // STORY_IO_JSON_READER_HPP
