/**
 * Error types shared by the rule core and its loaders.
 *
 * ReferenceError is recoverable: a condition or action named a room, item,
 * NPC, trigger or flag that does not exist. Callers log it and carry on.
 *
 * LoadError and QueueCorruption are structural: they are raised while a
 * bundle or snapshot is being read, before the world becomes playable.
 */

#ifndef STORY_CORE_ERRORS_HPP
#define STORY_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace story {

class ReferenceError : public std::runtime_error {
public:
    explicit ReferenceError(const std::string& what)
        : std::runtime_error(what) {}
};

class LoadError : public std::runtime_error {
public:
    explicit LoadError(const std::string& what)
        : std::runtime_error(what) {}
};

// Persisted scheduler state that cannot have been produced by a valid session.
class QueueCorruption : public std::runtime_error {
public:
    explicit QueueCorruption(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace story

#endif // STORY_CORE_ERRORS_HPP
