/**
 * DevConsole — Developer-only inspection and surgery on the scheduler queue.
 *
 * Results go to the output buffer (SYSTEM for listings, SUCCESS / FAILURE
 * for edits). Every call is logged at warning level so a transcript of
 * debug interventions survives in the log.
 */

#ifndef STORY_RULES_DEV_CONSOLE_HPP
#define STORY_RULES_DEV_CONSOLE_HPP

#include "rules/scheduler.hpp"
#include <string>

namespace story {
class World;
class OutputBuffer;
}

namespace story::rules {

class DevConsole {
public:
    static void list_pending(const Scheduler& scheduler, const World& world, OutputBuffer& view);
    static bool cancel(Scheduler& scheduler, EventId id, const World& world, OutputBuffer& view);
    static bool delay(Scheduler& scheduler, EventId id, uint64_t turns,
                      const World& world, OutputBuffer& view);

    /** One block of the pending listing, without trailing newline. */
    static std::string format_event(const ScheduledEvent& ev);
};

} // namespace story::rules

#endif // STORY_RULES_DEV_CONSOLE_HPP
