#pragma once

#include <expected>
#include <string>

// Fire-and-forget delivery of a named event to the UI layer.
// No acknowledgement, no way to ask whether anyone is listening.
class EventBus {
public:
    virtual ~EventBus() = default;
    virtual std::expected<void, std::string> emit(const std::string& event,
                                                  const std::string& payload) = 0;
};
