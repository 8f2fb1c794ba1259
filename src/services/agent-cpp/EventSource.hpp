#pragma once

#include "EventNormalizer.hpp"

#include <optional>
#include <string>

// A platform event stream. The severity filter is applied by the source when it
// subscribes; callers only see records that passed it.
class EventSource {
public:
    virtual ~EventSource() = default;

    virtual const std::string& Name() const = 0;
    virtual bool Open() = 0;
    virtual bool IsOpen() const = 0;
    // Descriptor that becomes readable when records are available, -1 when closed.
    virtual int WaitFd() const = 0;
    // Non-blocking; std::nullopt when nothing is buffered.
    virtual std::optional<RawEvent> PollNext() = 0;
    virtual void Close() = 0;
};
