// STAKELEDGER - Event Sinks
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_STAKING_EVENTS_H
#define STAKELEDGER_STAKING_EVENTS_H

#include "stakeledger/staking/interfaces.h"

#include <vector>

namespace stakeledger {
namespace staking {

/// Writes each event to the logger (events category, Info level)
class LogEventSink : public EventSink {
public:
    void Publish(const StakingEvent& event) override;
};

/// Keeps published events in memory
class RecordingEventSink : public EventSink {
public:
    void Publish(const StakingEvent& event) override { events_.push_back(event); }
    
    const std::vector<StakingEvent>& Events() const { return events_; }
    
    /// Events with the given topic, in publication order
    std::vector<StakingEvent> WithTopic(const std::string& topic) const;
    
    void Clear() { events_.clear(); }

private:
    std::vector<StakingEvent> events_;
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_EVENTS_H
