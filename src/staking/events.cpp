// STAKELEDGER - Events
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/events.h"

#include "stakeledger/util/logging.h"

#include <sstream>
#include <stdexcept>

namespace stakeledger {
namespace staking {

int64_t StakingEvent::Get(const std::string& name) const {
    for (const auto& field : fields) {
        if (field.first == name) {
            return field.second;
        }
    }
    throw std::out_of_range("event " + topic + " has no field " + name);
}

std::string StakingEvent::ToString() const {
    std::ostringstream ss;
    ss << topic << " principal=" << principal.ToHex();
    for (const auto& field : fields) {
        ss << " " << field.first << "=" << field.second;
    }
    return ss.str();
}

void LogEventSink::Publish(const StakingEvent& event) {
    LOG_INFO(util::LogCategory::EVENTS) << event.ToString();
}

std::vector<StakingEvent> RecordingEventSink::WithTopic(const std::string& topic) const {
    std::vector<StakingEvent> result;
    for (const auto& event : events_) {
        if (event.topic == topic) {
            result.push_back(event);
        }
    }
    return result;
}

} // namespace staking
} // namespace stakeledger
