#pragma once

#include "event_bus.hpp"
#include <gmock/gmock.h>

namespace atx {
namespace mocks {

class MockEventPusher : public trading_engine::EventPusher {
public:
    MOCK_METHOD(void, push_event, (trading_engine::EngineEvent event), (override));
};

}
}
