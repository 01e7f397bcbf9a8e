#pragma once

#include <gmock/gmock.h>
#include "runtime/ICallbackRegistry.h"
#include <string>

class MockCallbackRegistry : public MST::ICallbackRegistry
{
public:
    MOCK_CONST_METHOD1(getOutgoing, MST::TransitionAction(const std::string &));
    MOCK_CONST_METHOD2(getIncoming, MST::TransitionAction(const std::string &, const std::string &));
};
