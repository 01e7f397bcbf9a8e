#pragma once

#include <gmock/gmock.h>
#include "runtime/ICostProvider.h"
#include <string>

class MockCostProvider : public MST::ICostProvider
{
public:
    MOCK_CONST_METHOD2(getDynamicCost, double(const std::string &, double));
};
