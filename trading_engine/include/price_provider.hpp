#pragma once

#include "types/common_types.hpp"
#include <string>

namespace atx {
namespace trading_engine {

class PriceProvider {
public:
    virtual ~PriceProvider() = default;

    // Price of one unit of `asset` in `quote`; false when no recent market data exists
    virtual bool get_latest_price(const std::string& asset, const std::string& quote, types::Price& price) = 0;
};

} // namespace trading_engine
} // namespace atx
