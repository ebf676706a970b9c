#ifndef MILL_MILL_HPP
#define MILL_MILL_HPP

// =============================================================================
// Mill - Bonding Curve Pricing Engine
//
//   types.hpp   constants, enums, error codes
//   math.hpp    checked and 256-bit intermediate arithmetic
//   market.hpp  curve state, quoting, fee accounting
//   swap.hpp    fee-inclusive trade settlement
//   config.hpp  JSON market configuration
//
// =============================================================================

#include "types.hpp"
#include "math.hpp"
#include "market.hpp"
#include "swap.hpp"
#include "config.hpp"

namespace mill {

static constexpr const char* version() { return "1.0.0"; }

} // namespace mill

#endif // MILL_MILL_HPP
