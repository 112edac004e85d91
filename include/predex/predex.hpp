#ifndef PREDEX_PREDEX_HPP
#define PREDEX_PREDEX_HPP

// =============================================================================
// predex - three-phase prediction market engine
// =============================================================================

#include "types.hpp"
#include "uint256.hpp"
#include "math.hpp"
#include "config.hpp"
#include "log.hpp"
#include "events.hpp"
#include "auth.hpp"
#include "collaborators.hpp"
#include "curve.hpp"
#include "amm.hpp"
#include "positions.hpp"
#include "settlement.hpp"
#include "market.hpp"
#include "custody.hpp"

#endif // PREDEX_PREDEX_HPP
