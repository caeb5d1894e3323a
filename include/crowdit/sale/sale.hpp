#pragma once

#include "audit_log.hpp"
#include "crowdsale.hpp"
#include "events.hpp"
#include "issuer.hpp"
#include "journal.hpp"
#include "payment.hpp"
#include "snapshot.hpp"
#include "types.hpp"

namespace crowdit {
    // Aggregates sale headers under crowdit
}
