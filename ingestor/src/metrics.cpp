#include "metrics.hpp"

nlohmann::json Metrics::to_json() const {
    return {
        {"updates_received", updates_received.load()},
        {"reconnects", reconnects.load()},
        {"backfilled_slots", backfilled_slots.load()},
        {"last_slot", last_slot.load()},
        {"decode_errors", decode_errors.load()},
        {"unresolvable", unresolvable.load()},
        {"inconsistent", inconsistent.load()},
        {"non_sol_pool", non_sol_pool.load()},
        {"zero_amount", zero_amount.load()},
        {"duplicates", duplicates.load()},
        {"late_trades", late_trades.load()},
        {"pool_fetches", pool_fetches.load()},
        {"pools_registered", pools_registered.load()},
        {"curves_completed", curves_completed.load()},
        {"swaps_decoded", swaps_decoded.load()},
        {"trades_admitted", trades_admitted.load()},
        {"trades_written", trades_written.load()},
        {"conflicts", conflicts.load()},
        {"batches_written", batches_written.load()},
        {"batch_retries", batch_retries.load()},
        {"batch_failures", batch_failures.load()},
        {"publish_failures", publish_failures.load()}
    };
}
