#ifndef MULTISWAP_POOL_REPLAY_HPP
#define MULTISWAP_POOL_REPLAY_HPP

#include "pool.hpp"
#include "pool_json.hpp"

namespace multiswap {

struct ReplayOptions {
    // Snapshot after every Nth action; 0 keeps only the final state.
    long snapshot_every{1};
    // Emit "final_state" instead of the "states" array.
    bool save_last_only{false};
};

// SNAPSHOT_EVERY and SAVE_LAST_ONLY; invalid values are reported on
// std::cerr and ignored.
ReplayOptions replay_options_from_env();

// Runs one action against the pool and returns its outcome. Throws
// PoolError for rejected operations, std::exception for malformed actions.
json::value apply_action(Pool& pool, const json::object& act);

// Builds a pool from pool_config and replays sequence against it with a
// private store and transfer queue. A failing action is recorded in its
// snapshot and the sequence continues; only a bad pool config fails the
// whole result.
json::object replay_sequence(const json::object& pool_config,
                             const json::object& sequence,
                             const ReplayOptions& options);

} // namespace multiswap

#endif // MULTISWAP_POOL_REPLAY_HPP
