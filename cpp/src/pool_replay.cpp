#include "pool_replay.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace multiswap {

namespace {

json::object snapshot(const Pool& pool,
                      const MemoryBalanceStore& store,
                      const RecordingTransfer& transfer) {
    json::object obj = state_to_json(pool.state());
    obj["shares"] = shares_to_json(store, pool.share_prefix());
    obj["transfers"] = transfer.requests().size();
    return obj;
}

json::object error_json(const char* code, const char* message) {
    json::object obj;
    obj["code"] = code;
    obj["message"] = message;
    return obj;
}

bool snapshot_due(const ReplayOptions& options, size_t actions_done) {
    if (options.save_last_only || options.snapshot_every <= 0) return false;
    return actions_done % static_cast<size_t>(options.snapshot_every) == 0;
}

} // namespace

ReplayOptions replay_options_from_env() {
    ReplayOptions options;
    if (const char* env = std::getenv("SAVE_LAST_ONLY")) {
        options.save_last_only = std::string(env) == "1";
    }
    if (const char* sev = std::getenv("SNAPSHOT_EVERY")) {
        try {
            options.snapshot_every = std::stol(sev);
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid SNAPSHOT_EVERY=" << sev << std::endl;
        }
    }
    return options;
}

json::value apply_action(Pool& pool, const json::object& act) {
    const std::string type = json_string(act.at("type"));
    if (type == "add_liquidity") {
        return balance_to_json(pool.add_liquidity(
            json_string(act.at("provider")),
            balances_from_json(act.at("amounts"))
        ));
    }
    if (type == "remove_liquidity") {
        return balances_to_json(pool.remove_liquidity(
            json_string(act.at("provider")),
            balance_from_json(act.at("shares")),
            balances_from_json(act.at("min_amounts"))
        ));
    }
    if (type == "swap") {
        return balance_to_json(pool.swap(
            json_string(act.at("sender")),
            json_string(act.at("token_in")),
            balance_from_json(act.at("amount_in")),
            json_string(act.at("token_out")),
            balance_from_json(act.at("min_amount_out"))
        ));
    }
    if (type == "quote") {
        return balance_to_json(pool.quote(
            json_string(act.at("token_in")),
            balance_from_json(act.at("amount_in")),
            json_string(act.at("token_out"))
        ));
    }
    throw std::invalid_argument("unknown action type: " + type);
}

json::object replay_sequence(const json::object& pool_config,
                             const json::object& sequence,
                             const ReplayOptions& options) {
    json::object result;
    if (const auto* name = pool_config.if_contains("name")) {
        result["pool_name"] = *name;
    }

    try {
        std::vector<TokenId> tokens;
        for (const auto& t : pool_config.at("tokens").as_array()) {
            tokens.push_back(json_string(t));
        }
        const uint32_t id = pool_config.if_contains("id")
            ? uint32_from_json(pool_config.at("id"), "id")
            : 0;
        const uint32_t fee = uint32_from_json(pool_config.at("fee"), "fee");

        MemoryBalanceStore store;
        RecordingTransfer transfer;
        Pool pool(id, tokens, fee, store, transfer);

        if (const auto* init = pool_config.if_contains("initial_liquidity")) {
            const auto& init_obj = init->as_object();
            pool.add_liquidity(json_string(init_obj.at("provider")),
                               balances_from_json(init_obj.at("amounts")));
        }

        const json::array& actions = sequence.at("actions").as_array();

        json::array states;
        if (snapshot_due(options, 0)) {
            states.push_back(snapshot(pool, store, transfer));
        }

        bool all_success = true;
        size_t done = 0;
        for (const auto& action : actions) {
            json::value label;
            json::object entry;
            try {
                const auto& act = action.as_object();
                if (const auto* type = act.if_contains("type")) label = *type;
                entry["result"] = apply_action(pool, act);
                entry["action_success"] = true;
            } catch (const PoolError& e) {
                entry["action_success"] = false;
                entry["error"] = error_json(error_code_name(e.code()), e.what());
            } catch (const std::exception& e) {
                entry["action_success"] = false;
                entry["error"] = error_json("BadAction", e.what());
            }
            if (!entry["action_success"].as_bool()) all_success = false;
            ++done;

            if (snapshot_due(options, done)) {
                json::object state = snapshot(pool, store, transfer);
                state["action"] = label;
                for (auto& field : entry) state[field.key()] = field.value();
                states.push_back(std::move(state));
            }
        }

        // Closing state unless the last snapshot already shows it.
        if (!snapshot_due(options, done)) {
            json::object state = snapshot(pool, store, transfer);
            state["action_success"] = all_success;
            states.push_back(std::move(state));
        }

        if (options.save_last_only) {
            result["final_state"] = states.back();
        } else {
            result["states"] = std::move(states);
        }

        json::array transfers;
        for (const auto& req : transfer.drain()) transfers.push_back(transfer_to_json(req));
        result["transfers"] = std::move(transfers);
        result["success"] = all_success;
    } catch (const PoolError& e) {
        result["success"] = false;
        result["error"] = error_json(error_code_name(e.code()), e.what());
    } catch (const std::exception& e) {
        result["success"] = false;
        result["error"] = error_json("BadConfig", e.what());
    }

    return result;
}

} // namespace multiswap
