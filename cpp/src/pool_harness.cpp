// Replays JSON action sequences against JSON-configured pools.
//
//   pool_harness <pools.json> <sequences.json> <output.json>
//
// Every pool is run against every sequence on a small thread pool; each
// task owns its pool, share store and transfer queue.
#include "pool_replay.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace multiswap;

namespace {

struct NamedInput {
    std::string name;
    const json::object* body;
};

// Parses path and returns the array listed under key.
json::array load_list(const std::string& path, const char* key) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    json::value doc = json::parse(text);
    return doc.as_object().at(key).as_array();
}

std::vector<NamedInput> named(const json::array& list) {
    std::vector<NamedInput> out;
    out.reserve(list.size());
    for (const auto& item : list) {
        out.push_back({json_string(item.as_object().at("name")), &item.as_object()});
    }
    return out;
}

size_t worker_count(size_t tasks) {
    size_t threads = std::max(1u, std::thread::hardware_concurrency());
    if (const char* thr = std::getenv("CPP_THREADS")) {
        try {
            threads = std::max<size_t>(1, std::stoul(thr));
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid CPP_THREADS=" << thr << std::endl;
        }
    }
    return std::min(threads, std::max<size_t>(1, tasks));
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <pools.json> <sequences.json> <output.json>" << std::endl;
        return 1;
    }
    const std::string pools_path = argv[1];
    const std::string sequences_path = argv[2];
    const std::string output_path = argv[3];

    try {
        const json::array pool_list = load_list(pools_path, "pools");
        const json::array sequence_list = load_list(sequences_path, "sequences");
        if (sequence_list.empty()) {
            throw std::runtime_error("no sequences in " + sequences_path);
        }

        std::vector<NamedInput> pools = named(pool_list);
        if (const char* only = std::getenv("FILTER_POOL")) {
            pools.erase(std::remove_if(pools.begin(), pools.end(),
                                       [only](const NamedInput& p) { return p.name != only; }),
                        pools.end());
        }
        const std::vector<NamedInput> sequences = named(sequence_list);
        const ReplayOptions options = replay_options_from_env();

        // Task i pairs pool i / |sequences| with sequence i % |sequences|.
        const size_t total = pools.size() * sequences.size();
        std::vector<json::object> results(total);
        std::atomic<size_t> next{0};
        std::mutex console;

        auto run = [&]() {
            for (size_t i = next++; i < total; i = next++) {
                const NamedInput& pool = pools[i / sequences.size()];
                const NamedInput& seq = sequences[i % sequences.size()];
                {
                    std::lock_guard<std::mutex> lk(console);
                    std::cout << "Processing " << pool.name << " with " << seq.name << "..." << std::endl;
                }
                json::object& out = results[i];
                out["pool_config"] = pool.name;
                out["sequence"] = seq.name;
                out["result"] = replay_sequence(*pool.body, *seq.body, options);
            }
        };

        const size_t threads = worker_count(total);
        std::cout << "Running " << total << " replays on " << threads << " threads" << std::endl;
        std::vector<std::thread> workers;
        for (size_t t = 0; t < threads; ++t) workers.emplace_back(run);
        for (auto& w : workers) w.join();

        json::object output;
        output["results"] = json::array(results.begin(), results.end());
        output["metadata"] = {
            {"pool_configs_file", pools_path},
            {"action_sequences_file", sequences_path},
            {"num_pools", pools.size()},
            {"num_sequences", sequences.size()},
            {"total_tests", total}
        };

        std::ofstream out(output_path);
        if (!out) {
            throw std::runtime_error("cannot open output file " + output_path);
        }
        out << json::serialize(output) << std::endl;
        std::cout << "Results written to " << output_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
