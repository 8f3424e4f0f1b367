#pragma once

#include "arm_types.h"
#include <deque>
#include <functional>
#include <optional>
#include <string>

// Turns oracle chunks into one action per control tick.
//
// Chunk-buffer mode (no coefficient): one oracle call per L ticks, actions
// replayed in order from a queue.
//
// Temporal-ensemble mode: one oracle call per tick. The returned action is
// the exp(-coeff * age) weighted mean of every retained chunk that covers
// the current tick, where age = tick - chunk.origin.
class ActionFuser {
public:
    using OracleCall = std::function<ActionChunk()>;

    ActionFuser(int chunk_size, int n_joints, std::optional<double> ensemble_coeff = std::nullopt);

    // Advance one tick. oracle_call is invoked zero or one times; anything it
    // throws propagates unchanged.
    Eigen::VectorXd resolve(const OracleCall& oracle_call);

    // Start of episode.
    void reset();

    int get_buffer_depth() const;
    long get_tick() const { return tick; }
    long get_oracle_calls() const { return oracle_calls; }
    bool is_ensemble() const { return coeff.has_value(); }
    int get_chunk_size() const { return chunk_size; }
    std::string get_mode() const { return is_ensemble() ? "temporal_ensemble" : "chunk_buffer"; }

private:
    int chunk_size;
    int n_joints;
    std::optional<double> coeff;

    long tick = 0;          // index of the next resolve() call
    long oracle_calls = 0;
    std::deque<Eigen::VectorXd> queue;  // chunk-buffer mode
    std::deque<ActionChunk> chunks;     // ensemble mode, oldest first

    ActionChunk call_oracle(const OracleCall& oracle_call);
};
