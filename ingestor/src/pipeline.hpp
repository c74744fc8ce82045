#pragma once

#include "bounded_queue.hpp"
#include "decoder.hpp"
#include "metrics.hpp"
#include "persistence_writer.hpp"
#include "pool_registry.hpp"
#include "sequencer.hpp"
#include "types.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct PipelineOptions {
    size_t lanes = 4;
    size_t queue_capacity = 4096;
    size_t dedup_window = 200000;
    uint64_t seal_lag_slots = 2;
};

// Dispatcher -> per-pool lanes -> sequencer -> persistence writer.
// dispatch() is called from the single thread that reads the subscriber.
class Pipeline {
public:
    Pipeline(std::shared_ptr<const Decoder> decoder,
             std::shared_ptr<PoolRegistry> registry,
             std::shared_ptr<PersistenceWriter> writer,
             PipelineOptions options,
             std::shared_ptr<Metrics> metrics);
    ~Pipeline();

    void start();
    void dispatch(const RawUpdate& update);
    // Drains lanes and the sequencer into the writer, then stops the writer
    void stop();

    std::optional<std::string> fatal() const;
    void fail(const std::string& reason);
    void set_fatal_handler(std::function<void(const std::string&)> handler);

private:
    enum class TaskKind { Swap, PoolCreated, CurveComplete, AccountWrite, SlotMark };

    struct LaneTask {
        TaskKind kind = TaskKind::Swap;
        uint64_t slot = 0;
        SwapEvent swap;
        PoolMetadata pool;
        CurveComplete complete;
        DexKind dex = DexKind::PumpFun;
        std::string account;
        std::vector<uint8_t> data;
    };

    // A trade from a lane, or a slot mark a lane passed once every task
    // queued ahead of it was handled
    struct SequencerItem {
        std::optional<Trade> trade;
        size_t lane = 0;
        uint64_t upstream_slot = 0;
    };

    std::shared_ptr<const Decoder> decoder_;
    std::shared_ptr<PoolRegistry> registry_;
    std::shared_ptr<PersistenceWriter> writer_;
    PipelineOptions options_;
    std::shared_ptr<Metrics> metrics_;

    std::vector<std::unique_ptr<BoundedQueue<LaneTask>>> lane_queues_;
    std::vector<std::thread> lanes_;
    BoundedQueue<SequencerItem> sequencer_queue_;
    std::thread sequencer_thread_;
    Sequencer sequencer_;
    uint64_t last_mark_ = 0;
    bool started_ = false;
    bool stopped_ = false;

    mutable std::mutex fatal_mutex_;
    std::optional<std::string> fatal_;
    std::function<void(const std::string&)> fatal_handler_;

    void route(const std::string& key, LaneTask task);
    void run_lane(size_t lane);
    void handle_task(size_t lane, LaneTask& task);
    void run_sequencer();
};
