#include "pipeline.hpp"
#include "normalizer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

Pipeline::Pipeline(std::shared_ptr<const Decoder> decoder,
                   std::shared_ptr<PoolRegistry> registry,
                   std::shared_ptr<PersistenceWriter> writer,
                   PipelineOptions options,
                   std::shared_ptr<Metrics> metrics)
    : decoder_(std::move(decoder))
    , registry_(std::move(registry))
    , writer_(std::move(writer))
    , options_(options)
    , metrics_(metrics)
    , sequencer_queue_(options.queue_capacity)
    , sequencer_(options.dedup_window, options.seal_lag_slots, metrics) {
    if (options_.lanes == 0) {
        options_.lanes = 1;
    }
    for (size_t i = 0; i < options_.lanes; ++i) {
        lane_queues_.push_back(std::make_unique<BoundedQueue<LaneTask>>(options_.queue_capacity));
    }
}

Pipeline::~Pipeline() {
    if (started_ && !stopped_) {
        stop();
    }
}

void Pipeline::start() {
    if (started_) {
        return;
    }
    started_ = true;
    sequencer_thread_ = std::thread(&Pipeline::run_sequencer, this);
    for (size_t i = 0; i < options_.lanes; ++i) {
        lanes_.emplace_back(&Pipeline::run_lane, this, i);
    }
    spdlog::info("Pipeline started with {} lanes", options_.lanes);
}

void Pipeline::set_fatal_handler(std::function<void(const std::string&)> handler) {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    fatal_handler_ = std::move(handler);
}

std::optional<std::string> Pipeline::fatal() const {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    return fatal_;
}

void Pipeline::fail(const std::string& reason) {
    std::function<void(const std::string&)> handler;
    {
        std::lock_guard<std::mutex> lock(fatal_mutex_);
        if (fatal_) return;
        fatal_ = reason;
        handler = fatal_handler_;
    }
    spdlog::critical("Fatal ingestion error: {}", reason);
    sequencer_queue_.close();
    if (handler) {
        handler(reason);
    }
}

void Pipeline::dispatch(const RawUpdate& update) {
    metrics_->observe_slot(update.slot);
    auto dex = decoder_->classify(update.program_id);
    if (!dex) {
        return;
    }

    if (update.kind == UpdateKind::AccountWrite) {
        LaneTask task;
        task.kind = TaskKind::AccountWrite;
        task.dex = *dex;
        task.account = update.account;
        task.data = update.account_data;
        route(update.account, std::move(task));
    } else {
        auto result = decoder_->decode(update, *dex);
        if (!result.is_valid()) {
            metrics_->decode_errors++;
            spdlog::debug("Decode failed for {}:{} ({}): {}", update.txid, update.idx,
                          to_string(*dex), *result.error);
        } else {
            if (result.pool_created) {
                LaneTask task;
                task.kind = TaskKind::PoolCreated;
                task.pool = *result.pool_created;
                route(task.pool.address, std::move(task));
            }
            if (result.completed) {
                LaneTask task;
                task.kind = TaskKind::CurveComplete;
                task.complete = std::move(*result.completed);
                auto key = task.complete.bonding_curve;
                route(key, std::move(task));
            }
            if (result.swap) {
                metrics_->swaps_decoded++;
                LaneTask task;
                task.kind = TaskKind::Swap;
                task.swap = std::move(*result.swap);
                auto key = task.swap.pool_address;
                route(key, std::move(task));
            }
        }
    }

    // The mark trails every lane's earlier work, so a slot is sealed only
    // after all lanes are done with the tasks dispatched before it
    if (update.slot > last_mark_) {
        last_mark_ = update.slot;
        for (size_t lane = 0; lane < lane_queues_.size(); ++lane) {
            LaneTask mark;
            mark.kind = TaskKind::SlotMark;
            mark.slot = update.slot;
            if (!lane_queues_[lane]->push(std::move(mark))) {
                spdlog::debug("Lane {} closed, slot mark {} dropped", lane, update.slot);
            }
        }
    }
}

void Pipeline::route(const std::string& key, LaneTask task) {
    size_t lane = std::hash<std::string>{}(key) % lane_queues_.size();
    if (!lane_queues_[lane]->push(std::move(task))) {
        spdlog::debug("Lane {} closed, task for {} dropped", lane, key);
    }
}

void Pipeline::run_lane(size_t lane) {
    auto& queue = *lane_queues_[lane];
    while (auto task = queue.pop()) {
        try {
            handle_task(lane, *task);
        } catch (const MetadataUnresolvable& e) {
            metrics_->unresolvable++;
            spdlog::debug("Dropped swap: {}", e.what());
        } catch (const InconsistentPool& e) {
            metrics_->inconsistent++;
            spdlog::debug("Dropped swap: {}", e.what());
        } catch (const NonSolPool& e) {
            metrics_->non_sol_pool++;
            spdlog::debug("Dropped swap: {}", e.what());
        } catch (const ZeroAmount& e) {
            metrics_->zero_amount++;
            spdlog::debug("Dropped swap: {}", e.what());
        } catch (const FatalIngestionError& e) {
            fail(e.what());
        } catch (const std::exception& e) {
            spdlog::error("Lane {} failed to process task: {}", lane, e.what());
        }
    }
}

void Pipeline::handle_task(size_t lane, LaneTask& task) {
    switch (task.kind) {
        case TaskKind::SlotMark: {
            SequencerItem item;
            item.lane = lane;
            item.upstream_slot = task.slot;
            if (!sequencer_queue_.push(std::move(item))) {
                spdlog::debug("Sequencer closed, slot mark {} from lane {} dropped", task.slot, lane);
            }
            break;
        }
        case TaskKind::Swap: {
            auto pool = registry_->resolve(task.swap.pool_address, task.swap.hint);
            SequencerItem item;
            item.trade = Normalizer::normalize(task.swap, pool);
            if (!sequencer_queue_.push(std::move(item))) {
                throw FatalIngestionError("sequencer closed before " + task.swap.txid + " was admitted");
            }
            break;
        }
        case TaskKind::PoolCreated:
            registry_->register_pool(task.pool);
            break;
        case TaskKind::CurveComplete:
            writer_->publish_completion(task.complete);
            break;
        case TaskKind::AccountWrite:
            registry_->observe_account(task.account, task.dex, task.data);
            break;
    }
}

void Pipeline::run_sequencer() {
    // Sealing follows the slowest lane
    std::vector<uint64_t> lane_marks(lane_queues_.size(), 0);
    uint64_t sealed_mark = 0;

    try {
        while (auto item = sequencer_queue_.pop()) {
            if (item->trade) {
                sequencer_.admit(*item->trade);
                continue;
            }
            auto& mark = lane_marks[item->lane];
            mark = std::max(mark, item->upstream_slot);
            uint64_t low = *std::min_element(lane_marks.begin(), lane_marks.end());
            if (low <= sealed_mark) {
                continue;
            }
            sealed_mark = low;
            auto released = sequencer_.advance(low);
            if (!released.empty()) {
                writer_->submit_trades(std::move(released));
            }
        }

        auto remaining = sequencer_.drain();
        if (!remaining.empty()) {
            spdlog::info("Sequencer drained {} trades", remaining.size());
            writer_->submit_trades(std::move(remaining));
        }
    } catch (const FatalIngestionError& e) {
        fail(e.what());
    }
}

void Pipeline::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    for (auto& queue : lane_queues_) {
        queue->close();
    }
    for (auto& lane : lanes_) {
        if (lane.joinable()) lane.join();
    }

    sequencer_queue_.close();
    if (sequencer_thread_.joinable()) {
        sequencer_thread_.join();
    }

    writer_->stop();
    spdlog::info("Pipeline stopped");
}
