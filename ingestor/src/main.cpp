#include "config.hpp"
#include "decoder.hpp"
#include "layouts.hpp"
#include "block_parser.hpp"
#include "ws_feed.hpp"
#include "rpc_client.hpp"
#include "stream_subscriber.hpp"
#include "pool_registry.hpp"
#include "persistence_writer.hpp"
#include "pipeline.hpp"
#include "store_pg.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include "metrics.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};
std::atomic<bool> fatal_raised{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void ingest_loop(std::shared_ptr<StreamSubscriber> subscriber,
                 std::shared_ptr<Pipeline> pipeline) {
    spdlog::info("Starting ingest loop");

    try {
        while (auto update = subscriber->next()) {
            pipeline->dispatch(*update);
        }
    } catch (const FatalIngestionError& e) {
        pipeline->fail(e.what());
    }

    spdlog::info("Ingest loop stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->service_name, config->log_level);

        spdlog::info("==============================================");
        spdlog::info("DexLedger Ingestor v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        auto book = std::make_shared<LayoutBook>(
            config->dex_layouts_path.empty() ? LayoutBook::defaults()
                                             : LayoutBook::from_file(config->dex_layouts_path));
        for (const auto& program : config->watch_programs) {
            if (!book->classify(program)) {
                spdlog::warn("Watched program {} has no layouts, its updates are ignored", program);
            }
        }

        // Initialize components
        auto metrics = std::make_shared<Metrics>();
        auto pg = std::make_shared<PostgresStore>(config->pg_dsn);
        auto redis = std::make_shared<RedisBus>(config->redis_url, config->stream_dex_events);
        auto rpc = std::make_shared<SolanaRPC>(config->rpc_urls, config->request_timeout_ms,
                                               config->commitment);

        pg->init_schema();

        WriterOptions writer_options;
        writer_options.batch_size = static_cast<size_t>(config->batch_size);
        writer_options.flush_interval_ms = config->flush_interval_ms;
        writer_options.queue_capacity = static_cast<size_t>(config->queue_capacity);
        writer_options.max_attempts = config->write_max_attempts;
        writer_options.backoff_min_ms = config->retry_backoff_ms_min;
        writer_options.backoff_max_ms = config->retry_backoff_ms_max;
        auto writer = std::make_shared<PersistenceWriter>(pg, redis, writer_options, metrics);

        auto decoder = std::make_shared<const Decoder>(book);
        auto source = std::make_shared<RpcPoolSource>(rpc, decoder);
        auto registry = std::make_shared<PoolRegistry>(
            source, decoder,
            [writer](const PoolMetadata& pool) { writer->submit_pool(pool); },
            std::chrono::milliseconds(config->metadata_timeout_ms), metrics);
        registry->warm(pg->load_pools());

        SubscriberOptions stream_options;
        stream_options.programs = config->watch_programs;
        stream_options.commitment = config->commitment;
        stream_options.queue_capacity = static_cast<size_t>(config->queue_capacity);
        stream_options.max_connect_attempts = config->stream_max_connect_attempts;
        stream_options.backfill_max_slots = static_cast<uint64_t>(config->backfill_max_slots);
        stream_options.backoff_min_ms = config->retry_backoff_ms_min;
        stream_options.backoff_max_ms = config->retry_backoff_ms_max;
        auto parser = std::make_shared<BlockParser>(config->watch_programs);
        auto feed = std::make_shared<WsFeed>(config->ws_url);
        auto subscriber = std::make_shared<StreamSubscriber>(feed, rpc, parser, stream_options, metrics);

        PipelineOptions pipeline_options;
        pipeline_options.lanes = static_cast<size_t>(config->worker_lanes);
        pipeline_options.queue_capacity = static_cast<size_t>(config->queue_capacity);
        pipeline_options.dedup_window = static_cast<size_t>(config->dedup_window);
        pipeline_options.seal_lag_slots = static_cast<uint64_t>(config->seal_lag_slots);
        auto pipeline = std::make_shared<Pipeline>(decoder, registry, writer, pipeline_options, metrics);

        auto health = std::make_shared<HealthCheck>(redis, pg, subscriber, metrics);

        auto on_fatal = [health](const std::string& reason) {
            health->set_fatal(reason);
            fatal_raised = true;
            shutdown_requested = true;
        };
        pipeline->set_fatal_handler(on_fatal);
        writer->set_fatal_handler([weak = std::weak_ptr<Pipeline>(pipeline)](const std::string& reason) {
            if (auto p = weak.lock()) p->fail(reason);
        });

        writer->start();
        pipeline->start();
        subscriber->start();
        std::thread ingest_thread(ingest_loop, subscriber, pipeline);

        // Start HTTP health server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        server.Get("/metrics", [health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health->get_metrics().dump(), "application/json");
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Ingestor started");

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        // Shutdown: stop the feed, drain lanes and sequencer, flush the writer
        spdlog::info("Stopping services...");
        subscriber->stop();
        if (ingest_thread.joinable()) ingest_thread.join();
        pipeline->stop();
        server.stop();
        if (http_thread.joinable()) http_thread.join();

        spdlog::info("Metrics at shutdown: {}", metrics->to_json().dump());

        if (fatal_raised) {
            spdlog::critical("Shutdown after fatal error: {}", pipeline->fatal().value_or("unknown"));
            return 1;
        }

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
