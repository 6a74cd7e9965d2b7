/**
 * @file main.cpp
 * @brief Chunked upload coordinator
 *
 * Run with:
 *   CHUNKUP_STORAGE_ENDPOINT=http://10.0.0.5:4000 \
 *   CHUNKUP_STORAGE_API_KEY=... \
 *   CHUNKUP_TOKENS_FILE=tokens.json \
 *   ./build/chunkup_server -p 8080 -d chunkup.db
 */

#include "chunkup/auth/identity_provider.hpp"
#include "chunkup/core/config.hpp"
#include "chunkup/events/components.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/events.hpp"
#include "chunkup/network/http_router.hpp"
#include "chunkup/network/http_server_asio.hpp"
#include "chunkup/remote/http_storage_node.hpp"
#include "chunkup/remote/storage_client.hpp"
#include "chunkup/server/api.hpp"
#include "chunkup/store/sqlite_upload_store.hpp"
#include "chunkup/upload/chunk_recorder.hpp"
#include "chunkup/upload/cleanup_worker.hpp"
#include "chunkup/upload/finalizer.hpp"
#include "chunkup/upload/service.hpp"
#include "chunkup/upload/session_manager.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace chunkup;
namespace asio = boost::asio;

namespace {

void schedule_expiry_sweep(asio::steady_timer& timer,
                           std::chrono::seconds interval,
                           upload::UploadService& service) {
    timer.expires_after(interval);
    timer.async_wait([&timer, interval, &service](const boost::system::error_code& ec) {
        if (ec) {
            return;  // cancelled on shutdown
        }
        auto removed = service.purge_expired();
        if (removed.is_ok() && removed.value() > 0) {
            spdlog::info("Expiry sweep removed {} session(s)", removed.value());
        }
        schedule_expiry_sweep(timer, interval, service);
    });
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto config = Config::from_environment();
    if (config.is_error()) {
        spdlog::error("Configuration error: {}", config.error().message);
        return 1;
    }
    Config& settings = config.value();

    auto overridden = settings.apply_arguments(argc, argv);
    if (overridden.is_error()) {
        spdlog::error("Invalid arguments: {}", overridden.error().message);
        return 1;
    }
    auto valid = settings.validate();
    if (valid.is_error()) {
        spdlog::error("Configuration error: {}", valid.error().message);
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(settings.log_level));

    // ────────────────────────────────────────────────────────
    // Durable store, identities, storage node
    // ────────────────────────────────────────────────────────

    auto opened = store::SqliteUploadStore::open(settings.db_path);
    if (opened.is_error()) {
        spdlog::error("Cannot open database {}: {}", settings.db_path, opened.error().message);
        return 1;
    }
    std::unique_ptr<store::SqliteUploadStore> upload_store = std::move(opened.value());

    auto identities = auth::TokenFileIdentityProvider::load(settings.tokens_file);
    if (identities.is_error()) {
        spdlog::error("Cannot load tokens from {}: {}", settings.tokens_file, identities.error().message);
        return 1;
    }
    std::unique_ptr<auth::TokenFileIdentityProvider> identity = std::move(identities.value());

    auto node = remote::HttpStorageNode::create(
        settings.storage_endpoint, settings.storage_api_key,
        std::chrono::duration_cast<std::chrono::milliseconds>(settings.storage_timeout));
    if (node.is_error()) {
        spdlog::error("Invalid storage endpoint {}: {}", settings.storage_endpoint, node.error().message);
        return 1;
    }
    std::shared_ptr<remote::StorageNode> storage_node = std::move(node.value());

    // ────────────────────────────────────────────────────────
    // Events and upload pipeline
    // ────────────────────────────────────────────────────────

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    remote::StorageAppendClient storage(storage_node, settings.chunk_size_bytes);
    upload::ChunkRecorder recorder(*upload_store);
    upload::SessionManager sessions(
        *upload_store, recorder,
        upload::SessionSettings{settings.chunk_size_bytes, settings.session_ttl, settings.strict_chunk_count});

    upload::CleanupSettings cleanup_settings;
    cleanup_settings.max_attempts = settings.cleanup_max_attempts;
    upload::CleanupWorker cleanup(upload::CleanupWorker::remove_session(*upload_store), event_bus, cleanup_settings);
    cleanup.start();

    upload::Finalizer finalizer(*upload_store, sessions, recorder, storage, cleanup);
    upload::UploadService service(sessions, recorder, storage, finalizer, event_bus);

    network::HttpRouter router;
    server::register_upload_routes(router, service, *identity);

    // ────────────────────────────────────────────────────────
    // Server loop
    // ────────────────────────────────────────────────────────

    asio::io_context io_context;
    std::unique_ptr<network::HttpServerAsio> http_server;
    try {
        http_server = std::make_unique<network::HttpServerAsio>(
            io_context, settings.port, "0.0.0.0",
            server::max_request_body_bytes(settings.chunk_size_bytes));
    } catch (const boost::system::system_error& e) {
        spdlog::error("Cannot listen on port {}: {}", settings.port, e.what());
        cleanup.stop();
        return 1;
    }
    http_server->set_handler([&router](const network::HttpRequest& request) {
        return router.handle_request(request);
    });

    asio::steady_timer sweep_timer(io_context);
    schedule_expiry_sweep(sweep_timer, settings.expiry_sweep_interval, service);

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        event_bus.emit(events::ServerShuttingDownEvent{"signal " + std::to_string(signal_number)});
        http_server->stop();
        sweep_timer.cancel();
        io_context.stop();
    });

    event_bus.emit(events::ServerStartedEvent{http_server->get_port(), settings.storage_endpoint});
    spdlog::info("Routes: {}", router.route_count());

    std::vector<std::thread> workers;
    workers.reserve(settings.worker_threads > 0 ? settings.worker_threads - 1 : 0);
    for (std::size_t i = 1; i < settings.worker_threads; ++i) {
        workers.emplace_back([&io_context] { io_context.run(); });
    }
    io_context.run();
    for (auto& worker : workers) {
        worker.join();
    }

    cleanup.stop();
    metrics.print_stats();
    return 0;
}
