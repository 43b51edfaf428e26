#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include "app/channel_router.hpp"
#include "app/cli_parser.hpp"
#include "core/config/app_config.hpp"
#include "core/config/ids.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "core/logging/logger.hpp"
#include "events/event_notifier.hpp"
#include "events/transport.hpp"
#include "resources/resource_client.hpp"
#include "resources/resource_factory.hpp"
#include "runtime/builtin_stages.hpp"
#include "runtime/orchestrator.hpp"
#include "session/run_registry.hpp"
#include "session/state_store.hpp"
#include "session/state_store_bridge.hpp"

namespace {

void report(const std::string& what, const conductor::core::errors::OrchestrationError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace conductor;

    // 1. stdout carries the event stream, logs go to stderr
    auto& logger = core::logging::Logger::get();
    logger.set_stream(std::cerr);
    logger.set_context("conductor");

    // 2. Parse CLI input and return normalized input errors
    auto parsed = app::cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        report("Input error", core::errors::get_error(parsed));
        return 2;
    }
    const auto options = core::errors::take_value(std::move(parsed));

    // 3. Configuration, then command-line overrides
    core::config::AppConfig config;
    if (options.config_path) {
        auto loaded = core::config::load_config(options.config_path.value());
        if (core::errors::is_error(loaded)) {
            report("Config error", core::errors::get_error(loaded));
            return 2;
        }
        config = core::errors::take_value(std::move(loaded));
    }
    if (options.state_dir) {
        config.state_store.directory = options.state_dir.value();
    }
    if (options.timeout_ms) {
        config.orchestrator.run_timeout_ms = options.timeout_ms.value();
    }
    logger.set_level(options.verbose ? core::logging::LogLevel::DEBUG : config.log_level);

    // 4. Wire the core
    std::unique_ptr<session::StateStore> store;
    if (config.state_store.directory.empty()) {
        store = std::make_unique<session::InMemoryStateStore>();
    } else {
        store = std::make_unique<session::FileStateStore>(config.state_store.directory);
    }
    session::StateStoreBridge bridge(*store, config.state_store);
    auto expired = bridge.collect_expired();
    if (core::errors::is_error(expired)) {
        report("Snapshot collection failed", core::errors::get_error(expired));
    } else if (core::errors::get_value(expired) > 0) {
        LOG_INFO("Removed " + std::to_string(core::errors::get_value(expired)) +
                 " expired snapshot(s)");
    }

    events::StreamTransport transport(std::cout);
    events::EventNotifier notifier(transport, config.notifier);

    auto backend = std::make_shared<resources::AnalyticsBackend>();
    resources::ResourceFactory factory(config.resources,
                                       resources::make_analytics_connector(backend));
    factory.start();

    session::RunRegistry registry;

    auto pipeline = runtime::make_default_pipeline();
    if (core::errors::is_error(pipeline)) {
        report("Pipeline setup failed", core::errors::get_error(pipeline));
        return 3;
    }
    runtime::Orchestrator orchestrator(core::errors::take_value(std::move(pipeline)),
                                       notifier, bridge, factory, registry,
                                       config.orchestrator);

    int exit_code = 0;
    if (options.command == app::cli::Command::Run) {
        const std::string run_id =
            options.run_id.value_or(core::config::generate_run_id());
        logger.set_context(run_id);
        LOG_INFO("Starting run " + run_id + " for user " + options.user_id);

        auto ran = orchestrator.run(options.task, options.thread_id, options.user_id,
                                    run_id);
        if (core::errors::is_error(ran)) {
            report("Run rejected", core::errors::get_error(ran));
            exit_code = 3;
        } else {
            const auto& state = core::errors::get_value(ran);
            LOG_INFO("Final run status: " + protocol::to_string(state.status));
            exit_code = state.status == protocol::RequestStatus::Completed ? 0 : 1;
        }
    } else {
        app::ChannelRouter router(orchestrator, notifier, options.user_id,
                                  options.thread_id);
        router.open();
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            const auto routed = router.handle_text(line);
            LOG_DEBUG("Frame handled: " + app::ChannelRouter::to_string(routed.action));
        }
        router.close();
    }

    factory.stop();
    const auto stats = notifier.stats();
    LOG_INFO("Events emitted: " + std::to_string(stats.emitted) + ", delivered: " +
             std::to_string(stats.delivered) + ", dropped: " +
             std::to_string(stats.failed));
    return exit_code;
}
