/// @file main.cpp
/// @brief wait_for / loop_for demo
///
/// A simulated gateway thread plays the event source: it announces the
/// session with "on_ready" and then delivers a burst of "on_message" events.
/// The main thread waits for the session, then consumes messages from one
/// channel until the loop budget runs out.
///
/// Optional argument: path to a JSON config (see hark/core/config.hpp).

#include <hark/core/core.hpp>
#include <hark/event/event.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace {

using namespace std::chrono_literals;

struct Message {
    std::string channel;
    std::string text;
};

void run_gateway(hark_event::EventManager& manager) {
    std::this_thread::sleep_for(50ms);
    manager.emit("on_ready", std::string("session-42"));

    const Message burst[] = {
        {"general", "hello"},
        {"random", "ignored by the filter"},
        {"general", "how is everyone"},
        {"general", "bye"},
    };

    for (const auto& message : burst) {
        std::this_thread::sleep_for(20ms);
        auto delivered = manager.emit("on_message", message);
        HARK_LOG_TRACE("gateway: '{}' on #{} reached {} waiter(s)", message.text, message.channel, delivered);
    }
}

hark_core::ManagerConfig load_config(int argc, char** argv) {
    hark_core::ManagerConfig config;
    config.default_wait_timeout = 2s;
    config.default_iteration_timeout = 200ms;
    config.default_loop_timeout = 1s;

    if (argc > 1) {
        auto loaded = hark_core::load_config_json(argv[1]);
        if (loaded) {
            HARK_LOG_DEBUG("Using config from {}", argv[1]);
            config = std::move(*loaded);
        } else {
            HARK_LOG_WARN("Ignoring config: {}", hark_core::build_error_chain(loaded.error()));
        }
    }

    if (auto env = hark_core::apply_environment(config); !env) {
        HARK_LOG_WARN("Ignoring environment overrides: {}", hark_core::build_error_chain(env.error()));
    }
    return config;
}

} // namespace

int main(int argc, char** argv) {
    hark_core::LogConfig log_config;
    log_config.level = spdlog::level::trace;
    hark_core::configure_logging(log_config);

    hark_event::EventManager manager(load_config(argc, argv));

    std::thread gateway(run_gateway, std::ref(manager));

    auto ready = manager.wait_for("on_ready");
    if (!ready) {
        HARK_LOG_ERROR("Gateway never became ready: {}", hark_core::build_error_chain(ready.error()));
        gateway.join();
        return 1;
    }
    HARK_LOG_INFO("Session ready: {}", *hark_event::arg_as<std::string>(*ready, 0));

    auto stream = manager.loop_for("on_message", [](const hark_event::Args& args) {
        const auto* message = hark_event::arg_as<Message>(args, 0);
        return message != nullptr && message->channel == "general";
    });

    auto done = stream.for_each([](hark_event::Args& args) {
        const auto* message = hark_event::arg_as<Message>(args, 0);
        HARK_LOG_INFO("#{}: {}", message->channel, message->text);
    });

    gateway.join();

    if (done) {
        HARK_LOG_INFO("Loop budget spent");
    } else {
        HARK_LOG_INFO("Loop ended: {}", hark_core::build_error_chain(done.error()));
    }

    hark_core::shutdown_logging();
    return 0;
}
