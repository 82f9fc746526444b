// =============================================================================
// DroidPilot - Command line driver
// =============================================================================
// Script mode executes action lines (one per line, e.g.
// `do(tap, element=[500,300])`). Task mode hands a natural-language task to
// the model-driven agent loop. Either way actions go through the
// virtual-display server when it is reachable, otherwise through adb.
//
//   droidpilot [options] <script|->
//   droidpilot [options] --task "open settings and enable wifi"
// =============================================================================
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "adb_shell_executor.hpp"
#include "agent/action_dispatcher.hpp"
#include "agent/agent_loop.hpp"
#include "agent/app_catalog.hpp"
#include "agent/coordinate_normalizer.hpp"
#include "agent/http_model_client.hpp"
#include "config_loader.hpp"
#include "droidpilot_log.hpp"
#include "remote/remote_control_channel.hpp"
#include "remote/websocket_transport.hpp"
#include "util/string_util.hpp"
#include "video/h264_decoder.hpp"
#include "video/render_target.hpp"
#include "video/video_stream_decoder.hpp"

using namespace droidpilot;

namespace {

constexpr const char* TAG = "main";

std::atomic<bool> g_interrupted{false};
std::atomic<agent::AgentLoop*> g_loop{nullptr};

void onSignal(int) {
    g_interrupted = true;
    if (agent::AgentLoop* loop = g_loop.load()) loop->stop();
}

struct CliOptions {
    std::string config_path;
    std::string serial;
    std::string capture_path;
    std::string log_level;
    std::string script;
    std::string task;
    bool local_only = false;
    bool auto_confirm = false;
};

void printUsage(const char* argv0) {
    std::fprintf(stderr,
        "usage: %s [--config path] [--serial id] [--local] [--yes]\n"
        "          [--capture out.png] [--log-level level] <script|->\n"
        "       %s [--config path] [--serial id] [--local] [--yes]\n"
        "          [--log-level level] --task \"<text>\"\n"
        "\n"
        "  --task       run the model-driven agent on a task\n"
        "  --config     JSON config file (default: config.json, ../config.json)\n"
        "  --serial     adb device serial\n"
        "  --local      skip the virtual-display server, use adb only\n"
        "  --yes        confirm sensitive actions without prompting\n"
        "  --capture    save the last decoded video frame as PNG\n"
        "  --log-level  trace|debug|info|warn|error\n"
        "\n"
        "The model API key comes from DROIDPILOT_API_KEY or model.api_key.\n",
        argv0, argv0);
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "%s requires a value\n", arg.c_str());
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else if (arg == "--serial") {
            if (!next(opts.serial)) return false;
        } else if (arg == "--capture") {
            if (!next(opts.capture_path)) return false;
        } else if (arg == "--log-level") {
            if (!next(opts.log_level)) return false;
        } else if (arg == "--task") {
            if (!next(opts.task)) return false;
        } else if (arg == "--local") {
            opts.local_only = true;
        } else if (arg == "--yes") {
            opts.auto_confirm = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (arg == "-" || arg.compare(0, 2, "--") != 0) {
            if (!opts.script.empty()) {
                std::fprintf(stderr, "only one script may be given\n");
                return false;
            }
            opts.script = arg;
        } else {
            std::fprintf(stderr, "unknown option: %s\n", arg.c_str());
            return false;
        }
    }
    if (!opts.task.empty()) {
        if (!opts.script.empty()) {
            std::fprintf(stderr, "--task cannot be combined with a script\n");
            return false;
        }
        if (!opts.capture_path.empty()) {
            std::fprintf(stderr, "--capture is only available with a script\n");
            return false;
        }
        return true;
    }
    if (opts.script.empty()) {
        std::fprintf(stderr, "missing script or --task (use - for stdin)\n");
        return false;
    }
    return true;
}

agent::ActionDispatcher::Options dispatchOptions(const config::AppConfig& cfg) {
    agent::ActionDispatcher::Options o;
    o.wait_tick_ms = cfg.dispatch.wait_tick_ms;
    o.takeover_tick_ms = cfg.dispatch.takeover_tick_ms;
    o.takeover_ceiling_ms = cfg.dispatch.takeover_ceiling_ms;
    o.type_settle_before_ms = cfg.dispatch.type_settle_before_ms;
    o.type_settle_after_ms = cfg.dispatch.type_settle_after_ms;
    o.double_tap_gap_ms = cfg.dispatch.double_tap_gap_ms;
    o.long_press_ms = cfg.dispatch.long_press_ms;
    o.default_swipe_ms = cfg.dispatch.default_swipe_ms;
    o.unknown_is_fatal = cfg.agent.unknown_action_fatal;
    return o;
}

agent::AgentLoop::Options agentOptions(const config::AppConfig& cfg) {
    agent::AgentLoop::Options o;
    o.max_steps = cfg.agent.max_steps;
    o.step_delay_ms = cfg.agent.step_delay_ms;
    o.screenshot_attempts = cfg.agent.screenshot_attempts;
    o.screenshot_backoff_ms = cfg.agent.screenshot_backoff_ms;
    o.screenshot_timeout_ms = cfg.remote.screenshot_timeout_ms;
    o.use_remote = cfg.agent.use_remote;
    o.normalize_coordinates = cfg.agent.normalize_coordinates;
    o.display_width = cfg.display.width;
    o.display_height = cfg.display.height;
    o.display_dpi = cfg.display.dpi;
    o.bitrate_kbps = cfg.display.bitrate_kbps;
    o.screenshot_dir = cfg.agent.screenshot_dir;
    return o;
}

agent::HttpModelClient::Options modelOptions(const config::ModelConfig& cfg) {
    agent::HttpModelClient::Options o;
    o.base_url = cfg.base_url;
    o.api_key = cfg.api_key;
    o.model = cfg.model;
    o.connect_timeout_s = cfg.connect_timeout_s;
    o.read_timeout_s = cfg.read_timeout_s;
    if (const char* key = std::getenv("DROIDPILOT_API_KEY")) {
        if (*key) o.api_key = key;
    }
    return o;
}

bool askUser(const std::string& message) {
    std::fprintf(stderr, "[confirm] %s [y/N] ", message.c_str());
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    answer = util::toLower(util::trim(answer));
    return answer == "y" || answer == "yes";
}

int runTask(const CliOptions& cli, const config::AppConfig& cfg, AdbShellExecutor& adb,
            agent::AppCatalog& apps, agent::CoordinateNormalizer& normalizer) {
    auto model = agent::HttpModelClient::create(modelOptions(cfg.model));
    if (model.is_err()) {
        DPLOG_ERROR(TAG, "Model client: %s", model.error().message.c_str());
        return 2;
    }

    std::unique_ptr<remote::RemoteControlChannel> channel;
    if (!cli.local_only && cfg.agent.use_remote) {
        auto fwd = adb.forward(cfg.adb.forward_port, cfg.remote.port);
        if (fwd.is_err()) {
            DPLOG_WARN(TAG, "Port forward failed: %s", fwd.error().message.c_str());
        }
        remote::WebSocketTransport::Endpoint endpoint;
        endpoint.host = cfg.remote.host;
        endpoint.port = cfg.adb.forward_port;
        endpoint.connect_timeout_ms = cfg.remote.connect_timeout_ms;

        remote::RemoteControlChannel::Options channel_opts;
        channel_opts.connect_timeout_ms = cfg.remote.connect_timeout_ms;
        channel_opts.screenshot_timeout_ms = cfg.remote.screenshot_timeout_ms;
        channel = std::make_unique<remote::RemoteControlChannel>(
            remote::WebSocketTransport::factory(endpoint), channel_opts);
        channel->setDisplaySizeCallback([&normalizer](int w, int h) {
            normalizer.setScreenSize(w, h);
        });
    }

    agent::ActionDispatcher dispatcher(adb, channel.get(), normalizer, apps, dispatchOptions(cfg));
    dispatcher.setTakeoverCallback([](const std::string& message) {
        std::fprintf(stderr, "[takeover] %s\n", message.c_str());
    });
    dispatcher.setConfirmationCallback([&cli](const std::string& message) {
        return cli.auto_confirm || askUser(message);
    });

    agent::AgentLoop::Options loop_opts = agentOptions(cfg);
    if (cli.local_only) loop_opts.use_remote = false;
    agent::AgentLoop loop(dispatcher, adb, adb, *model.value(), channel.get(), normalizer, loop_opts);

    g_loop = &loop;
    if (g_interrupted.load()) loop.stop();
    agent::TaskExecution exec = loop.run(cli.task);
    g_loop = nullptr;

    for (const agent::StepRecord& step : exec.steps) {
        std::printf("%s step %d: %s%s%s\n", step.success ? "[ok]  " : "[fail]", step.step,
                    step.action.c_str(), step.message.empty() ? "" : " -> ", step.message.c_str());
    }
    std::printf("task %s after %zu step(s), %lld ms%s%s\n", agent::taskStatusName(exec.status),
                exec.steps.size(), static_cast<long long>(exec.durationMs()),
                exec.status == agent::TaskStatus::Completed ? "" : ": ",
                exec.status == agent::TaskStatus::Completed ? exec.result_message.c_str()
                                                            : exec.error_message.c_str());
    std::fflush(stdout);
    return exec.status == agent::TaskStatus::Completed ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    if (!parseArgs(argc, argv, cli)) {
        printUsage(argv[0]);
        return 2;
    }

    config::AppConfig cfg = cli.config_path.empty()
        ? config::loadConfig()
        : config::loadConfig(cli.config_path, true);

    log::setLogLevel(log::parseLevel(cli.log_level.empty() ? cfg.log.level : cli.log_level));
    if (!cfg.log.log_path.empty() && !log::openLogFile(cfg.log.log_path.c_str())) {
        DPLOG_WARN(TAG, "Cannot open log file %s", cfg.log.log_path.c_str());
    }
    DPLOG_INFO(TAG, "DroidPilot starting");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    AdbShellExecutor adb(cli.serial.empty() ? cfg.adb.serial : cli.serial);

    agent::AppCatalog apps;
    apps.addAll(cfg.apps);

    agent::CoordinateNormalizer normalizer(cfg.display.width, cfg.display.height);

    if (!cli.task.empty()) {
        int rc = runTask(cli, cfg, adb, apps, normalizer);
        log::closeLogFile();
        return rc;
    }

    std::ifstream script_file;
    std::istream* script = &std::cin;
    if (cli.script != "-") {
        script_file.open(cli.script);
        if (!script_file.is_open()) {
            DPLOG_ERROR(TAG, "Cannot open script %s", cli.script.c_str());
            log::closeLogFile();
            return 2;
        }
        script = &script_file;
    }

    auto frames = std::make_shared<video::FrameRenderTarget>();
    video::VideoStreamDecoder::Options decoder_opts;
    decoder_opts.pending_limit = static_cast<size_t>(cfg.decoder.pending_limit);
    decoder_opts.capture_timeout_ms = cfg.decoder.capture_timeout_ms;
    video::VideoStreamDecoder decoder(video::H264Decoder::factory(), decoder_opts);

    std::unique_ptr<remote::RemoteControlChannel> channel;
    bool remote_ready = false;
    if (!cli.local_only && cfg.agent.use_remote) {
        auto fwd = adb.forward(cfg.adb.forward_port, cfg.remote.port);
        if (fwd.is_err()) {
            DPLOG_WARN(TAG, "Port forward failed: %s", fwd.error().message.c_str());
        }

        remote::WebSocketTransport::Endpoint endpoint;
        endpoint.host = cfg.remote.host;
        endpoint.port = cfg.adb.forward_port;
        endpoint.connect_timeout_ms = cfg.remote.connect_timeout_ms;

        remote::RemoteControlChannel::Options channel_opts;
        channel_opts.connect_timeout_ms = cfg.remote.connect_timeout_ms;
        channel_opts.screenshot_timeout_ms = cfg.remote.screenshot_timeout_ms;

        channel = std::make_unique<remote::RemoteControlChannel>(
            remote::WebSocketTransport::factory(endpoint), channel_opts);
        channel->setVideoCallback([&decoder](const std::vector<uint8_t>& chunk) {
            decoder.onChunk(chunk);
        });
        channel->setDisplaySizeCallback([&decoder, &normalizer](int w, int h) {
            decoder.resize(w, h);
            normalizer.setScreenSize(w, h);
        });

        if (channel->ensureConnected() &&
            channel->ensureDisplay(cfg.display.width, cfg.display.height,
                                   cfg.display.dpi, cfg.display.bitrate_kbps)) {
            decoder.attach(frames, cfg.display.width, cfg.display.height);
            remote_ready = true;
        } else {
            DPLOG_WARN(TAG, "Virtual display unavailable, using adb input");
        }
    }

    agent::ActionDispatcher dispatcher(adb, channel.get(), normalizer, apps, dispatchOptions(cfg));
    dispatcher.setCancelPredicate([] { return g_interrupted.load(); });
    dispatcher.setTakeoverCallback([](const std::string& message) {
        std::fprintf(stderr, "[takeover] %s\n", message.c_str());
    });
    const bool prompt_on_stdin = cli.script != "-";
    dispatcher.setConfirmationCallback([&cli, prompt_on_stdin](const std::string& message) {
        if (cli.auto_confirm) return true;
        if (!prompt_on_stdin) {
            DPLOG_WARN(TAG, "Script read from stdin; pass --yes to confirm: %s", message.c_str());
            return false;
        }
        return askUser(message);
    });

    agent::DisplayContext ctx;
    ctx.use_remote = remote_ready;
    ctx.normalize_coordinates = cfg.agent.normalize_coordinates;
    if (remote_ready) ctx.display_id = channel->displayId();

    int executed = 0;
    int failed = 0;
    std::string line;
    while (!g_interrupted.load() && std::getline(*script, line)) {
        line = util::trim(line);
        if (line.empty() || line[0] == '#') continue;

        agent::ActionResult r = dispatcher.executeText(line, ctx);
        executed++;
        if (!r.success) failed++;
        std::printf("%s %s%s%s\n", r.success ? "[ok]  " : "[fail]", line.c_str(),
                    r.message.empty() ? "" : " -> ", r.message.c_str());
        std::fflush(stdout);
        if (r.should_finish) break;
    }
    if (g_interrupted.load()) DPLOG_INFO(TAG, "Interrupted");

    if (!cli.capture_path.empty()) {
        std::optional<std::vector<uint8_t>> png;
        if (remote_ready) png = decoder.captureFrame();
        if (!png) {
            DPLOG_ERROR(TAG, "No video frame to capture");
            failed++;
        } else {
            std::ofstream out(cli.capture_path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(png->data()),
                      static_cast<std::streamsize>(png->size()));
            if (!out) {
                DPLOG_ERROR(TAG, "Cannot write %s", cli.capture_path.c_str());
                failed++;
            } else {
                DPLOG_INFO(TAG, "Captured frame -> %s", cli.capture_path.c_str());
            }
        }
    }

    decoder.detach();
    if (channel) channel->shutdown();

    auto stats = decoder.stats();
    DPLOG_INFO(TAG, "Done: %d action(s), %d failed; video chunks=%llu frames=%llu",
               executed, failed, static_cast<unsigned long long>(stats.chunks_fed),
               static_cast<unsigned long long>(stats.frames_presented));
    log::closeLogFile();
    return failed == 0 ? 0 : 1;
}
