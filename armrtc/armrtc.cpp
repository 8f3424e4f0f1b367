#include "armrtc.h"
#include "rtc.h"
#include "telemetry_io.h"
#include <commander/commander.h>
#include <fmt/core.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <map>
#include <memory>
#include <thread>
#include <unistd.h>
// Commander struct definitions for json. This is in a separate file to keep the main code clean.
#include "commander_structs.h"

#define LIVE_CONTROL_WARNING_S 5
#define DEFAULT_HISTORY_N 300

//----------Globals-------------------
arm_rtc_config rtc_config;
TelemetryHub* telemetry = nullptr;
std::atomic<ControlLoop*> control_loop{nullptr};

namespace {
void handle_signal(int) {
    ControlLoop* loop = control_loop.load();
    if (loop) loop->request_shutdown();
}

void run_control(ControlLoop* loop) {
    try {
        EpisodeSummary s = loop->run_episode();
        write_episode_log(rtc_config.log_dir, telemetry->get_history(static_cast<size_t>(s.steps)), s);
    } catch (const std::exception& e) {
        fmt::print(stderr, "[RTC] Control thread error: {}\n", e.what());
    }
}
}

//----------commander functions from here---------------
json get_status() {
    json j = snapshot_to_json(telemetry->get_snapshot());
    ControlLoop* loop = control_loop.load();
    j["loop_state"] = loop ? to_string(loop->get_state()) : "idle";
    j["step"] = loop ? loop->get_step() : 0;
    j["control_hz"] = rtc_config.control_hz;
    j["max_episode_steps"] = rtc_config.max_episode_steps;
    return j;
}

json get_latest() {
    auto r = telemetry->get_latest();
    return r ? step_to_json(*r) : json(nullptr);
}

json get_history(unsigned int n) {
    json j = json::array();
    for (const auto& r : telemetry->get_history(n)) j.push_back(step_to_json(r));
    return j;
}

json get_trajectories(unsigned int n) {
    return history_to_trajectories(telemetry->get_history(n));
}

EncodedImage get_image() {
    auto f = telemetry->get_image();
    if (!f) return EncodedImage{0, 0, "rgb8", ""};
    return encode_frame(*f);
}

json get_summary() {
    ControlLoop* loop = control_loop.load();
    if (!loop) return json(nullptr);
    auto s = loop->get_summary();
    return s ? summary_to_json(*s) : json(nullptr);
}

std::string stop_episode() {
    ControlLoop* loop = control_loop.load();
    if (!loop) return "no episode";
    loop->request_shutdown();
    return "shutdown requested";
}

json save_telemetry(std::string filename) {
    auto history = telemetry->get_history(telemetry->get_capacity());
    bool ok = write_history_to_fits(filename, history, kStepFields,
                                    {{"ROBOT", rtc_config.robot.backend}, {"POLICY", rtc_config.policy.backend},
                                     {"FUSION", rtc_config.policy.temporal_ensemble_coeff ? "ensemble" : "chunk"}},
                                    {{"CTRL_HZ", rtc_config.control_hz}});
    return json{{"ok", ok}, {"path", filename}, {"nsteps", history.size()}};
}

COMMANDER_REGISTER(m)
{
    using namespace commander::literals;

    m.def("status", get_status, "Loop state, device flags and safety counters.");
    m.def("latest", get_latest, "The newest step record, or null.");
    m.def("history", get_history, "Up to n newest step records, oldest first.", "n"_arg=DEFAULT_HISTORY_N);
    m.def("trajectories", get_trajectories,
          "Up to n newest step records as per-field columns for plotting.", "n"_arg=DEFAULT_HISTORY_N);
    m.def("image", get_image, "The latest camera frame, base64 encoded RGB.");
    m.def("summary", get_summary, "Episode summary once the episode has ended, otherwise null.");
    m.def("stop", stop_episode, "Abort the running episode at the next tick.");
    m.def("save_telemetry", save_telemetry, "Write the telemetry history to a FITS file.",
          "filename"_arg="armrtc_telem.fits");
}

std::map<std::string, std::string> parse_named_args(int argc, char* argv[]) {
    std::map<std::string, std::string> opts;
    for (int i = 1; i < argc; ++i) {
        std::string key = argv[i];
        if (key.rfind("--", 0) != 0) {
            fmt::print(stderr, "[ERROR] Unexpected argument format: {}\n", key);
            continue;
        }

        key = key.substr(2);  // remove '--'
        if ((i + 1 < argc) && std::string(argv[i+1]).rfind("--", 0) != 0) {
            opts[key] = argv[++i];
        } else {
            opts[key] = "1";  // e.g., for --home
        }
    }
    return opts;
}

int main(int argc, char* argv[]) {
    auto args = parse_named_args(argc, argv);

    if (!args.count("config")) {
        fmt::print(stderr, "Usage: {} --config <file.toml> [--enable-control] [--home] "
                           "[--no-drift-watchdog] [--socket tcp://*:6670]\n", argv[0]);
        return 1;
    }

    try {
        rtc_config = readConfig(args["config"]);
        if (args.count("enable-control")) rtc_config.enable_control = true;
        if (args.count("home")) rtc_config.robot.home_before_episode = true;
        if (args.count("no-drift-watchdog")) rtc_config.robot.drift_watchdog = false;
    } catch (const std::exception& e) {
        fmt::print(stderr, "[CONFIG] Error initializing RTC config: {}\n", e.what());
        return 1;
    }

    // Raise the priority of the control thread (inherited). Needs privileges.
    if (nice(-10) == -1)
        fmt::print(stderr, "[RTC] Could not raise process priority, continuing\n");

    TelemetryHub hub(rtc_config.telemetry_capacity);
    telemetry = &hub;

    std::unique_ptr<ControlLoop> loop;
    try {
        loop = std::make_unique<ControlLoop>(rtc_config,
                                             make_robot_link(rtc_config.robot),
                                             make_camera(rtc_config.camera),
                                             make_policy_oracle(rtc_config.policy, rtc_config.robot.n_joints),
                                             hub);
    } catch (const std::exception& e) {
        fmt::print(stderr, "[RTC] Error creating control loop: {}\n", e.what());
        return 1;
    }
    hub.set_status(rtc_config.enable_control, true, false, false);

    if (rtc_config.enable_control) {
        fmt::print("[RTC] LIVE CONTROL ENABLED. The arm will move. Starting in {} s ...\n", LIVE_CONTROL_WARNING_S);
        std::this_thread::sleep_for(std::chrono::seconds(LIVE_CONTROL_WARNING_S));
    } else {
        fmt::print("[RTC] Dry run: commands are computed and logged but not sent\n");
    }

    control_loop = loop.get();
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::thread rtc_thread(run_control, loop.get());
    fmt::print("[RTC] Control thread started.\n");

    // prepare commander arguments
    std::vector<std::string> commander_args = {argv[0]};
    if (args.count("socket")) {
        commander_args.push_back("--socket");
        commander_args.push_back(args["socket"]);
    }

    std::vector<std::unique_ptr<char[]>> argv_storage;
    std::vector<char*> commander_argv;
    for (const auto& s : commander_args) {
        argv_storage.emplace_back(std::make_unique<char[]>(s.size()+1));
        std::strcpy(argv_storage.back().get(), s.c_str());
        commander_argv.push_back(argv_storage.back().get());
    }
    int commander_argc = commander_argv.size();

    commander::Server s(commander_argc, commander_argv.data());
    s.run();

    // Clean shutdown
    loop->request_shutdown();
    rtc_thread.join();
    control_loop = nullptr;

    fmt::print("DONE\n");
    return 0;
}
