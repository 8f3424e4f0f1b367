// telemetry_io.cpp
#include "telemetry_io.h"
#include <fitsio.h>
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem> //C++ 17
#include <fstream>
#include <stdexcept>
extern "C" {
#include <b64/cencode.h>
}

const std::vector<std::string> kStepFields = {
    "step", "timestamp", "current_q", "target_q", "raw_action", "pre_clamp_target",
    "drift", "was_clamped", "loop_dt_ms", "inference_dt_ms", "buffer_depth"};

namespace {
const std::vector<std::string> kScalarFields = {
    "step", "timestamp", "was_clamped", "loop_dt_ms", "inference_dt_ms", "buffer_depth"};

std::vector<double> to_std(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}
}

json step_to_json(const StepRecord& r) {
    return json{
        {"step", r.step},
        {"timestamp", r.timestamp},
        {"current_q", to_std(r.current_q)},
        {"target_q", to_std(r.target_q)},
        {"raw_action", to_std(r.raw_action)},
        {"pre_clamp_target", to_std(r.pre_clamp_target)},
        {"drift", to_std(r.drift)},
        {"was_clamped", r.was_clamped},
        {"loop_dt_ms", r.loop_dt_ms},
        {"inference_dt_ms", r.inference_dt_ms},
        {"buffer_depth", r.buffer_depth}};
}

json status_to_json(const TelemetryStatus& st) {
    json j = {
        {"episode_active", st.episode_active},
        {"control_enabled", st.control_enabled},
        {"policy_loaded", st.policy_loaded},
        {"robot_connected", st.robot_connected},
        {"camera_connected", st.camera_connected},
        {"has_image", st.has_image},
        {"total_safety_violations", st.total_safety_violations},
        {"cumulative_delta", to_std(st.cumulative_delta)}};
    j["initial_q"] = st.initial_q ? json(to_std(*st.initial_q)) : json(nullptr);
    return j;
}

json snapshot_to_json(const TelemetrySnapshot& snap) {
    json j = {{"status", status_to_json(snap.status)}, {"history_size", snap.history_size}};
    j["latest"] = snap.latest ? step_to_json(*snap.latest) : json(nullptr);
    return j;
}

json summary_to_json(const EpisodeSummary& s) {
    return json{
        {"steps", s.steps},
        {"duration_s", s.elapsed_s},
        {"avg_hz", s.avg_hz},
        {"safety_violations", s.violation_count},
        {"enable_control", s.enable_control},
        {"commands_sent", s.commands_sent},
        {"skipped_ticks", s.skipped_ticks},
        {"overruns", s.overruns},
        {"dropped_frames", s.dropped_frames},
        {"oracle_calls", s.oracle_calls},
        {"final_state", to_string(s.final_state)},
        {"abort_reason", to_string(s.reason)},
        {"detail", s.detail}};
}

bool history_field_matrix(const std::vector<StepRecord>& history,
                          std::string_view field,
                          Eigen::MatrixXd& M,
                          std::string& why)
{
    const Eigen::Index N = static_cast<Eigen::Index>(history.size());

    auto fill_scalar = [&](auto get) -> bool {
        M.resize(N, 1);
        for (Eigen::Index i = 0; i < N; ++i) M(i, 0) = static_cast<double>(get(history[i]));
        return true;
    };
    auto fill_vector = [&](auto get) -> bool {
        if (N == 0) { M.resize(0, 0); return true; }
        const Eigen::Index L = get(history[0]).size();
        M.resize(N, L);
        for (Eigen::Index i = 0; i < N; ++i) {
            const Eigen::VectorXd& v = get(history[i]);
            if (v.size() != L) { why = "ragged vector lengths"; return false; }
            M.row(i) = v.transpose(); // row = step
        }
        return true;
    };

    if      (field == "step")             return fill_scalar([](const StepRecord& r) { return r.step; });
    else if (field == "timestamp")        return fill_scalar([](const StepRecord& r) { return r.timestamp; });
    else if (field == "was_clamped")      return fill_scalar([](const StepRecord& r) { return r.was_clamped ? 1 : 0; });
    else if (field == "loop_dt_ms")       return fill_scalar([](const StepRecord& r) { return r.loop_dt_ms; });
    else if (field == "inference_dt_ms")  return fill_scalar([](const StepRecord& r) { return r.inference_dt_ms; });
    else if (field == "buffer_depth")     return fill_scalar([](const StepRecord& r) { return r.buffer_depth; });
    else if (field == "current_q")        return fill_vector([](const StepRecord& r) -> const Eigen::VectorXd& { return r.current_q; });
    else if (field == "target_q")         return fill_vector([](const StepRecord& r) -> const Eigen::VectorXd& { return r.target_q; });
    else if (field == "raw_action")       return fill_vector([](const StepRecord& r) -> const Eigen::VectorXd& { return r.raw_action; });
    else if (field == "pre_clamp_target") return fill_vector([](const StepRecord& r) -> const Eigen::VectorXd& { return r.pre_clamp_target; });
    else if (field == "drift")            return fill_vector([](const StepRecord& r) -> const Eigen::VectorXd& { return r.drift; });

    why = "unknown field";
    return false;
}

json history_to_trajectories(const std::vector<StepRecord>& history) {
    json j = json::object();
    for (const auto& name : kStepFields) {
        Eigen::MatrixXd M;
        std::string why;
        if (!history_field_matrix(history, name, M, why))
            throw std::runtime_error(fmt::format("history_to_trajectories: field '{}': {}", name, why));
        const bool scalar = std::find(kScalarFields.begin(), kScalarFields.end(), name) != kScalarFields.end();
        json col = json::array();
        for (Eigen::Index i = 0; i < M.rows(); ++i) {
            if (scalar) {
                col.push_back(M(i, 0));
            } else {
                std::vector<double> row(static_cast<size_t>(M.cols()));
                for (Eigen::Index c = 0; c < M.cols(); ++c) row[static_cast<size_t>(c)] = M(i, c);
                col.push_back(row);
            }
        }
        j[name] = col;
    }
    return j;
}

bool write_history_to_fits(const std::string& path,
                           const std::vector<StepRecord>& history,
                           const std::vector<std::string>& fields,
                           const std::vector<std::pair<std::string, std::string>>& header_strs,
                           const std::vector<std::pair<std::string, double>>& header_doubles)
{
    int status = 0;
    fitsfile* f = nullptr;
    long nsteps = static_cast<long>(history.size());

    std::string fname = "!" + path;
    fits_create_file(&f, fname.c_str(), &status);
    if (status) { fits_report_error(stderr, status); return false; }

    // Primary HDU (no data)
    fits_create_img(f, DOUBLE_IMG, 0, nullptr, &status);
    if (status) { fits_report_error(stderr, status); fits_close_file(f, &status); return false; }

    fits_write_key(f, TLONG, "NSTEPS", &nsteps, (char*)"rows = steps for matrices", &status);
    for (const auto& kv : header_strs) {
        fits_write_key(f, TSTRING, const_cast<char*>(kv.first.c_str()), (void*)kv.second.c_str(), nullptr, &status);
        if (status) { fits_report_error(stderr, status); fits_close_file(f, &status); return false; }
    }
    for (const auto& kv : header_doubles) {
        double v = kv.second;
        fits_write_key(f, TDOUBLE, const_cast<char*>(kv.first.c_str()), (void*)&v, nullptr, &status);
        if (status) { fits_report_error(stderr, status); fits_close_file(f, &status); return false; }
    }

    for (const auto& name : fields) {
        Eigen::MatrixXd M;
        std::string why;
        if (!history_field_matrix(history, name, M, why)) {
            fmt::print(stderr, "[TELEM] Cannot extract '{}': {}\n", name, why);
            fits_close_file(f, &status);
            return false;
        }
        // FITS wants the fastest axis first; Eigen is column-major.
        Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> R = M;
        long rows = static_cast<long>(R.rows());
        long cols = static_cast<long>(R.cols());
        long naxes[2] = { cols, rows };
        fits_create_img(f, DOUBLE_IMG, 2, naxes, &status);
        if (status) { fits_report_error(stderr, status); fits_close_file(f, &status); return false; }

        char extname[72]; std::snprintf(extname, sizeof(extname), "%s", name.c_str());
        fits_write_key(f, TSTRING, "EXTNAME", extname, (char*)"telemetry field", &status);
        fits_write_key(f, TLONG,   "NSTEP",   (void*)&rows, (char*)"rows = steps", &status);
        fits_write_key(f, TLONG,   "NCOLS",   (void*)&cols, (char*)"cols = field length", &status);

        const long nelem = static_cast<long>(R.size());
        if (nelem > 0)
            fits_write_img(f, TDOUBLE, 1, nelem, R.data(), &status);
        if (status) { fits_report_error(stderr, status); fits_close_file(f, &status); return false; }
    }

    fits_close_file(f, &status);
    if (status) { fits_report_error(stderr, status); return false; }
    fmt::print("[TELEM] Wrote {} steps x {} fields to {}\n", nsteps, fields.size(), path);
    return true;
}

std::string write_episode_log(const std::string& log_dir,
                              const std::vector<StepRecord>& history,
                              const EpisodeSummary& summary)
{
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec)
        throw std::runtime_error("Cannot create log directory " + log_dir + ": " + ec.message());

    const std::time_t now = std::time(nullptr);
    const std::string path = (std::filesystem::path(log_dir) /
                              fmt::format("episode_{:%Y%m%d_%H%M%S}.json", fmt::localtime(now))).string();

    json steps = json::array();
    for (const auto& r : history) {
        steps.push_back({
            {"step", r.step},
            {"timestamp", r.timestamp},
            {"current_q", to_std(r.current_q)},
            {"action", to_std(r.raw_action)},
            {"target_q", to_std(r.target_q)},
            {"buffer_depth", r.buffer_depth}});
    }
    json log = {{"stats", summary_to_json(summary)}, {"steps", steps}};

    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("Cannot open episode log " + path);
    out << log.dump(2) << std::endl;
    if (!out)
        throw std::runtime_error("Error writing episode log " + path);
    fmt::print("[TELEM] Episode log saved to {} ({} steps)\n", path, history.size());
    return path;
}

// Based on https://sourceforge.net/p/libb64/git/ci/master/tree/examples/c-example1.c
std::string encode(const char* input, unsigned int size)
{
    // 4 output chars per 3 input bytes, plus line breaks every 72 chars.
    std::string output(size_t(size) * 2 + 8, '\0');
    char* c = &output[0];
    base64_encodestate s;
    base64_init_encodestate(&s);
    int cnt = base64_encode_block(input, static_cast<int>(size), c, &s);
    c += cnt;
    cnt = base64_encode_blockend(c, &s);
    c += cnt;
    output.resize(static_cast<size_t>(c - output.data()));
    return output;
}

EncodedImage encode_frame(const RgbFrame& frame) {
    if (frame.data.size() != size_t(frame.width) * frame.height * 3)
        throw std::invalid_argument("encode_frame: malformed frame");
    return EncodedImage{frame.width, frame.height, "rgb8",
                        encode(reinterpret_cast<const char*>(frame.data.data()),
                               static_cast<unsigned int>(frame.data.size()))};
}
