#pragma once

#include "arm_types.h"
#include "rtc.h"
#include "telemetry_hub.h"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Numeric per-step fields that can be saved as matrices (rows = steps).
extern const std::vector<std::string> kStepFields;

json step_to_json(const StepRecord& r);
json status_to_json(const TelemetryStatus& st);
json snapshot_to_json(const TelemetrySnapshot& snap);
json summary_to_json(const EpisodeSummary& s);

// Fill M with one field of the history, rows = steps, cols = field length.
// Returns false with `why` set for an unknown field or ragged vectors.
bool history_field_matrix(const std::vector<StepRecord>& history,
                          std::string_view field,
                          Eigen::MatrixXd& M,
                          std::string& why);

// Column-wise view for plotting: {"step": [...], "current_q": [[...], ...], ...}
json history_to_trajectories(const std::vector<StepRecord>& history);

// One IMAGE HDU per field. Keywords go in the primary HDU.
bool write_history_to_fits(const std::string& path,
                           const std::vector<StepRecord>& history,
                           const std::vector<std::string>& fields,
                           const std::vector<std::pair<std::string, std::string>>& header_strs = {},
                           const std::vector<std::pair<std::string, double>>& header_doubles = {});

// Writes <log_dir>/episode_YYYYmmdd_HHMMSS.json and returns its path.
// Throws std::runtime_error if the file cannot be written.
std::string write_episode_log(const std::string& log_dir,
                              const std::vector<StepRecord>& history,
                              const EpisodeSummary& summary);

// Base64 of a raw buffer.
std::string encode(const char* input, unsigned int size);

// The frame as base64 RGB bytes, for the commander "image" command.
EncodedImage encode_frame(const RgbFrame& frame);
