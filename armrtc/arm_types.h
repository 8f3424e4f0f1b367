#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>
#include <fmt/core.h>

//----------Defines-----------
#define N_JOINTS 6 // Number of arm joints (UR10e)

//----- Structures and typedefs------

// One read of the arm. Positions in rad, velocities in rad/s, timestamp in s
// on the monotonic clock.
struct JointState {
    Eigen::VectorXd q;
    Eigen::VectorXd qd;
    double timestamp = 0.0;
};

// L future actions from one oracle call. Row i predicts tick origin+i.
struct ActionChunk {
    long origin = 0;
    Eigen::MatrixXd actions; // rows = L, cols = n_joints
};

// Row-major 8-bit RGB.
struct RgbFrame {
    unsigned int width = 0, height = 0;
    std::vector<uint8_t> data;

    bool empty() const { return data.empty(); }
};

// One control tick, as pushed to the telemetry hub.
struct StepRecord {
    long step = 0;
    double timestamp = 0.0;          // s since episode start
    Eigen::VectorXd current_q;
    Eigen::VectorXd target_q;        // after the safety guard
    Eigen::VectorXd raw_action;      // straight from the fuser, policy frame
    Eigen::VectorXd pre_clamp_target;
    Eigen::VectorXd drift;           // |current_q - reference_q| per joint
    bool was_clamped = false;
    double loop_dt_ms = 0.0;
    double inference_dt_ms = 0.0;
    int buffer_depth = 0;
};

//-------Commander structs-------------
// An encoded 2D image in row-major form.
struct EncodedImage
{
    unsigned int szx, szy;
    std::string type;
    std::string message;
};
//-------End of Commander structs------

// "[+0.123, -1.571, ...]" for log lines.
inline std::string format_joints(const Eigen::VectorXd& q) {
    std::string s = "[";
    for (Eigen::Index i = 0; i < q.size(); ++i) {
        if (i) s += ", ";
        s += fmt::format("{:+.3f}", q(i));
    }
    return s + "]";
}
