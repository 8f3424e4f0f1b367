// Commander struct definitions for json. Kept out of armrtc.cpp to keep the main code clean.
#pragma once

#include "arm_types.h"
#include <nlohmann/json.hpp>

namespace nlohmann {
    template <>
    struct adl_serializer<EncodedImage> {
        static void to_json(json& j, const EncodedImage& p) {
            j = json{{"szx", p.szx}, {"szy", p.szy}, {"type", p.type}, {"message", p.message}};
        }
        static void from_json(const json& j, EncodedImage& p) {
            j.at("szx").get_to(p.szx);
            j.at("szy").get_to(p.szy);
            j.at("type").get_to(p.type);
            j.at("message").get_to(p.message);
        }
    };
}
