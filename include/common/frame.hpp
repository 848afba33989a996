/*
 * File: include/common/frame.hpp
 * Project: Classwatch Relay
 * Purpose: Frame and detection types shared by relay, puller and endpoints
 * Notes:
 *  - Frames are immutable once built and shared as FramePtr
 *  - Wire keys follow the detection pipeline: x,y,w,h,class,conf
 * Last updated: 2026-10-16
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/base64.hpp"


struct Prediction {
double x{0}, y{0}, w{0}, h{0};
std::string label;
double confidence{0};
};


struct Frame {
std::string source_key;
std::string image;                 // encoded bytes, opaque to the relay
std::string content_type{"image/jpeg"};
std::vector<Prediction> predictions;
std::chrono::system_clock::time_point t{std::chrono::system_clock::now()};
uint64_t seq{0};
};

using FramePtr = std::shared_ptr<const Frame>;


inline nlohmann::json prediction_to_json(const Prediction& p){
return nlohmann::json{{"x", p.x}, {"y", p.y}, {"w", p.w}, {"h", p.h}, {"class", p.label}, {"conf", p.confidence}};
}


// Accepts "confidence" as an alias of "conf". Throws nlohmann::json::exception on wrong types.
inline Prediction prediction_from_json(const nlohmann::json& j){
Prediction p;
p.x = j.value("x", 0.0);
p.y = j.value("y", 0.0);
p.w = j.value("w", 0.0);
p.h = j.value("h", 0.0);
p.label = j.value("class", std::string());
p.confidence = j.contains("conf") ? j.at("conf").get<double>() : j.value("confidence", 0.0);
return p;
}


inline nlohmann::json frame_to_json(const Frame& f){
using namespace std::chrono;
nlohmann::json preds = nlohmann::json::array();
for (const auto& p : f.predictions) preds.push_back(prediction_to_json(p));
return nlohmann::json{
{"type", "frame"},
{"sourceKey", f.source_key},
{"image", "data:" + f.content_type + ";base64," + base64_encode(f.image)},
{"predictions", preds},
{"seq", f.seq},
{"t_ms", time_point_cast<milliseconds>(f.t).time_since_epoch().count()}
};
}


inline nlohmann::json keepalive_to_json(const std::string& source_key){
return nlohmann::json{{"type", "keepalive"}, {"sourceKey", source_key}};
}


// Cheap signature check on pulled snapshots; empty when not a JPEG/PNG.
inline std::string image_mime(const std::string& bytes){
if (bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xFF && static_cast<unsigned char>(bytes[1]) == 0xD8 && static_cast<unsigned char>(bytes[2]) == 0xFF) return "image/jpeg";
static const char png[] = "\x89PNG\r\n\x1a\n";
if (bytes.size() >= 8 && bytes.compare(0, 8, png, 8) == 0) return "image/png";
return {};
}
