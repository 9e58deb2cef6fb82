#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/json_utils.h — JSON document type and serialization helpers
// ═══════════════════════════════════════════════════════════════════
//  Uses nlohmann/json + C++20 Concepts. Query documents keep their key
//  order (ordered_json) because stage bodies such as $sort are
//  order-sensitive on the document store.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <fstream>
#include <string>
#include <stdexcept>

namespace graphjin {

// ── Order-preserving JSON document ──
using Document = nlohmann::ordered_json;

// ─────────────────────────────────────────────
//  Macro: GRAPHJIN_SERIALIZE
//  Makes a config struct readable from / writable to JSON.
//
//  Usage:
//    struct Options {
//        std::string uri;
//        int sample_size = 100;
//        GRAPHJIN_SERIALIZE(Options, uri, sample_size)
//    };
// ─────────────────────────────────────────────
#define GRAPHJIN_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Type, __VA_ARGS__)

template <typename T>
concept JsonDeserializable = requires(nlohmann::json j) {
    { j.get<T>() } -> std::same_as<T>;
};

template <typename T>
inline T fromJson(const nlohmann::json& j) {
    return j.get<T>();
}

// ── Load a JSON config file into T ──
template <JsonDeserializable T>
inline T loadJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    return nlohmann::json::parse(in).get<T>();
}

} // namespace graphjin
