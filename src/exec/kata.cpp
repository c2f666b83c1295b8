#include "exec/kata.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "common/io_utils.hpp"

namespace kata {
using namespace std;
using namespace nlohmann;

kata_type parse_kata_type(const string &name) {
    if (name == "code") return kata_type::CODE;
    if (name == "explain") return kata_type::EXPLAIN;
    if (name == "template") return kata_type::TEMPLATE;
    if (name == "codebase") return kata_type::CODEBASE;
    if (name == "shortform") return kata_type::SHORTFORM;
    if (name == "multiple-choice") return kata_type::MULTIPLE_CHOICE;
    if (name == "one-liner") return kata_type::ONE_LINER;
    throw invalid_argument("unsupported kata type: " + name);
}

string to_string(kata_type type) {
    switch (type) {
        case kata_type::CODE: return "code";
        case kata_type::EXPLAIN: return "explain";
        case kata_type::TEMPLATE: return "template";
        case kata_type::CODEBASE: return "codebase";
        case kata_type::SHORTFORM: return "shortform";
        case kata_type::MULTIPLE_CHOICE: return "multiple-choice";
        case kata_type::ONE_LINER: return "one-liner";
    }
    throw invalid_argument("invalid kata type value " + std::to_string((int)type));
}

double rubric::weight_of(const string &key) const {
    auto it = weights.find(key);
    return it == weights.end() ? 1.0 : it->second;
}

void from_json(const json &j, rubric &r) {
    j.at("keys").get_to(r.keys);
    if (r.keys.empty())
        throw invalid_argument("rubric must have at least one key");
    if (j.count("weights")) j.at("weights").get_to(r.weights);
    if (j.count("threshold")) j.at("threshold").get_to(r.threshold);

    for (auto &[key, weight] : r.weights)
        if (weight < 0) throw invalid_argument("rubric weight of " + key + " must not be negative");
}

void to_json(json &j, const rubric &r) {
    j = {{"keys", r.keys}, {"weights", r.weights}, {"threshold", r.threshold}};
}

void from_json(const json &j, kata_metadata &meta) {
    meta.slug = j.value("slug", "");
    meta.title = j.value("title", "");
    if (j.count("language")) meta.language = parse_language(j.at("language").get<string>());
    if (j.count("type")) meta.type = parse_kata_type(j.at("type").get<string>());
    meta.difficulty = j.value("difficulty", "");
    if (j.count("timeout_ms") && !j.at("timeout_ms").is_null()) meta.timeout_ms = j.at("timeout_ms").get<int>();
    if (j.count("rubric") && !j.at("rubric").is_null()) meta.rubric = j.at("rubric").get<rubric>();
}

kata_metadata load_kata_metadata(const filesystem::path &kata_path) {
    filesystem::path meta_file = kata_path / "meta.json";
    kata_metadata meta;
    if (!filesystem::exists(meta_file)) {
        DLOG(INFO) << "kata " << kata_path << " has no meta.json, using defaults";
        return meta;
    }

    try {
        json::parse(read_file_content(meta_file)).get_to(meta);
    } catch (json::exception &ex) {
        throw invalid_argument("malformed " + meta_file.string() + ": " + ex.what());
    }

    if ((meta.type == kata_type::CODE || meta.type == kata_type::TEMPLATE) &&
        meta.timeout_ms && *meta.timeout_ms <= 0) {
        throw invalid_argument("timeout_ms of kata " + meta.slug + " must be positive");
    }
    return meta;
}

}  // namespace kata
