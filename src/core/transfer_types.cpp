#include "transfer_types.h"

#include <nlohmann/json.hpp>

bool operator==(const ProgressSample& a, const ProgressSample& b) {
    return a.id == b.id && a.progress == b.progress && a.total == b.total;
}

void to_json(nlohmann::json& j, const ProgressSample& sample) {
    j = nlohmann::json{
        {"id",       sample.id},
        {"progress", sample.progress},
        {"total",    sample.total}
    };
}

void from_json(const nlohmann::json& j, ProgressSample& sample) {
    sample.id       = j.at("id").get<TransferId>();
    sample.progress = j.at("progress").get<uint64_t>();
    sample.total    = j.at("total").get<uint64_t>();
}
