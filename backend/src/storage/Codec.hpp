#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "Snapshot.hpp"

// Plain-text form of a snapshot (the payload inside the encrypted file).
namespace Codec
{
    nlohmann::json toJson(const Snapshot& snap);

    // Throws nlohmann::json::exception or ValidationError on malformed input.
    Snapshot fromJson(const nlohmann::json& j);

    std::string serialize(const Snapshot& snap);
    bool deserialize(const std::string& text, Snapshot& out);
}
