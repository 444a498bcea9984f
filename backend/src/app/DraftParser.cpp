#include "DraftParser.hpp"
#include "../core/Errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

std::vector<CardDraft> fromJson(const json& data) {
    json entries;
    if (data.is_array()) entries = data;
    else if (data.is_object() && data.contains("cards") && data["cards"].is_array()) entries = data["cards"];
    else if (data.is_object()) entries = json::array({ data });
    else throw DraftParseError("draft JSON must be an array or an object");

    std::vector<CardDraft> out;
    for (const auto& e : entries) {
        if (!e.is_object() || !e.contains("front") || !e.contains("back")) {
            spdlog::debug("Skipping draft entry without front/back");
            continue;
        }
        if (!e["front"].is_string() || !e["back"].is_string()) continue;

        CardDraft d;
        d.front = e["front"].get<std::string>();
        d.back = e["back"].get<std::string>();
        if (e.contains("hint") && e["hint"].is_string()) d.hint = e["hint"].get<std::string>();
        if (e.contains("tags") && e["tags"].is_array()) {
            for (const auto& t : e["tags"]) {
                if (t.is_string()) d.tags.push_back(t.get<std::string>());
            }
        }
        out.push_back(d);
    }
    return out;
}

} // namespace

namespace DraftParser
{

std::vector<CardDraft> parse(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (!data.is_discarded()) return fromJson(data);

    auto open = text.find('[');
    auto close = text.rfind(']');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        json slice = json::parse(text.substr(open, close - open + 1), nullptr, false);
        if (!slice.is_discarded()) {
            spdlog::debug("Draft JSON recovered from embedded array");
            return fromJson(slice);
        }
    }
    throw DraftParseError("no card drafts found in drafter output");
}

}
