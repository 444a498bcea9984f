#include "Codec.hpp"
#include "../core/Errors.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& v) {
    if (!v) return nullptr;
    return *v;
}

template <typename T>
std::optional<T> optionalFromJson(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

json schedToJson(const SchedulingState& s) {
    return {
        {"ease_factor", s.ease_factor},
        {"interval", s.interval},
        {"repetitions", s.repetitions},
        {"next_review", optionalToJson(s.next_review)},
        {"last_review", optionalToJson(s.last_review)}
    };
}

SchedulingState schedFromJson(const json& j) {
    SchedulingState s;
    s.ease_factor = j.at("ease_factor").get<double>();
    s.interval = j.at("interval").get<int>();
    s.repetitions = j.at("repetitions").get<int>();
    s.next_review = optionalFromJson<std::time_t>(j, "next_review");
    s.last_review = optionalFromJson<std::time_t>(j, "last_review");
    return s;
}

} // namespace

namespace Codec
{

json toJson(const Snapshot& snap) {
    json j;
    j["version"] = 1;
    j["next_ids"] = {
        {"source", snap.next_source_id},
        {"card", snap.next_card_id},
        {"log", snap.next_log_id}
    };

    j["tags"] = json::array();
    for (const auto& t : snap.tags) {
        j["tags"].push_back({
            {"id", t.id},
            {"name", t.name},
            {"color", optionalToJson(t.color)},
            {"created_at", t.created_at}
        });
    }

    j["sources"] = json::array();
    for (const auto& s : snap.sources) {
        j["sources"].push_back({
            {"id", s.id},
            {"text", s.text},
            {"origin", toString(s.origin)},
            {"origin_url", optionalToJson(s.origin_url)},
            {"origin_title", optionalToJson(s.origin_title)},
            {"external_key", optionalToJson(s.external_key)},
            {"highlight_color", optionalToJson(s.highlight_color)},
            {"status", toString(s.status)},
            {"tags", s.tags},
            {"created_at", s.created_at},
            {"updated_at", s.updated_at}
        });
    }

    j["cards"] = json::array();
    for (const auto& c : snap.cards) {
        j["cards"].push_back({
            {"id", c.id},
            {"front", c.front},
            {"back", c.back},
            {"hint", optionalToJson(c.hint)},
            {"source_id", optionalToJson(c.source_id)},
            {"status", toString(c.status)},
            {"sched", schedToJson(c.sched)},
            {"tags", c.tags},
            {"created_at", c.created_at},
            {"updated_at", c.updated_at}
        });
    }

    j["logs"] = json::array();
    for (const auto& l : snap.logs) {
        j["logs"].push_back({
            {"id", l.id},
            {"card_id", l.card_id},
            {"quality", toString(l.quality)},
            {"before", schedToJson(l.before)},
            {"after", schedToJson(l.after)},
            {"response_time_ms", optionalToJson(l.response_time_ms)},
            {"reviewed_at", l.reviewed_at}
        });
    }
    return j;
}

Snapshot fromJson(const json& j) {
    Snapshot snap;
    if (j.at("version").get<int>() != 1) {
        throw ValidationError("unsupported data version");
    }

    const json& ids = j.at("next_ids");
    snap.next_source_id = ids.at("source").get<std::int64_t>();
    snap.next_card_id = ids.at("card").get<std::int64_t>();
    snap.next_log_id = ids.at("log").get<std::int64_t>();

    for (const auto& jt : j.at("tags")) {
        Tag t;
        t.id = jt.at("id").get<std::int64_t>();
        t.name = jt.at("name").get<std::string>();
        t.color = optionalFromJson<std::string>(jt, "color");
        t.created_at = jt.at("created_at").get<std::time_t>();
        snap.tags.push_back(t);
    }

    for (const auto& js : j.at("sources")) {
        Source s;
        s.id = js.at("id").get<std::int64_t>();
        s.text = js.at("text").get<std::string>();
        s.origin = originKindFromString(js.at("origin").get<std::string>());
        s.origin_url = optionalFromJson<std::string>(js, "origin_url");
        s.origin_title = optionalFromJson<std::string>(js, "origin_title");
        s.external_key = optionalFromJson<std::string>(js, "external_key");
        s.highlight_color = optionalFromJson<std::string>(js, "highlight_color");
        s.status = sourceStatusFromString(js.at("status").get<std::string>());
        s.setTags(js.at("tags").get<std::vector<std::string>>());
        s.created_at = js.at("created_at").get<std::time_t>();
        s.updated_at = js.at("updated_at").get<std::time_t>();
        snap.sources.push_back(s);
    }

    for (const auto& jc : j.at("cards")) {
        Card c;
        c.id = jc.at("id").get<std::int64_t>();
        c.front = jc.at("front").get<std::string>();
        c.back = jc.at("back").get<std::string>();
        c.hint = optionalFromJson<std::string>(jc, "hint");
        c.source_id = optionalFromJson<std::int64_t>(jc, "source_id");
        c.status = cardStatusFromString(jc.at("status").get<std::string>());
        c.sched = schedFromJson(jc.at("sched"));
        c.setTags(jc.at("tags").get<std::vector<std::string>>());
        c.created_at = jc.at("created_at").get<std::time_t>();
        c.updated_at = jc.at("updated_at").get<std::time_t>();
        snap.cards.push_back(c);
    }

    for (const auto& jl : j.at("logs")) {
        ReviewLog l;
        l.id = jl.at("id").get<std::int64_t>();
        l.card_id = jl.at("card_id").get<std::int64_t>();
        l.quality = qualityFromString(jl.at("quality").get<std::string>());
        l.before = schedFromJson(jl.at("before"));
        l.after = schedFromJson(jl.at("after"));
        l.response_time_ms = optionalFromJson<int>(jl, "response_time_ms");
        l.reviewed_at = jl.at("reviewed_at").get<std::time_t>();
        snap.logs.push_back(l);
    }
    return snap;
}

std::string serialize(const Snapshot& snap) {
    return toJson(snap).dump();
}

bool deserialize(const std::string& text, Snapshot& out) {
    try {
        out = fromJson(json::parse(text));
        return true;
    }
    catch (const json::exception& e) {
        spdlog::error("Malformed data payload: {}", e.what());
    }
    catch (const RetainError& e) {
        spdlog::error("Invalid data payload: {}", e.what());
    }
    return false;
}

}
