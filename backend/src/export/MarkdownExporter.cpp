#include "MarkdownExporter.hpp"
#include "../core/Errors.hpp"
#include "../utils/strings.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

std::string isoTime(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string shorten(const std::string& text, std::size_t len) {
    std::string cut = Text::utf8Prefix(text, len);
    return cut.size() == text.size() ? text : cut + "...";
}

const std::size_t kRecentSources = 20;

} // namespace

MarkdownExporter::MarkdownExporter(const std::string& vault_dir, const std::string& folder)
    : base_dir((fs::path(vault_dir) / folder).string())
{
}

std::string MarkdownExporter::slugify(const std::string& text, std::size_t max_len) {
    static const std::string bad = "/\\:*?\"<>|#[] \t\n\r";

    std::string slug;
    for (char ch : Text::lower(text)) {
        char c = bad.find(ch) != std::string::npos ? '-' : ch;
        if (c == '-' && !slug.empty() && slug.back() == '-') continue; // collapse
        slug.push_back(c);
    }

    auto trimDashes = [](std::string s) {
        while (!s.empty() && s.front() == '-') s.erase(s.begin());
        while (!s.empty() && s.back() == '-') s.pop_back();
        return s;
    };

    slug = trimDashes(slug);
    std::string cut = Text::utf8Prefix(slug, max_len);
    if (cut.size() < slug.size()) slug = trimDashes(cut);
    return slug.empty() ? "untitled" : slug;
}

std::string MarkdownExporter::sourceStem(const Source& s) {
    return std::to_string(s.id) + "-" + slugify(s.origin_title ? *s.origin_title : Text::utf8Prefix(s.text, 30));
}

std::string MarkdownExporter::cardStem(const Card& c) {
    std::string owner = c.source_id ? std::to_string(*c.source_id) : "manual";
    return owner + "-" + std::to_string(c.id) + "-" + slugify(Text::utf8Prefix(c.front, 30));
}

std::string MarkdownExporter::sourceMarkdown(const Source& s, const std::vector<Card>& cards) {
    std::ostringstream md;
    md << "---\n"
        << "id: " << s.id << "\n"
        << "type: source\n"
        << "origin: " << toString(s.origin) << "\n"
        << "status: " << toString(s.status) << "\n"
        << "created: " << isoTime(s.created_at) << "\n"
        << "updated: " << isoTime(s.updated_at) << "\n";
    if (!s.tags.empty()) md << "tags: [" << Text::joinCsv(s.tags) << "]\n";
    if (s.origin_url) md << "url: \"" << *s.origin_url << "\"\n";
    md << "---\n\n";

    md << "# " << (s.origin_title ? *s.origin_title : "Source") << "\n\n";
    if (s.origin_url) md << "[Original Source](" << *s.origin_url << ")\n\n";

    md << "## Highlight\n\n> " << s.text << "\n\n";

    if (!cards.empty()) {
        md << "## Cards\n\n";
        for (const auto& c : cards) {
            md << "- [[cards/" << cardStem(c) << "|" << shorten(c.front, 50) << "]]\n";
        }
    }
    return md.str();
}

std::string MarkdownExporter::cardMarkdown(const Card& c, const std::optional<std::string>& source_stem) {
    std::ostringstream md;
    md << "---\n"
        << "id: " << c.id << "\n"
        << "type: card\n"
        << "status: " << toString(c.status) << "\n"
        << "ease_factor: " << c.sched.ease_factor << "\n"
        << "interval_days: " << c.sched.interval << "\n"
        << "repetitions: " << c.sched.repetitions << "\n"
        << "created: " << isoTime(c.created_at) << "\n";
    if (c.sched.next_review) md << "next_review: " << isoTime(*c.sched.next_review) << "\n";
    if (!c.tags.empty()) md << "tags: [" << Text::joinCsv(c.tags) << "]\n";
    if (c.source_id) md << "source_id: " << *c.source_id << "\n";
    md << "---\n\n";

    md << "## Question\n\n" << c.front << "\n\n"
        << "## Answer\n\n" << c.back << "\n\n";
    if (c.hint) md << "## Hint\n\n" << *c.hint << "\n\n";
    if (source_stem) md << "## Source\n\n![[sources/" << *source_stem << "]]\n";
    return md.str();
}

std::string MarkdownExporter::indexMarkdown(const ExportBundle& bundle) {
    std::ostringstream md;
    md << "---\n"
        << "updated: " << isoTime(bundle.generated_at) << "\n"
        << "---\n\n"
        << "# Learnings Index\n\n"
        << "**" << bundle.sources.size() << "** sources | **" << bundle.cards.size() << "** cards\n\n"
        << "## Recent Sources\n\n";

    std::vector<const Source*> recent;
    for (const auto& e : bundle.sources) recent.push_back(&e.source);
    std::stable_sort(recent.begin(), recent.end(),
        [](const Source* a, const Source* b) { return a->created_at > b->created_at; });
    if (recent.size() > kRecentSources) recent.resize(kRecentSources);

    for (const Source* s : recent) {
        std::string title = s->origin_title ? *s->origin_title : Text::utf8Prefix(s->text, 50);
        md << "- [[sources/" << sourceStem(*s) << "|" << title << "]]\n";
    }

    std::set<std::string> tags;
    for (const auto& e : bundle.sources) tags.insert(e.source.tags.begin(), e.source.tags.end());
    for (const auto& c : bundle.cards) tags.insert(c.tags.begin(), c.tags.end());

    md << "\n## Tags\n\n";
    for (const auto& t : tags) md << "- #" << t << "\n";
    return md.str();
}

void MarkdownExporter::writeFile(const std::string& path, const std::string& content) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for export", path);
        throw StorageError("cannot write '" + path + "'");
    }
    out << content;
}

ExportReport MarkdownExporter::exportAll(const ExportBundle& bundle) const {
    std::error_code ec;
    fs::create_directories(fs::path(base_dir) / "sources", ec);
    if (!ec) fs::create_directories(fs::path(base_dir) / "cards", ec);
    if (ec) {
        spdlog::error("Cannot create export directories under '{}': {}", base_dir, ec.message());
        throw StorageError("cannot create export directories under '" + base_dir + "'");
    }

    ExportReport report;
    std::map<std::int64_t, std::string> stems; // exported sources only
    for (const auto& entry : bundle.sources) {
        const std::string stem = sourceStem(entry.source);
        stems[entry.source.id] = stem;
        const std::string spath = (fs::path(base_dir) / "sources" / (stem + ".md")).string();
        writeFile(spath, sourceMarkdown(entry.source, entry.cards));
        report.files.push_back(spath);
        report.sources_written++;
    }

    for (const auto& c : bundle.cards) {
        if (c.status != CardStatus::ACTIVE) continue;
        std::optional<std::string> stem;
        if (c.source_id && stems.count(*c.source_id)) stem = stems[*c.source_id];

        const std::string cpath = (fs::path(base_dir) / "cards" / (cardStem(c) + ".md")).string();
        writeFile(cpath, cardMarkdown(c, stem));
        report.files.push_back(cpath);
        report.cards_written++;
    }

    const std::string ipath = (fs::path(base_dir) / "index.md").string();
    writeFile(ipath, indexMarkdown(bundle));
    report.files.push_back(ipath);

    spdlog::info("Exported {} source(s) and {} card(s) to '{}'",
        report.sources_written, report.cards_written, base_dir);
    return report;
}
