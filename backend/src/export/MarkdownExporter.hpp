#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "../app/StudyService.hpp"

struct ExportReport {
    std::size_t sources_written = 0;
    std::size_t cards_written = 0;
    std::vector<std::string> files;
};

/*
  Writes approved sources and active cards as markdown notes with YAML front
  matter, for reading and searching in a note vault:

    <vault>/<folder>/sources/<id>-<slug>.md
    <vault>/<folder>/cards/<source id|manual>-<card id>-<slug>.md
    <vault>/<folder>/index.md

  Read-only with respect to the repository. Existing files are overwritten.
*/
class MarkdownExporter {
public:
    MarkdownExporter(const std::string& vault_dir, const std::string& folder = "learnings");

    // Throws StorageError when a directory or file cannot be written.
    ExportReport exportAll(const ExportBundle& bundle) const;

    static std::string slugify(const std::string& text, std::size_t max_len = 50);
    static std::string sourceStem(const Source& source);
    static std::string cardStem(const Card& card);

    static std::string sourceMarkdown(const Source& source, const std::vector<Card>& cards);
    static std::string cardMarkdown(const Card& card, const std::optional<std::string>& source_stem);
    static std::string indexMarkdown(const ExportBundle& bundle);

private:
    std::string base_dir;

    void writeFile(const std::string& path, const std::string& content) const;
};
