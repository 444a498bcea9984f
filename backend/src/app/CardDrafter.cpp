#include "CardDrafter.hpp"
#include "DraftParser.hpp"
#include "../core/Errors.hpp"
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

JsonFileDrafter::JsonFileDrafter(const std::string& p)
    : path(p)
{
}

std::vector<CardDraft> JsonFileDrafter::draft(const Source& source) {
    std::ifstream in(path);
    if (!in) {
        throw DraftParseError("cannot open draft file '" + path + "'");
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto drafts = DraftParser::parse(text);
    spdlog::info("Read {} draft(s) for source {} from '{}'", drafts.size(), source.id, path);
    return drafts;
}
