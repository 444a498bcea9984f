#pragma once
#include <string>
#include <vector>
#include "../core/Card.hpp"

/*
  Parses card drafts produced by an external drafting tool.

  Accepted shapes:
    [ {"front": ..., "back": ..., "hint": ..., "tags": [...]}, ... ]
    { "cards": [ ... ] }
    { "front": ..., "back": ... }            (single card)

  Entries without a string front and back are skipped. If the text is not
  JSON but contains a [...] slice, that slice is parsed instead (tools often
  wrap their JSON in prose). Anything else throws DraftParseError.
*/
namespace DraftParser
{
    std::vector<CardDraft> parse(const std::string& text);
}
