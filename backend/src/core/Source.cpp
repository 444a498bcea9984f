#include "Source.hpp"

Source::Source(const std::string& t, OriginKind o)
    : text(t), origin(o)
{
}

std::string Source::displayTitle() const {
    if (origin_title && !origin_title->empty()) return *origin_title;
    const size_t max_len = 40;
    if (text.size() <= max_len) return text;
    return text.substr(0, max_len) + "...";
}
