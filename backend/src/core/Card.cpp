#include "Card.hpp"
#include <sstream>

Card::Card(const std::string& f, const std::string& b)
    : front(f), back(b)
{
}

std::string Card::summary() const {
    std::ostringstream oss;
    oss << "#" << id << " [" << toString(status) << "] " << front;
    return oss.str();
}
