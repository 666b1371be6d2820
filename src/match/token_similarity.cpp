#include <placemerge/match/token_similarity.h>

#include <rapidfuzz/fuzz.hpp>

namespace placemerge::match {

double indelRatio(std::string_view a, std::string_view b) {
    if (a.empty() && b.empty())
        return 100.0;
    return rapidfuzz::fuzz::ratio(a, b);
}

double tokenSetRatio(std::string_view a, std::string_view b) {
    return rapidfuzz::fuzz::token_set_ratio(a, b);
}

} // namespace placemerge::match
