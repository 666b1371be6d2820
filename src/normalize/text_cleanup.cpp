#include <placemerge/normalize/text_cleanup.h>

namespace placemerge::normalize {

namespace {

// Base letters for U+00C0..U+00FF; 0 marks code points with no ASCII letter equivalent.
constexpr char kLatin1Fold[64] = {
    'a', 'a', 'a', 'a', 'a', 'a', 'a', 'c', 'e', 'e', 'e', 'e', 'i', 'i', 'i', 'i', // C0-CF
    'd', 'n', 'o', 'o', 'o', 'o', 'o', 0,   'o', 'u', 'u', 'u', 'u', 'y', 0,   's', // D0-DF
    'a', 'a', 'a', 'a', 'a', 'a', 'a', 'c', 'e', 'e', 'e', 'e', 'i', 'i', 'i', 'i', // E0-EF
    'd', 'n', 'o', 'o', 'o', 'o', 'o', 0,   'o', 'u', 'u', 'u', 'u', 'y', 0,   'y', // F0-FF
};

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string cleanText(std::string_view raw) {
    std::string folded;
    folded.reserve(raw.size());

    const auto* data = reinterpret_cast<const unsigned char*>(raw.data());
    const size_t n = raw.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = data[i];
        if (c < 0x80) {
            if (c >= 'A' && c <= 'Z') {
                folded.push_back(static_cast<char>(c - 'A' + 'a'));
            } else if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
                folded.push_back(static_cast<char>(c));
            } else {
                folded.push_back(' ');
            }
            ++i;
            continue;
        }

        // Two-byte sequences C3 80..C3 BF cover U+00C0..U+00FF
        if (c == 0xC3 && i + 1 < n && isContinuation(data[i + 1])) {
            char base = kLatin1Fold[data[i + 1] - 0x80];
            folded.push_back(base != 0 ? base : ' ');
            i += 2;
            continue;
        }

        // Anything else non-ASCII: skip the lead byte and its continuation bytes
        ++i;
        while (i < n && isContinuation(data[i])) {
            ++i;
        }
        folded.push_back(' ');
    }

    std::string out;
    out.reserve(folded.size());
    bool pendingSpace = false;
    for (char c : folded) {
        if (c == ' ') {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> splitTokens(std::string_view cleaned) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start < cleaned.size()) {
        size_t end = cleaned.find(' ', start);
        if (end == std::string_view::npos)
            end = cleaned.size();
        if (end > start)
            tokens.emplace_back(cleaned.substr(start, end - start));
        start = end + 1;
    }
    return tokens;
}

std::string joinTokens(const std::vector<std::string>& tokens, std::size_t count) {
    std::string out;
    for (size_t i = 0; i < count && i < tokens.size(); ++i) {
        if (i > 0)
            out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

std::string stripBusinessSuffixes(std::string_view cleaned,
                                  const std::unordered_set<std::string>& suffixes) {
    auto tokens = splitTokens(cleaned);
    size_t keep = tokens.size();
    while (keep > 1 && suffixes.count(tokens[keep - 1]) > 0) {
        --keep;
    }
    return joinTokens(tokens, keep);
}

bool endsWithBusinessSuffix(std::string_view cleaned,
                            const std::unordered_set<std::string>& suffixes) {
    auto tokens = splitTokens(cleaned);
    return tokens.size() > 1 && suffixes.count(tokens.back()) > 0;
}

} // namespace placemerge::normalize
