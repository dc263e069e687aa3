#include <neograph/cypher/sanitizer.h>

namespace neograph::cypher {

std::string sanitize(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (kForbiddenChars.find(c) == std::string_view::npos) {
            out.push_back(c);
        }
    }
    return out;
}

bool isSanitized(std::string_view input) {
    return input.find_first_of(kForbiddenChars) == std::string_view::npos;
}

} // namespace neograph::cypher
