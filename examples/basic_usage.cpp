// Basic JsonRead usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <JsonRead/reader.hpp>
#include <JsonRead/error_formatting.hpp>
#include <iostream>
#include <string>

using namespace JsonRead;

// Walks a flat JSON array of strings by hand: the structural bytes go
// through next/peek/discard, string contents through parse_str.
template<SourceLike Source>
bool print_strings(Source& src, std::string_view input) {
    std::string scratch;
    auto open = src.next();
    if (!open || !open->has_value() || **open != '[') {
        std::cout << "expected '['" << std::endl;
        return false;
    }
    while (true) {
        auto b = src.next();
        if (!b || !b->has_value()) {
            std::cout << "unexpected end of input" << std::endl;
            return false;
        }
        switch (**b) {
        case ' ': case '\n': case ',':
            continue;
        case ']':
            return true;
        case '"': {
            auto s = src.parse_str(scratch);
            if (!s) {
                std::cout << "Parse error: " << ReadResultToString(s, input) << std::endl;
                return false;
            }
            std::cout << (s->is_borrowed() ? "borrowed: " : "copied:   ") << s->get() << std::endl;
            break;
        }
        default:
            std::cout << "unexpected byte at offset " << src.byte_offset() << std::endl;
            return false;
        }
    }
}

int main() {
    std::string_view json = R"(["plain", "with\ttab", "caf\u00e9", "\ud83d\ude00"])";

    SliceSource slice(json);
    if (!print_strings(slice, json)) {
        return 1;
    }

    std::string_view broken = R"(["fine", "bad \x escape"])";
    SliceSource broken_slice(broken);
    // Reports the bad escape together with its position
    print_strings(broken_slice, broken);

    // Lenient decoding keeps a lone surrogate instead of failing
    SliceSource lenient(R"(\udead")");
    std::string scratch;
    auto raw = lenient.parse_str_raw(scratch);
    std::cout << "raw bytes: " << (raw ? raw->get().size() : 0) << std::endl;
    return 0;
}
