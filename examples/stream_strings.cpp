// Reads a whitespace separated sequence of JSON strings from stdin
// Example: printf '"a" "b\\n"\n"c"' | ./stream_strings

#include <JsonRead/istream_channel.hpp>
#include <JsonRead/string_sequence.hpp>
#include <JsonRead/error_formatting.hpp>
#include <iostream>

using namespace JsonRead;

int main() {
    StringSequenceReader reader(make_stream_source(std::cin));
    std::size_t count = 0;
    while (true) {
        auto r = reader.next();
        if (!r) {
            std::cerr << ReadResultToString(r) << std::endl;
            return 1;
        }
        if (!r->has_value()) {
            break;
        }
        ++count;
        std::cout << count << ": " << **r << std::endl;
    }
    std::cout << count << " strings, " << reader.byte_offset() << " bytes" << std::endl;
    return 0;
}
