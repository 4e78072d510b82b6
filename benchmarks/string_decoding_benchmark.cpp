#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <JsonRead/reader.hpp>
#include <JsonRead/error_formatting.hpp>

#ifdef JSONREAD_BENCH_WITH_RAPIDJSON
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#endif

#ifdef JSONREAD_BENCH_WITH_YYJSON
#include <yyjson.h>
#endif

#include "bench_matrix.hpp"

namespace json_read_benchmarks {

// ----------------------------------------------------------------------------
// Workloads: each one is a list of JSON string literals, quotes included
// ----------------------------------------------------------------------------

constexpr int kStrings = 1000;

std::string quoted(const std::string& body) {
    return "\"" + body + "\"";
}

struct PlainAscii {
    static constexpr std::string_view name = "plain ASCII (no escapes)";
    static constexpr int iter_count = 2000;

    static std::vector<std::string> make() {
        std::vector<std::string> out;
        for (int i = 0; i < kStrings; ++i) {
            out.push_back(quoted("sensor_" + std::to_string(i) + "_temperature_reading_celsius"));
        }
        return out;
    }
};

struct ShortEscapes {
    static constexpr std::string_view name = "short escapes";
    static constexpr int iter_count = 2000;

    static std::vector<std::string> make() {
        std::vector<std::string> out;
        for (int i = 0; i < kStrings; ++i) {
            out.push_back(quoted("line " + std::to_string(i) + R"(\n\t\"quoted\" C:\\path\\to\\file\/x\r\n)"));
        }
        return out;
    }
};

struct UnicodeEscapes {
    static constexpr std::string_view name = "unicode escapes";
    static constexpr int iter_count = 2000;

    static std::vector<std::string> make() {
        std::string bs(1, '\\');
        // e-acute, euro sign, and a surrogate pair for U+1F600
        std::string body = "caf" + bs + "u00e9 " + bs + "u20AC" + bs + "u0031" + bs + "u0030 "
                         + bs + "uD83D" + bs + "uDE00 end";
        std::vector<std::string> out;
        for (int i = 0; i < kStrings; ++i) {
            out.push_back(quoted(body + std::to_string(i)));
        }
        return out;
    }
};

struct RawUtf8 {
    static constexpr std::string_view name = "raw multi-byte UTF-8";
    static constexpr int iter_count = 2000;

    static std::vector<std::string> make() {
        std::vector<std::string> out;
        for (int i = 0; i < kStrings; ++i) {
            out.push_back(quoted("\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82 "
                                 "\xE4\xB8\x96\xE7\x95\x8C \xF0\x9F\x98\x80 #" + std::to_string(i)));
        }
        return out;
    }
};

// ----------------------------------------------------------------------------
// Testers
// ----------------------------------------------------------------------------

template<class Src>
bool decode_one(Src& src, std::string& scratch, std::size_t& decoded) {
    auto q = src.next();
    if (!q || !q->has_value() || **q != '"') {
        return false;
    }
    auto r = src.parse_str(scratch);
    if (!r) {
        std::cerr << JsonRead::ReadResultToString(r) << std::endl;
        return false;
    }
    decoded += r->get().size();
    return true;
}

struct JsonReadSlice {
    static constexpr std::string_view library_name = "JsonRead SliceSource";
    std::string scratch;

    bool decode_all(const std::vector<std::string>& tokens, std::size_t& decoded) {
        for (const auto& t : tokens) {
            JsonRead::SliceSource<false> src(t);
            if (!decode_one(src, scratch, decoded)) return false;
        }
        return true;
    }
};

struct JsonReadString {
    static constexpr std::string_view library_name = "JsonRead StringSource";
    std::string scratch;

    bool decode_all(const std::vector<std::string>& tokens, std::size_t& decoded) {
        for (const auto& t : tokens) {
            // Workloads are valid UTF-8 by construction
            JsonRead::StringSource<false> src(JsonRead::trusted_utf8, t);
            if (!decode_one(src, scratch, decoded)) return false;
        }
        return true;
    }
};

struct JsonReadStream {
    static constexpr std::string_view library_name = "JsonRead StreamSource";
    std::string scratch;

    bool decode_all(const std::vector<std::string>& tokens, std::size_t& decoded) {
        for (const auto& t : tokens) {
            auto src = JsonRead::make_stream_source<false>(t.begin(), t.end());
            if (!decode_one(src, scratch, decoded)) return false;
        }
        return true;
    }
};

struct JsonReadSkip {
    static constexpr std::string_view library_name = "JsonRead SliceSource (skip only)";

    bool decode_all(const std::vector<std::string>& tokens, std::size_t& decoded) {
        for (const auto& t : tokens) {
            JsonRead::SliceSource<false> src(t);
            src.next();
            if (!src.ignore_str()) return false;
            decoded += src.byte_offset();
        }
        return true;
    }
};

#ifdef JSONREAD_BENCH_WITH_RAPIDJSON
struct RapidJSONDom {
    static constexpr std::string_view library_name = "RapidJSON";

    bool decode_all(const std::vector<std::string>& tokens, std::size_t& decoded) {
        for (const auto& t : tokens) {
            rapidjson::Document doc;
            doc.Parse<rapidjson::kParseValidateEncodingFlag>(t.data(), t.size());
            if (doc.HasParseError() || !doc.IsString()) {
                std::cerr << "RapidJSON: " << rapidjson::GetParseError_En(doc.GetParseError()) << std::endl;
                return false;
            }
            decoded += doc.GetStringLength();
        }
        return true;
    }
};
#endif

#ifdef JSONREAD_BENCH_WITH_YYJSON
struct YYJson {
    static constexpr std::string_view library_name = "yyjson";

    bool decode_all(const std::vector<std::string>& tokens, std::size_t& decoded) {
        for (const auto& t : tokens) {
            yyjson_read_err err;
            // Safe to cast away constness as long as YYJSON_READ_INSITU is not set
            yyjson_doc* doc = yyjson_read_opts(const_cast<char*>(t.data()), t.size(), 0, nullptr, &err);
            if (!doc) {
                std::cerr << "yyjson: " << err.msg << std::endl;
                return false;
            }
            decoded += yyjson_get_len(yyjson_doc_get_root(doc));
            yyjson_doc_free(doc);
        }
        return true;
    }
};
#endif

} // namespace json_read_benchmarks

int main() {
    using namespace json_read_benchmarks;
    std::ios::sync_with_stdio(false);

    return run<
        Libraries<
            JsonReadSlice,
            JsonReadString,
            JsonReadStream,
            JsonReadSkip
#ifdef JSONREAD_BENCH_WITH_RAPIDJSON
            , RapidJSONDom
#endif
#ifdef JSONREAD_BENCH_WITH_YYJSON
            , YYJson
#endif
        >,
        Workloads<PlainAscii, ShortEscapes, UnicodeEscapes, RawUtf8>
    >();
}
