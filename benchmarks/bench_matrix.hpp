// bench_matrix.hpp
#pragma once
#include <chrono>
#include <concepts>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

template<typename... T>
struct Libraries {};

template<typename... T>
struct Workloads {};

inline bool time_op(
    int iterations,
    auto&& op,
    double& avg_us_out)
{
    using clock = std::chrono::steady_clock;

    // Warm-up
    for (int i = 0; i < 3; ++i) {
        if (!op()) {
            avg_us_out = 0.0;
            return false;
        }
    }

    auto start = clock::now();
    for (int i = 0; i < iterations; ++i) {
        if (!op()) {
            avg_us_out = 0.0;
            return false;
        }
    }
    auto end = clock::now();
    auto total_us =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    avg_us_out = double(total_us) / iterations;
    return true;
}

namespace detail {

// A tester decodes every token (a complete JSON string literal, quotes included)
// and adds the number of decoded bytes to `decoded`
template<typename T>
concept HasDecode = requires(T t, const std::vector<std::string>& tokens, std::size_t& decoded) {
    { t.decode_all(tokens, decoded) } -> std::same_as<bool>;
};

template<typename W, typename... Libs>
void run_for_workload(Libs... libs) {
    const std::vector<std::string> tokens = W::make();
    std::size_t input_bytes = 0;
    for (const auto& t : tokens) {
        input_bytes += t.size();
    }

    std::cout << "==== " << W::name << "  (" << tokens.size() << " strings, "
              << input_bytes << " bytes)  iterations: " << W::iter_count << std::endl;

    auto run_one = [&]<typename Tester>(Tester& tester) {
        std::cout << std::setw(34) << Tester::library_name << "  ";
        if constexpr (HasDecode<Tester>) {
            std::size_t decoded = 0;
            double avg_us{};
            bool ok = time_op(W::iter_count, [&]() {
                decoded = 0;
                return tester.decode_all(tokens, decoded);
            }, avg_us);
            if (ok) {
                std::cout << std::fixed << std::setprecision(2) << std::setw(10) << avg_us
                          << " us/iter   " << decoded << " bytes decoded" << std::endl;
            } else {
                std::cout << std::setw(10) << "FAILED" << std::endl;
            }
        } else {
            std::cout << std::setw(10) << "N/A" << std::endl;
        }
    };
    (run_one(libs), ...);

    std::cout << "\n";
}

template<typename... Libs, typename... Ws>
int run_impl(Libraries<Libs...>, Workloads<Ws...>) {
    (run_for_workload<Ws, Libs...>(Libs{}...), ...);
    return 0;
}

} // namespace detail

template<typename LibList, typename WorkloadList>
int run() {
    return detail::run_impl(LibList{}, WorkloadList{});
}
