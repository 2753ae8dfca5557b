#include <csvl/decoder.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

struct fuzz_record {
    std::string text;
    std::optional<int> num;
    std::vector<double> values;

    auto tied() {
        return std::tie(text, num, values);
    }
};

template <typename... Us, typename Decoder>
void try_decode(Decoder& d, std::string_view line, char delim) {
    try {
        std::ignore = d.template decode<Us...>(line, delim);
    } catch (csvl::exception&) {
        return;
    }
}

template <typename... Ts>
void test_csvl_decode(std::string_view line, char delim) {
    csvl::line_decoder<Ts...> d;

    try {
        const auto& [s0, s1] =
            d.template decode<std::string, std::string>(line, delim);
        if (s0.size() == 10000) {
            std::cout << s0.size() << s1.size() << std::endl;
        }
    } catch (csvl::exception&) {
    }

    try_decode<fuzz_record>(d, line, delim);
    try_decode<std::vector<std::string_view>>(d, line, delim);
    try_decode<int, bool, char>(d, line, delim);
    try_decode<std::optional<float>>(d, line, delim);
}

template <typename... Ts>
void test_csvl(std::string_view line) {
    test_csvl_decode<Ts...>(line, ',');
    test_csvl_decode<Ts...>(line, ';');
    test_csvl_decode<Ts...>(line, ' ');
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string_view line{reinterpret_cast<const char*>(data), size};

    test_csvl<>(line);
    test_csvl<csvl::string_error>(line);
    test_csvl<csvl::throw_on_error>(line);

    return 0;
}
