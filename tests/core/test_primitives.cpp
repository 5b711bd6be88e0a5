#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string_view>

#include "deepsize.hpp"
#include "common/test_check.hpp"

using namespace deepsize;

/*
================================================================================
Scalars, fixed arrays and declared sizes: Unit Tests
================================================================================

Types without heap ownership report zero children and a total equal to their
in-place size. Fixed arrays lay their elements out inline. Opaque types get
their size only from an explicit declaration.
================================================================================
*/

enum class Color : std::uint16_t { red, green, blue };

namespace opaque {
struct DeviceHandle {
    int fd;
};
struct Mapping {
    void* base;
};
} // namespace opaque

DEEPSIZE_KNOWN_SIZE(0, opaque::DeviceHandle)
DEEPSIZE_KNOWN_SIZE(4096, opaque::Mapping)


void test_integer_and_float_sizes() {
    std::cout << "[TEST] Primitive totals equal sizeof..." << std::endl;

    TEST_CHECK_EQ(deep_size_of(std::uint8_t{0}),  1u);
    TEST_CHECK_EQ(deep_size_of(std::uint16_t{0}), 2u);
    TEST_CHECK_EQ(deep_size_of(std::uint32_t{0}), 4u);
    TEST_CHECK_EQ(deep_size_of(std::uint64_t{0}), 8u);

    TEST_CHECK_EQ(deep_size_of(std::int8_t{0}),  1u);
    TEST_CHECK_EQ(deep_size_of(std::int16_t{0}), 2u);
    TEST_CHECK_EQ(deep_size_of(std::int32_t{0}), 4u);
    TEST_CHECK_EQ(deep_size_of(std::int64_t{0}), 8u);

    TEST_CHECK_EQ(deep_size_of(0.0f), 4u);
    TEST_CHECK_EQ(deep_size_of(0.0),  8u);

    TEST_CHECK_EQ(deep_size_of(true), sizeof(bool));
    TEST_CHECK_EQ(deep_size_of('x'),  1u);
    TEST_CHECK_EQ(deep_size_of(std::byte{0x2a}), 1u);

    std::cout << "[TEST] OK\n";
}

void test_scalar_children_are_zero() {
    std::cout << "[TEST] Scalar children size is zero..." << std::endl;

    Context ctx;
    TEST_CHECK_EQ(deep_size_of_children(42, ctx), 0u);
    TEST_CHECK_EQ(deep_size_of_children(3.5, ctx), 0u);
    TEST_CHECK_EQ(deep_size_of_children(Color::green, ctx), 0u);
    TEST_CHECK_EQ(deep_size_of_children(nullptr, ctx), 0u);
    TEST_CHECK_EQ(deep_size_of(Color::blue), sizeof(Color));

    // nothing was marked along the way
    TEST_CHECK_EQ(ctx.visited(), 0u);
    TEST_CHECK_EQ(ctx.depth(), 0u);

    std::cout << "[TEST] OK\n";
}

void test_zero_cost_library_types() {
    std::cout << "[TEST] Atomics, durations and views own nothing..." << std::endl;

    std::atomic<std::uint64_t> counter{7};
    TEST_CHECK_EQ(deep_size_of(counter), sizeof(counter));

    std::chrono::milliseconds timeout{250};
    TEST_CHECK_EQ(deep_size_of(timeout), sizeof(timeout));

    std::string_view view = "a view never owns the characters it points at";
    TEST_CHECK_EQ(deep_size_of(view), sizeof(std::string_view));

    std::cout << "[TEST] OK\n";
}

void test_fixed_arrays() {
    std::cout << "[TEST] Fixed-size arrays are laid out inline..." << std::endl;

    std::uint32_t raw[8] = {};
    TEST_CHECK_EQ(deep_size_of(raw), 8 * sizeof(std::uint32_t));

    std::array<double, 5> arr{};
    TEST_CHECK_EQ(deep_size_of(arr), 5 * sizeof(double));

    std::array<std::array<std::uint8_t, 4>, 3> nested{};
    TEST_CHECK_EQ(deep_size_of(nested), 12u);

    std::cout << "[TEST] OK\n";
}

void test_declared_sizes() {
    std::cout << "[TEST] DEEPSIZE_KNOWN_SIZE declares opaque costs..." << std::endl;

    opaque::DeviceHandle dev{3};
    TEST_CHECK_EQ(deep_size_of(dev), sizeof(opaque::DeviceHandle));

    opaque::Mapping map{nullptr};
    TEST_CHECK_EQ(deep_size_of(map), sizeof(opaque::Mapping) + 4096);

    Context ctx;
    TEST_CHECK_EQ(deep_size_of_children(declared(128), ctx), 128u);
    TEST_CHECK_EQ(sum_children(ctx, 1, declared(16), 2.0, declared(0)), 16u);

    std::cout << "[TEST] OK\n";
}

void test_footprint_split() {
    std::cout << "[TEST] footprint_of splits static and dynamic bytes..." << std::endl;

    opaque::Mapping map{nullptr};
    auto fp = footprint_of(map);
    TEST_CHECK_EQ(fp.static_bytes, sizeof(opaque::Mapping));
    TEST_CHECK_EQ(fp.dynamic_bytes, 4096u);
    TEST_CHECK_EQ(fp.total_bytes(), deep_size_of(map));

    footprint sum{};
    sum.add(fp);
    sum.add_static(8);
    sum.add_dynamic(std::uint64_t{100});
    TEST_CHECK_EQ(sum.static_bytes, sizeof(opaque::Mapping) + 8);
    TEST_CHECK_EQ(sum.dynamic_bytes, 4196u);

    std::cout << "[TEST] OK\n";
}

void test_sizable_concept() {
    std::cout << "[TEST] Sizable concept..." << std::endl;

    struct Unknown { int x; };

    static_assert(Sizable<int>);
    static_assert(Sizable<const double>);
    static_assert(Sizable<Color>);
    static_assert(Sizable<int[4]>);
    static_assert(Sizable<opaque::Mapping>);
    static_assert(!Sizable<Unknown>);
    static_assert(!Sizable<Unknown[2]>);
    static_assert(stack_size<std::uint32_t>() == 4);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_integer_and_float_sizes();
    test_scalar_children_are_zero();
    test_zero_cost_library_types();
    test_fixed_arrays();
    test_declared_sizes();
    test_footprint_split();
    test_sizable_concept();

    std::cout << "[TEST] ALL PRIMITIVE TESTS PASSED!\n";
    return 0;
}
