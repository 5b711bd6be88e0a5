#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "deepsize.hpp"
#include "common/test_check.hpp"

using namespace deepsize;

/*
================================================================================
Owning and borrowing pointers: Unit Tests
================================================================================

unique_ptr always charges its pointee. shared_ptr, raw pointers and
reference_wrapper charge the pointee only the first time a traversal reaches
it, which also breaks reference cycles. A polymorphic pointee reached through
different base types is one object. weak_ptr charges nothing.
================================================================================
*/

namespace graph {

struct Node {
    std::string name;
    std::shared_ptr<Node> next;
};
DEEPSIZE_DERIVE(Node, name, next)

struct Example {
    std::uint32_t* first;
    std::uint32_t* second;
};
DEEPSIZE_DERIVE(Example, first, second)

} // namespace graph

namespace shapes {

struct Base {
    virtual ~Base() = default;
    std::uint64_t id{0};
};
DEEPSIZE_DERIVE(Base, id)

struct Derived : Base {
    std::string label;
};
DEEPSIZE_DERIVE(Derived, id, label)

// The same object owned through its own type and through its base
struct Holder {
    std::shared_ptr<Derived> derived;
    std::shared_ptr<Base> base;
};
DEEPSIZE_DERIVE(Holder, derived, base)

} // namespace shapes

namespace {

const std::string long_text = "a string that is far too long for any small-string buffer";

std::size_t heap_of(const std::string& s) {
    return capacity::is_inline(s) ? 0 : s.capacity() + 1;
}

} // namespace


void test_unique_ptr_counts_pointee() {
    std::cout << "[TEST] unique_ptr: pointee is always counted..." << std::endl;

    auto p = std::make_unique<std::uint32_t>(7);
    TEST_CHECK_EQ(deep_size_of(p), sizeof(p) + sizeof(std::uint32_t));

    std::unique_ptr<std::uint32_t> empty;
    TEST_CHECK_EQ(deep_size_of(empty), sizeof(empty));

    auto s = std::make_unique<std::string>(long_text);
    TEST_CHECK_EQ(deep_size_of(s), sizeof(s) + sizeof(std::string) + heap_of(*s));

    // unique ownership is never marked
    Context ctx;
    TEST_CHECK_EQ(deep_size_of_children(p, ctx), sizeof(std::uint32_t));
    TEST_CHECK_EQ(deep_size_of_children(p, ctx), sizeof(std::uint32_t));
    TEST_CHECK_EQ(ctx.visited(), 0u);

    std::cout << "[TEST] OK\n";
}

void test_shared_allocation_counted_once() {
    std::cout << "[TEST] shared_ptr: one allocation, two owners, counted once..." << std::endl;

    auto p = std::make_shared<std::uint64_t>(1);
    std::vector<std::shared_ptr<std::uint64_t>> owners{p, p};

    const auto expected =
        sizeof(owners) + owners.capacity() * sizeof(std::shared_ptr<std::uint64_t>)
        + sizeof(std::uint64_t);
    TEST_CHECK_EQ(deep_size_of(owners), expected);

    std::cout << "[TEST] OK\n";
}

void test_shared_context_across_roots() {
    std::cout << "[TEST] deep_size_of_all: roots share one context..." << std::endl;

    auto payload = std::make_shared<std::string>(long_text);
    auto a = payload;
    auto b = payload;

    const auto separate = deep_size_of(a) + deep_size_of(b);
    const auto together = deep_size_of_all(a, b);

    TEST_CHECK_EQ(separate, 2 * (sizeof(a) + sizeof(std::string) + heap_of(*payload)));
    TEST_CHECK_EQ(together, 2 * sizeof(a) + sizeof(std::string) + heap_of(*payload));
    TEST_CHECK(together < separate);

    std::cout << "[TEST] OK\n";
}

void test_equal_values_distinct_allocations() {
    std::cout << "[TEST] Equal values in distinct allocations are counted separately..." << std::endl;

    auto a = std::make_shared<std::uint32_t>(42);
    auto b = std::make_shared<std::uint32_t>(42);
    std::vector<std::shared_ptr<std::uint32_t>> owners{a, b};

    Context ctx;
    TEST_CHECK_EQ(deep_size_of_children(owners, ctx),
                  owners.capacity() * sizeof(a) + 2 * sizeof(std::uint32_t));
    TEST_CHECK_EQ(ctx.visited(), 2u);

    std::cout << "[TEST] OK\n";
}

void test_reference_cycle_terminates() {
    std::cout << "[TEST] shared_ptr cycle: each node counted once..." << std::endl;

    auto a = std::make_shared<graph::Node>();
    auto b = std::make_shared<graph::Node>();
    a->name = long_text;
    b->name = "b";
    a->next = b;
    b->next = a;

    const auto expected =
        sizeof(std::shared_ptr<graph::Node>)
        + 2 * sizeof(graph::Node)
        + heap_of(a->name) + heap_of(b->name);
    TEST_CHECK_EQ(deep_size_of(a), expected);
    TEST_CHECK_EQ(deep_size_of(b), expected);

    // break the cycle so both nodes are released
    a->next.reset();

    std::cout << "[TEST] OK\n";
}

void test_self_cycle() {
    std::cout << "[TEST] shared_ptr self cycle..." << std::endl;

    auto n = std::make_shared<graph::Node>();
    n->next = n;

    TEST_CHECK_EQ(deep_size_of(n), sizeof(n) + sizeof(graph::Node));

    n->next.reset();

    std::cout << "[TEST] OK\n";
}

void test_weak_ptr_owns_nothing() {
    std::cout << "[TEST] weak_ptr owns nothing..." << std::endl;

    auto strong = std::make_shared<std::string>(long_text);
    std::weak_ptr<std::string> weak = strong;

    TEST_CHECK_EQ(deep_size_of(weak), sizeof(weak));

    std::cout << "[TEST] OK\n";
}

void test_raw_pointers_are_borrowed() {
    std::cout << "[TEST] Raw pointers: referent counted once per traversal..." << std::endl;

    std::uint32_t target = 5;
    graph::Example ex{&target, &target};
    TEST_CHECK_EQ(deep_size_of(ex), 2 * sizeof(void*) + sizeof(std::uint32_t));

    graph::Example nulls{nullptr, nullptr};
    TEST_CHECK_EQ(deep_size_of(nulls), 2 * sizeof(void*));

    const std::string* borrowed = &long_text;
    TEST_CHECK_EQ(deep_size_of(borrowed), sizeof(borrowed) + sizeof(std::string) + heap_of(long_text));

    std::cout << "[TEST] OK\n";
}

void test_reference_wrapper() {
    std::cout << "[TEST] reference_wrapper shares the referent..." << std::endl;

    std::vector<std::uint16_t> data(32);
    std::vector<std::reference_wrapper<const std::vector<std::uint16_t>>> refs{
        std::cref(data), std::cref(data), std::cref(data)
    };

    Context ctx;
    TEST_CHECK_EQ(deep_size_of_children(refs, ctx),
                  refs.capacity() * sizeof(refs[0])
                  + sizeof(data) + data.capacity() * sizeof(std::uint16_t));

    std::cout << "[TEST] OK\n";
}

void test_base_and_derived_owners_share_the_object() {
    std::cout << "[TEST] shared_ptr<Derived> and shared_ptr<Base>: one object..." << std::endl;

    auto d = std::make_shared<shapes::Derived>();
    d->id = 3;
    d->label = long_text;
    std::shared_ptr<shapes::Base> b = d;

    shapes::Holder holder{d, b};
    TEST_CHECK_EQ(deep_size_of(holder),
                  sizeof(shapes::Holder) + sizeof(shapes::Derived) + heap_of(d->label));

    TEST_CHECK_EQ(deep_size_of_all(d, b),
                  sizeof(d) + sizeof(b) + sizeof(shapes::Derived) + heap_of(d->label));

    // the first owner reached charges its static type
    Context ctx;
    TEST_CHECK_EQ(deep_size_of_children(b, ctx), sizeof(shapes::Base));
    TEST_CHECK_EQ(deep_size_of_children(d, ctx), 0u);
    TEST_CHECK_EQ(ctx.visited(), 1u);

    std::cout << "[TEST] OK\n";
}

void test_null_pointers() {
    std::cout << "[TEST] Null pointers own nothing..." << std::endl;

    std::shared_ptr<std::string> s;
    std::unique_ptr<std::vector<int>> u;
    int* raw = nullptr;

    TEST_CHECK_EQ(deep_size_of(s), sizeof(s));
    TEST_CHECK_EQ(deep_size_of(u), sizeof(u));
    TEST_CHECK_EQ(deep_size_of(raw), sizeof(raw));

    std::cout << "[TEST] OK\n";
}


int main() {
    test_unique_ptr_counts_pointee();
    test_shared_allocation_counted_once();
    test_shared_context_across_roots();
    test_equal_values_distinct_allocations();
    test_reference_cycle_terminates();
    test_self_cycle();
    test_weak_ptr_owns_nothing();
    test_raw_pointers_are_borrowed();
    test_reference_wrapper();
    test_base_and_derived_owners_share_the_object();
    test_null_pointers();

    std::cout << "[TEST] ALL POINTER TESTS PASSED!\n";
    return 0;
}
