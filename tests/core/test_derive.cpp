#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "deepsize.hpp"
#include "common/test_check.hpp"

using namespace deepsize;

/*
================================================================================
User types: Unit Tests
================================================================================

Product types derive their children size field by field. Every field is
listed, opaque ones with a declared byte count. Sum types count only their
active payload. Hand-written members and memory_usage() adapters take part in
the same traversal.
================================================================================
*/

namespace app {

struct Sample {
    std::uint32_t a;
    std::unique_ptr<std::uint8_t> b;
};
DEEPSIZE_DERIVE(Sample, a, b)

struct Empty {};
DEEPSIZE_DERIVE_EMPTY(Empty)

struct Order {
    std::uint64_t id;
    std::string symbol;
    std::vector<double> fills;
    Sample extra;
};
DEEPSIZE_DERIVE(Order, id, symbol, fills, extra)

// Sum type over a variant
struct Text { std::string body; };
DEEPSIZE_DERIVE(Text, body)

struct Blob { std::vector<std::uint8_t> bytes; };
DEEPSIZE_DERIVE(Blob, bytes)

struct Message {
    std::uint32_t seq;
    std::variant<std::monostate, Text, Blob> payload;
};
DEEPSIZE_DERIVE(Message, seq, payload)

// Recursive through an owning pointer
struct Tree {
    std::uint32_t key;
    std::unique_ptr<Tree> left;
    std::unique_ptr<Tree> right;
};
DEEPSIZE_DERIVE(Tree, key, left, right)

// Reports its own footprint, like a component with a fixed arena
class Arena {
public:
    explicit Arena(std::size_t bytes)
        : buffer_(std::make_unique<std::byte[]>(bytes)), size_(bytes) {}

    [[nodiscard]] footprint memory_usage() const noexcept {
        return footprint{ .static_bytes = sizeof(*this), .dynamic_bytes = size_ };
    }

private:
    std::unique_ptr<std::byte[]> buffer_;
    std::size_t size_;
};

// Hand-written member with an opaque stdio buffer
class LogFile {
public:
    explicit LogFile(std::string path)
        : path_(std::move(path)) {}

    std::size_t deep_size_of_children(Context& ctx) const {
        return sum_children(ctx, path_, declared(BUFSIZ));
    }

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

// An opaque handle listed with the bytes it stands for
struct Handle {
    std::string path;
    std::FILE* file;
};
DEEPSIZE_DERIVE(Handle, path, DEEPSIZE_FIXED(file, BUFSIZ))

struct Counters {
    std::uint64_t hits;
    void* cookie;
    std::vector<std::uint32_t> buckets;
};
DEEPSIZE_DERIVE(Counters, hits, DEEPSIZE_FIXED(cookie, 0), buckets)

} // namespace app

namespace {

const std::string long_text = "a string that is far too long for any small-string buffer";

std::size_t heap_of(const std::string& s) {
    return capacity::is_inline(s) ? 0 : s.capacity() + 1;
}

struct NotSizable { int x; };

} // namespace


void test_derived_struct() {
    std::cout << "[TEST] DEEPSIZE_DERIVE sums the listed fields..." << std::endl;

    app::Sample sample{15, std::make_unique<std::uint8_t>(255)};
    TEST_CHECK_EQ(deep_size_of(sample), sizeof(app::Sample) + 1);

    app::Sample empty_sample{1, nullptr};
    TEST_CHECK_EQ(deep_size_of(empty_sample), sizeof(app::Sample));

    TEST_CHECK_EQ(deep_size_of(app::Empty{}), sizeof(app::Empty));

    std::cout << "[TEST] OK\n";
}

void test_nested_struct() {
    std::cout << "[TEST] Nested fields are laid out inline..." << std::endl;

    app::Order order{7, long_text, std::vector<double>(10), {1, std::make_unique<std::uint8_t>(1)}};
    TEST_CHECK_EQ(deep_size_of(order),
                  sizeof(app::Order)
                  + heap_of(order.symbol)
                  + order.fills.capacity() * sizeof(double)
                  + 1);

    std::cout << "[TEST] OK\n";
}

void test_sum_type() {
    std::cout << "[TEST] Sum type counts the active payload only..." << std::endl;

    app::Message m{1, std::monostate{}};
    TEST_CHECK_EQ(deep_size_of(m), sizeof(app::Message));

    m.payload = app::Text{long_text};
    TEST_CHECK_EQ(deep_size_of(m), sizeof(app::Message) + heap_of(std::get<app::Text>(m.payload).body));

    m.payload = app::Blob{std::vector<std::uint8_t>(300)};
    TEST_CHECK_EQ(deep_size_of(m), sizeof(app::Message) + std::get<app::Blob>(m.payload).bytes.capacity());

    std::cout << "[TEST] OK\n";
}

void test_recursive_type() {
    std::cout << "[TEST] Recursive type through unique_ptr..." << std::endl;

    app::Tree root{2, nullptr, nullptr};
    root.left = std::make_unique<app::Tree>(app::Tree{1, nullptr, nullptr});
    root.right = std::make_unique<app::Tree>(app::Tree{3, nullptr, nullptr});
    root.right->right = std::make_unique<app::Tree>(app::Tree{4, nullptr, nullptr});

    TEST_CHECK_EQ(deep_size_of(root), 4 * sizeof(app::Tree));

    std::cout << "[TEST] OK\n";
}

void test_memory_usage_adapter() {
    std::cout << "[TEST] memory_usage() supplies the children size..." << std::endl;

    app::Arena arena{1 << 16};
    TEST_CHECK_EQ(deep_size_of(arena), sizeof(app::Arena) + (1u << 16));

    std::vector<std::unique_ptr<app::Arena>> arenas;
    arenas.push_back(std::make_unique<app::Arena>(100));
    arenas.push_back(std::make_unique<app::Arena>(200));

    Context ctx;
    TEST_CHECK_EQ(deep_size_of_children(arenas, ctx),
                  arenas.capacity() * sizeof(std::unique_ptr<app::Arena>)
                  + 2 * sizeof(app::Arena) + 300);

    footprint total{};
    total.add(arena);
    total.add_dynamic(*arenas[0]);
    TEST_CHECK_EQ(total.static_bytes, sizeof(app::Arena));
    TEST_CHECK_EQ(total.dynamic_bytes, (1u << 16) + sizeof(app::Arena) + 100);

    std::cout << "[TEST] OK\n";
}

void test_hand_written_member() {
    std::cout << "[TEST] Hand-written member with a declared opaque field..." << std::endl;

    app::LogFile f{"/var/log/example-application/output.log"};
    TEST_CHECK_EQ(deep_size_of(f), sizeof(app::LogFile) + heap_of(f.path()) + BUFSIZ);

    std::cout << "[TEST] OK\n";
}

void test_fixed_fields() {
    std::cout << "[TEST] DEEPSIZE_FIXED charges the declared bytes..." << std::endl;

    app::Handle h{"/var/log/example-application/output.log", nullptr};
    TEST_CHECK_EQ(deep_size_of(h), sizeof(app::Handle) + heap_of(h.path) + BUFSIZ);

    app::Counters c{3, &h, std::vector<std::uint32_t>(8)};
    TEST_CHECK_EQ(deep_size_of(c),
                  sizeof(app::Counters) + c.buckets.capacity() * sizeof(std::uint32_t));

    std::cout << "[TEST] OK\n";
}

void test_every_field_is_listed() {
    std::cout << "[TEST] Field count of derived aggregates..." << std::endl;

    static_assert(detail::aggregate_arity<app::Sample>() == 2);
    static_assert(detail::aggregate_arity<app::Order>() == 4);
    static_assert(detail::aggregate_arity<app::Message>() == 2);
    static_assert(detail::aggregate_arity<app::Tree>() == 3);
    static_assert(detail::aggregate_arity<app::Handle>() == 2);
    static_assert(detail::aggregate_arity<app::Counters>() == 3);

    // a list that drops a field is refused
    static_assert(detail::lists_every_field<app::Handle>(2));
    static_assert(!detail::lists_every_field<app::Handle>(1));
    static_assert(!detail::lists_every_field<app::Order>(3));

    // classes with private state are not checked
    static_assert(detail::lists_every_field<app::LogFile>(1));

    std::cout << "[TEST] OK\n";
}

void test_unknown_types_are_rejected() {
    std::cout << "[TEST] Unknown element types are not Sizable..." << std::endl;

    static_assert(Sizable<app::Sample>);
    static_assert(Sizable<app::Message>);
    static_assert(Sizable<std::vector<app::Order>>);
    static_assert(!Sizable<NotSizable>);
    static_assert(!Sizable<std::vector<NotSizable>>);
    static_assert(!Sizable<std::unique_ptr<NotSizable>>);
    static_assert(!Sizable<char*>);
    static_assert(!Sizable<void*>);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_derived_struct();
    test_nested_struct();
    test_sum_type();
    test_recursive_type();
    test_memory_usage_adapter();
    test_hand_written_member();
    test_fixed_fields();
    test_every_field_is_listed();
    test_unknown_types_are_rejected();

    std::cout << "[TEST] ALL DERIVE TESTS PASSED!\n";
    return 0;
}
