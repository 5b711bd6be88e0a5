// -----------------------------------------------------------------------------
// Deriving the children size of user types
//
// A struct lists its fields once with DEEPSIZE_DERIVE, declaring the cost of
// an opaque handle with DEEPSIZE_FIXED. A class with private state writes its
// implementation by hand.
// -----------------------------------------------------------------------------
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "deepsize.hpp"

namespace app {

struct Sample {
    std::uint32_t a;
    std::unique_ptr<std::uint8_t> b;
};
DEEPSIZE_DERIVE(Sample, a, b)

struct Tag {
    std::string name;
    std::shared_ptr<Sample> payload;
};
DEEPSIZE_DERIVE(Tag, name, payload)

// The FILE buffer is owned by the C runtime and cannot be introspected
struct LogFile {
    std::string path;
    std::FILE* file;
};
DEEPSIZE_DERIVE(LogFile, path, DEEPSIZE_FIXED(file, BUFSIZ))

// Private state: the implementation is written by hand
class Journal {
public:
    explicit Journal(std::string name)
        : name_(std::move(name)) {}

    std::size_t deep_size_of_children(deepsize::Context& ctx) const {
        return deepsize::sum_children(ctx, name_, entries_);
    }

    void append(std::uint64_t seq) { entries_.push_back(seq); }

private:
    std::string name_;
    std::vector<std::uint64_t> entries_;
};

} // namespace app


int main() {
    using namespace deepsize;

    app::Sample sample{15, std::make_unique<std::uint8_t>(255)};
    std::cout << "[derive] Sample       : " << deep_size_of(sample)
              << " (sizeof " << sizeof(app::Sample) << " + 1)\n";

    auto shared = std::make_shared<app::Sample>(app::Sample{1, std::make_unique<std::uint8_t>(2)});
    std::vector<app::Tag> tags;
    tags.push_back({"first tag with a heap-allocated name", shared});
    tags.push_back({"second tag with a heap-allocated name", shared});
    std::cout << "[derive] Tags         : " << footprint_of(tags)
              << " (payload counted once)\n";

    app::LogFile log_file{"/var/log/example-application/output.log", nullptr};
    std::cout << "[derive] LogFile      : " << deep_size_of(log_file)
              << " (includes " << BUFSIZ << " declared bytes)\n";

    app::Journal journal{"orders"};
    for (std::uint64_t seq = 0; seq < 100; ++seq) journal.append(seq);
    std::cout << "[derive] Journal      : " << deep_size_of(journal) << "\n";

    return 0;
}
