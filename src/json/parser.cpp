#include <filesystem>
#include <system_error>
#include <utility>

#include "simdjson.h"
#include "xxhash.h"

#include "deepsize/json/parser.hpp"
#include "deepsize/json/intern.hpp"
#include "deepsize/log/logger.hpp"


namespace deepsize::json {

namespace {

// Copies a simdjson DOM element into the owned model, depth first
class Builder {
public:
    explicit Builder(const ParseOptions& opts) noexcept
        : opts_(opts) {}

    [[nodiscard]] Error build(const simdjson::dom::element& el, value& out, std::size_t depth) {
        if (depth > opts_.max_depth) {
            return Error::DepthExceeded;
        }

        switch (el.type()) {
        case simdjson::dom::element_type::NULL_VALUE:
            out.data = std::monostate{};
            return Error::None;

        case simdjson::dom::element_type::BOOL: {
            bool b = false;
            if (el.get(b) != simdjson::SUCCESS) return Error::InvalidJson;
            out.data = b;
            return Error::None;
        }

        case simdjson::dom::element_type::INT64: {
            std::int64_t i = 0;
            if (el.get(i) != simdjson::SUCCESS) return Error::InvalidJson;
            out.data = i;
            return Error::None;
        }

        case simdjson::dom::element_type::UINT64: {
            std::uint64_t u = 0;
            if (el.get(u) != simdjson::SUCCESS) return Error::InvalidJson;
            out.data = u;
            return Error::None;
        }

        case simdjson::dom::element_type::DOUBLE: {
            double d = 0.0;
            if (el.get(d) != simdjson::SUCCESS) return Error::InvalidJson;
            out.data = d;
            return Error::None;
        }

        case simdjson::dom::element_type::STRING: {
            std::string_view sv;
            if (el.get(sv) != simdjson::SUCCESS) return Error::InvalidJson;
            out.data = make_text_(sv);
            return Error::None;
        }

        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array arr;
            if (el.get(arr) != simdjson::SUCCESS) return Error::InvalidJson;
            array items;
            items.reserve(arr.size());
            for (simdjson::dom::element child : arr) {
                value item;
                auto err = build(child, item, depth + 1);
                if (err != Error::None) return err;
                items.push_back(std::move(item));
            }
            out.data = std::move(items);
            return Error::None;
        }

        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object obj;
            if (el.get(obj) != simdjson::SUCCESS) return Error::InvalidJson;
            object members;
            members.reserve(obj.size());
            for (simdjson::dom::key_value_pair field : obj) {
                member m;
                m.key = make_text_(field.key);
                auto err = build(field.value, m.val, depth + 1);
                if (err != Error::None) return err;
                members.push_back(std::move(m));
            }
            out.data = std::move(members);
            return Error::None;
        }
        }
        return Error::InvalidJson;
    }

    [[nodiscard]] inline std::size_t interned() const noexcept { return pool_.count(); }

private:
    text make_text_(std::string_view sv) {
        if (opts_.intern_strings) {
            return text{pool_.intern(sv)};
        }
        return text{std::string(sv)};
    }

private:
    const ParseOptions& opts_;
    InternPool pool_;
};

[[nodiscard]] Error parse_padded(const simdjson::padded_string& json, const ParseOptions& opts, value& out) {
    // A default parser stops at 1024 levels; depth here is max_depth plus the root scope
    simdjson::dom::parser parser;
    auto err = parser.allocate(json.size(), opts.max_depth + 2);
    if (err != simdjson::SUCCESS) {
        DS_ERROR("[json] cannot allocate parser for " << json.size()
                 << " bytes, depth " << opts.max_depth << ": " << simdjson::error_message(err));
        return Error::AllocationFailed;
    }

    simdjson::dom::element root;
    err = parser.parse(json).get(root);
    if (err == simdjson::DEPTH_ERROR) {
        DS_DEBUG("[json] " << simdjson::error_message(err));
        return Error::DepthExceeded;
    }
    if (err != simdjson::SUCCESS) {
        DS_DEBUG("[json] " << simdjson::error_message(err));
        return Error::InvalidJson;
    }

    Builder builder{opts};
    value doc;
    auto result = builder.build(root, doc, 0);
    if (result != Error::None) {
        return result;
    }
    if (opts.intern_strings) {
        DS_DEBUG("[json] interned " << builder.interned() << " distinct strings");
    }
    out = std::move(doc);
    return Error::None;
}

} // namespace


Error parse(std::string_view json, const ParseOptions& opts, value& out) {
    simdjson::padded_string padded(json);
    return parse_padded(padded, opts, out);
}

Error load_file(const std::string& path, const ParseOptions& opts, value& out, std::uint64_t& digest) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::FileNotFound;
    }

    simdjson::padded_string content;
    auto err = simdjson::padded_string::load(path).get(content);
    if (err != simdjson::SUCCESS) {
        DS_DEBUG("[json] " << path << ": " << simdjson::error_message(err));
        return Error::ReadFailed;
    }

    digest = XXH64(content.data(), content.size(), 0);
    return parse_padded(content, opts, out);
}

} // namespace deepsize::json
