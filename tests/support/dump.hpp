#pragma once

/// @file dump.hpp
/// @brief Test-only JSON writer used to check parse(dump(v)) == v.
///
/// The parser keeps string bytes raw (escapes are not decoded), so the
/// writer emits them raw as well. Numbers use "%.17g", which reads back
/// to the same double.

#include <rdjson/rdjson.hpp>

#include <cstdio>
#include <string>
#include <string_view>

namespace rdjson::test {

class Writer {
public:
    /// @param indent -1 = compact, >= 0 = one entry per line
    explicit Writer(int indent = -1) noexcept : indent_(indent) {}

    std::string write(const Value& v) {
        out_.clear();
        level_ = 0;
        write_value(v);
        return out_;
    }

private:
    std::string out_;
    int indent_;
    int level_ = 0;

    bool pretty() const noexcept { return indent_ >= 0; }

    void write_newline() {
        if (pretty()) out_.push_back('\n');
    }

    void write_indent() {
        if (pretty()) out_.append(static_cast<size_t>(level_ * indent_), ' ');
    }

    void write_value(const Value& v) {
        switch (v.type()) {
            case Type::Null:   out_ += "null"; break;
            case Type::Bool:   out_ += v.as_bool() ? "true" : "false"; break;
            case Type::Number: write_number(v.as_number()); break;
            case Type::String: write_string(v.as_string_view()); break;
            case Type::Array:  write_array(v.as_array()); break;
            case Type::Object: write_object(v.as_object()); break;
        }
    }

    void write_number(double d) {
        char buf[32];
        const int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
        if (n > 0) out_.append(buf, static_cast<size_t>(n));
    }

    void write_string(std::string_view s) {
        out_.push_back('"');
        out_.append(s.data(), s.size());
        out_.push_back('"');
    }

    void write_array(const Array& arr) {
        if (arr.empty()) { out_ += "[]"; return; }
        out_.push_back('[');
        ++level_;
        write_newline();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) { out_.push_back(','); write_newline(); }
            write_indent();
            write_value(arr[i]);
        }
        --level_;
        write_newline();
        write_indent();
        out_.push_back(']');
    }

    void write_object(const Object& obj) {
        if (obj.empty()) { out_ += "{}"; return; }
        out_.push_back('{');
        ++level_;
        write_newline();
        bool first = true;
        for (const auto& [key, val] : obj) {
            if (!first) { out_.push_back(','); write_newline(); }
            first = false;
            write_indent();
            write_string(key);
            out_.push_back(':');
            if (pretty()) out_.push_back(' ');
            write_value(val);
        }
        --level_;
        write_newline();
        write_indent();
        out_.push_back('}');
    }
};

/// @brief Serialize @p v (compact by default).
inline std::string dump(const Value& v, int indent = -1) {
    return Writer(indent).write(v);
}

} // namespace rdjson::test
