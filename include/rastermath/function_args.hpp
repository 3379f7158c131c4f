#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rastermath {

using ArgValue = std::variant<bool, int64_t, double, std::string>;

// Named parameters handed to a block function, in insertion order. The engine
// never interprets them. Integers are stored as int64_t and text as
// std::string; pass those types explicitly to set().
class FunctionArgs {
public:
    using Entry = std::pair<std::string, ArgValue>;

    // Replaces an existing value in place, appends otherwise.
    FunctionArgs& set(const std::string& name, ArgValue value);

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    template<typename T>
    const T& get(const std::string& name) const {
        const ArgValue* value = find(name);
        if (!value) throw std::out_of_range("No function argument named " + name);
        if (!std::holds_alternative<T>(*value)) {
            throw std::invalid_argument("Function argument " + name + " has another type");
        }
        return std::get<T>(*value);
    }

    template<typename T>
    T get_or(const std::string& name, T fallback) const {
        const ArgValue* value = find(name);
        if (!value || !std::holds_alternative<T>(*value)) return fallback;
        return std::get<T>(*value);
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    const ArgValue* find(const std::string& name) const;

    std::vector<Entry> entries_;
};

} // namespace rastermath
