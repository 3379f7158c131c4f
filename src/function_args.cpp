#include "rastermath/function_args.hpp"

namespace rastermath {

FunctionArgs& FunctionArgs::set(const std::string& name, ArgValue value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = std::move(value);
            return *this;
        }
    }
    entries_.emplace_back(name, std::move(value));
    return *this;
}

const ArgValue* FunctionArgs::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return &entry.second;
    }
    return nullptr;
}

} // namespace rastermath
