// context.hpp - Safe path resolution over context values and loop scope frames
#pragma once
#include "stencil/value.hpp"
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace stencil {

// Resolve a dotted path (`user.address.street`, `items.0.name`) against `ctx`.
// Each segment is a mapping key or a numeric sequence index. Returns nullptr when any
// segment is missing, indexes a scalar, or is out of range. Never throws.
value_ptr resolve(const value_ptr& ctx, std::string_view path);

// As resolve, returning `fallback` when the path is not found.
value_ptr resolve_or(const value_ptr& ctx, std::string_view path, value_ptr fallback);

// Step one segment down from `v`. nullptr when not navigable.
value_ptr step(const value_ptr& v, std::string_view segment);

// A chain of binding frames layered over a root snapshot. Child scopes refer to their parent,
// so a child must not outlive it; the renderer keeps them on the call stack.
class Scope {
public:
    using Bindings = std::map<std::string, value_ptr, std::less<>>;

    explicit Scope(value_ptr root): root_(std::move(root)) {}
    Scope(const Scope& parent, Bindings bindings): parent_(&parent), root_(parent.root_), bindings_(std::move(bindings)) {}

    // First segment is looked up innermost frame outward, then in the root snapshot.
    value_ptr resolve(std::string_view path) const;

    // Binding visible from this frame, nullptr if no frame binds `name`.
    value_ptr binding(std::string_view name) const;

    const value_ptr& root() const { return root_; }
    const Scope* parent() const { return parent_; }
    size_t depth() const { return parent_ ? parent_->depth() + 1 : 0; }

private:
    const Scope* parent_ = nullptr;
    value_ptr root_;
    Bindings bindings_;
};

} // namespace stencil
