#pragma once
#include "ppass/syntax/ast.hpp"
#include <functional>
#include <unordered_map>

namespace ppass::syntax {

// Pre-order walk over a syntax tree with visitors keyed by node kind.
//
// Visitors: signature void(node_ptr& slot, node* parent)
//   `slot` is the owning pointer inside the parent's children, so a visitor may replace the
//   node in place (see replace()). Traversal then continues into the children of whatever the
//   slot holds afterwards, which lets nested matches inside a replacement be visited too.
// Fallback: optional visitor invoked for kinds without a registered visitor.
class Transformer {
public:
    using VisitorFn = std::function<void(node_ptr& slot, node* parent)>;

    Transformer& add_visitor(node_kind kind, VisitorFn fn){
        visitors_[kind] = std::move(fn); return *this;
    }
    Transformer& on_unmatched(VisitorFn fn){ unmatched_ = std::move(fn); return *this; }

    void traverse(node_ptr& root){ traverse_impl(root, nullptr); }

private:
    std::unordered_map<node_kind, VisitorFn> visitors_;
    VisitorFn unmatched_{};

    void traverse_impl(node_ptr& slot, node* parent){
        if(!slot) return;
        auto it = visitors_.find(slot->kind);
        if(it != visitors_.end()) it->second(slot, parent);
        else if(unmatched_) unmatched_(slot, parent);
        if(!slot) return;
        node* self = slot.get();
        for(auto& child : self->children) traverse_impl(child, self);
    }
};

} // namespace ppass::syntax
