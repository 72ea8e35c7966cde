#include "kiln/path_tracker.hpp"

#include <format>
#include <stdexcept>

namespace kiln {

namespace {

std::string_view anonymous_prefix(AnonymousKind kind) {
    switch (kind) {
    case AnonymousKind::Arrow:
        return "_arrow_";
    case AnonymousKind::Function:
        return "function#";
    case AnonymousKind::Class:
        return "class#";
    }
    return "_anonymous_";
}

ScopeKind scope_kind(AnonymousKind kind) {
    switch (kind) {
    case AnonymousKind::Arrow:
        return ScopeKind::Arrow;
    case AnonymousKind::Function:
        return ScopeKind::Function;
    case AnonymousKind::Class:
        return ScopeKind::Class;
    }
    return ScopeKind::Arrow;
}

} // namespace

void PathTracker::enter(std::string_view segment, ScopeKind kind, bool binding) {
    stack_.push_back({std::string(segment), kind, binding && stack_.empty(), next_serial_++, {}});
}

void PathTracker::enter_anonymous(AnonymousKind kind) {
    uint32_t &counter = current_counters().anonymous[static_cast<size_t>(kind)];
    std::string segment = std::format("{}{}", anonymous_prefix(kind), counter++);
    stack_.push_back({std::move(segment), scope_kind(kind), false, next_serial_++, {}});
}

void PathTracker::exit() {
    if (stack_.empty())
        throw std::logic_error("PathTracker::exit on an empty scope stack");
    stack_.pop_back();
}

std::string PathTracker::unique_path(std::string path) {
    if (used_.insert(path).second)
        return path;
    for (uint32_t n = 2;; ++n) {
        std::string candidate = std::format("{}#{}", path, n);
        if (used_.insert(candidate).second)
            return candidate;
    }
}

RegisteredPath PathTracker::register_definition() {
    RegisteredPath out;
    if (stack_.empty()) {
        out.ast_path = unique_path(std::format("_anonymous_{}", root_.calls++));
        return out;
    }

    std::string path;
    for (const Scope &scope : stack_) {
        if (!path.empty())
            path += '.';
        path += scope.segment;
    }
    out.ast_path = unique_path(std::move(path));
    out.is_top_level = stack_.size() == 1;
    if (stack_.front().binding)
        out.root_binding = stack_.front().segment;
    return out;
}

std::optional<uint32_t> PathTracker::class_field() const {
    for (size_t i = stack_.size(); i-- > 1;) {
        if (stack_[i].kind == ScopeKind::Property && stack_[i - 1].kind == ScopeKind::Class)
            return stack_[i].serial;
    }
    return std::nullopt;
}

ExportBindings::ExportBindings(const std::vector<ModuleExport> &exports) {
    for (const ModuleExport &e : exports) {
        if (e.kind != ExportKind::Named || e.is_type_only || !e.local || e.exported == "default")
            continue;
        by_local_.try_emplace(*e.local, e.exported);
    }
}

std::optional<std::string> ExportBindings::find(std::string_view local) const {
    if (auto it = by_local_.find(std::string(local)); it != by_local_.end())
        return it->second;
    return std::nullopt;
}

} // namespace kiln
