#pragma once

#include "kiln/domain.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kiln {

enum class ScopeKind : uint8_t {
    Variable,
    Function,
    Class,
    Method,
    Property,
    Arrow,
};

enum class AnonymousKind : uint8_t { Arrow, Function, Class };

/** @brief Placement of one definition as decided by the PathTracker. */
struct RegisteredPath {
    std::string ast_path;
    bool is_top_level = false;
    std::optional<std::string> root_binding; ///< Name of the enclosing module-root declaration.
};

/**
 * @brief Assigns canonical ast paths from enter/exit/definition events.
 *
 * The tracker knows nothing about syntax trees; both parser backends drive it with the same
 * event sequence for the same source. Anonymous segments are numbered per immediate
 * enclosing scope, the module root included. Paths that collide within one module get
 * `#2`, `#3`, ... suffixes in registration order.
 */
class PathTracker {
public:
    /**
     * @brief Pushes a named scope.
     * @param binding True for module-root declarations (`const x`, `function f`, `class C`)
     *        that can carry an export binding.
     */
    void enter(std::string_view segment, ScopeKind kind, bool binding = false);

    /** @brief Pushes an auto-named scope (`_arrow_N`, `function#N`, `class#N`). */
    void enter_anonymous(AnonymousKind kind);

    void exit();

    /** @brief Records a definition at the current position and returns its unique path. */
    RegisteredPath register_definition();

    size_t depth() const {
        return stack_.size();
    }

    /**
     * @brief Identity of the class field whose initializer encloses the current position, if
     * any. Stays the same for as long as that field's scope is open.
     */
    std::optional<uint32_t> class_field() const;

private:
    struct Counters {
        std::array<uint32_t, 3> anonymous{}; ///< Indexed by AnonymousKind.
        uint32_t calls = 0;
    };

    struct Scope {
        std::string segment;
        ScopeKind kind;
        bool binding;
        uint32_t serial;
        Counters counters;
    };

    Counters &current_counters() {
        return stack_.empty() ? root_ : stack_.back().counters;
    }

    std::string unique_path(std::string path);

    std::vector<Scope> stack_;
    uint32_t next_serial_ = 0;
    Counters root_;
    std::unordered_set<std::string> used_;
};

/**
 * @brief Local name -> exported name for direct named exports.
 *
 * Type-only exports, re-exports and default exports are left out.
 */
class ExportBindings {
public:
    explicit ExportBindings(const std::vector<ModuleExport> &exports);

    std::optional<std::string> find(std::string_view local) const;

private:
    std::unordered_map<std::string, std::string> by_local_;
};

} // namespace kiln
