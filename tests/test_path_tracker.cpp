#include "kiln/path_tracker.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>

using namespace kiln;

TEST(PathTrackerTest, RootCallsAreNumbered) {
    PathTracker tracker;
    EXPECT_EQ(tracker.register_definition().ast_path, "_anonymous_0");
    EXPECT_EQ(tracker.register_definition().ast_path, "_anonymous_1");
}

TEST(PathTrackerTest, JoinsScopesWithDots) {
    PathTracker tracker;
    tracker.enter("factory", ScopeKind::Variable, true);
    tracker.enter("fragment1", ScopeKind::Property);
    RegisteredPath first = tracker.register_definition();
    tracker.exit();
    tracker.enter("fragment2", ScopeKind::Property);
    RegisteredPath second = tracker.register_definition();

    EXPECT_EQ(first.ast_path, "factory.fragment1");
    EXPECT_EQ(second.ast_path, "factory.fragment2");
    EXPECT_FALSE(first.is_top_level);
    EXPECT_EQ(first.root_binding, "factory");
}

TEST(PathTrackerTest, TopLevelMeansOneScopeDeep) {
    PathTracker tracker;
    tracker.enter("userFragment", ScopeKind::Variable, true);
    RegisteredPath top = tracker.register_definition();
    tracker.exit();

    tracker.enter("holder", ScopeKind::Property);
    RegisteredPath property = tracker.register_definition();
    tracker.enter("inner", ScopeKind::Property);
    RegisteredPath nested = tracker.register_definition();
    tracker.exit();
    tracker.exit();

    EXPECT_TRUE(top.is_top_level);
    EXPECT_EQ(top.root_binding, "userFragment");
    EXPECT_TRUE(property.is_top_level);
    EXPECT_FALSE(property.root_binding.has_value());
    EXPECT_FALSE(nested.is_top_level);
}

TEST(PathTrackerTest, ReportsEnclosingClassField) {
    PathTracker tracker;
    EXPECT_FALSE(tracker.class_field().has_value());

    tracker.enter("Repository", ScopeKind::Class, true);
    tracker.enter("load", ScopeKind::Method);
    EXPECT_FALSE(tracker.class_field().has_value());
    tracker.exit();

    tracker.enter("fragment", ScopeKind::Property);
    std::optional<uint32_t> field = tracker.class_field();
    ASSERT_TRUE(field.has_value());
    tracker.enter("inner", ScopeKind::Property);
    tracker.enter_anonymous(AnonymousKind::Arrow);
    EXPECT_EQ(tracker.class_field(), field);
    tracker.exit();
    tracker.exit();
    tracker.exit();

    tracker.enter("other", ScopeKind::Property);
    ASSERT_TRUE(tracker.class_field().has_value());
    EXPECT_NE(tracker.class_field(), field);
    tracker.exit();
    tracker.exit();

    tracker.enter("factory", ScopeKind::Variable, true);
    tracker.enter("fragment", ScopeKind::Property);
    EXPECT_FALSE(tracker.class_field().has_value());
}

TEST(PathTrackerTest, BindingIgnoredBelowRoot) {
    PathTracker tracker;
    tracker.enter("outer", ScopeKind::Function, true);
    tracker.enter("inner", ScopeKind::Variable, true);
    RegisteredPath path = tracker.register_definition();
    EXPECT_EQ(path.ast_path, "outer.inner");
    EXPECT_FALSE(path.is_top_level);
    EXPECT_EQ(path.root_binding, "outer");
}

TEST(PathTrackerTest, CollisionsGetSuffixes) {
    PathTracker tracker;
    tracker.enter("pair", ScopeKind::Variable, true);
    EXPECT_EQ(tracker.register_definition().ast_path, "pair");
    EXPECT_EQ(tracker.register_definition().ast_path, "pair#2");
    EXPECT_EQ(tracker.register_definition().ast_path, "pair#3");
}

TEST(PathTrackerTest, AnonymousScopesCountPerParent) {
    PathTracker tracker;
    tracker.enter("make", ScopeKind::Variable, true);
    tracker.enter_anonymous(AnonymousKind::Arrow);
    EXPECT_EQ(tracker.register_definition().ast_path, "make._arrow_0");
    tracker.exit();
    tracker.enter_anonymous(AnonymousKind::Arrow);
    EXPECT_EQ(tracker.register_definition().ast_path, "make._arrow_1");
    tracker.exit();
    tracker.enter_anonymous(AnonymousKind::Function);
    EXPECT_EQ(tracker.register_definition().ast_path, "make.function#0");
    tracker.exit();
    tracker.exit();

    tracker.enter("other", ScopeKind::Variable, true);
    tracker.enter_anonymous(AnonymousKind::Arrow);
    EXPECT_EQ(tracker.register_definition().ast_path, "other._arrow_0");
    tracker.exit();
    tracker.exit();

    tracker.enter_anonymous(AnonymousKind::Class);
    EXPECT_EQ(tracker.register_definition().ast_path, "class#0");
}

TEST(PathTrackerTest, ExitOnEmptyStackThrows) {
    PathTracker tracker;
    EXPECT_THROW(tracker.exit(), std::logic_error);
}

TEST(ExportBindingsTest, MapsDirectNamedExports) {
    std::vector<ModuleExport> exports = {
        {.kind = ExportKind::Named, .exported = "userFragment", .local = "userFragment"},
        {.kind = ExportKind::Named, .exported = "renamed", .local = "internal"},
        {.kind = ExportKind::Named, .exported = "default", .local = "hidden"},
        {.kind = ExportKind::Named, .exported = "Shape", .local = "Shape", .is_type_only = true},
        {.kind = ExportKind::Reexport, .exported = "remote", .local = "remote", .source = "./remote"},
    };
    ExportBindings bindings(exports);
    EXPECT_EQ(bindings.find("userFragment"), "userFragment");
    EXPECT_EQ(bindings.find("internal"), "renamed");
    EXPECT_FALSE(bindings.find("hidden").has_value());
    EXPECT_FALSE(bindings.find("Shape").has_value());
    EXPECT_FALSE(bindings.find("remote").has_value());
}
