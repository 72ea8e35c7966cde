#include "kiln/lexer.hpp"
#include "kiln/parser.hpp"

#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

using namespace kiln;

namespace {

AnalyzerOptions test_options() {
    return {.is_entry_import = [](std::string_view, std::string_view specifier) {
                return specifier == "@/graphql-system";
            },
            .entry_binding = "gql"};
}

struct Fixture {
    const char *file;
    const char *source;
};

const Fixture DISAMBIGUATION{"/app/src/fragments.ts", R"(
import { gql } from "@/graphql-system";

export const fragment1 = gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.id()]));
export const fragment2 = gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.name()]));

export const factory = {
  fragment1: gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.id()])),
  fragment2: gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.name()])),
};
)"};

const Fixture SCOPES{"/app/src/scopes.ts", R"(
import { gql } from "@/graphql-system";

gql.default(({ fragment }) => fragment.User({}, () => []));
gql.default(({ fragment }) => fragment.Post({}, () => []));

const pair = [
  gql.default(({ query }) => query.operation({ name: "A" }, () => [])),
  gql.default(({ query }) => query.operation({ name: "B" }, () => [])),
];

export const make = () => gql.default(({ fragment }) => fragment.User({}, () => []));

const legacy = function () {
  return gql.default(({ fragment }) => fragment.User({}, () => []));
};

export class Repository {
  static fragment = gql.default(({ fragment }) => fragment.User({}, () => []));
  load() {
    return gql.default(({ query }) => query.operation({ name: "Load" }, () => []));
  }
}

const Anonymous = class {
  build() {
    return gql.default(({ fragment }) => fragment.Post({}, () => []));
  }
};
)"};

const Fixture ALIASES{"/app/src/aliases.ts", R"(
import { gql as g } from "@/graphql-system";
import { gql } from "./not-the-system";
import type { gql as typed } from "@/graphql-system";
import { other } from "@/graphql-system";

export const viaAlias = g.default(({ fragment }) => fragment.User({}, () => []));
export const viaLookalike = gql.default(({ fragment }) => fragment.User({}, () => []));
export const viaType = typed.default(({ fragment }) => fragment.User({}, () => []));
export const viaOther = other.default(({ fragment }) => fragment.User({}, () => []));
)"};

const Fixture SHAPES{"/app/src/shapes.ts", R"(
import { gql } from "@/graphql-system";

export const noFactory = gql.default(config);
export const twoParams = gql.default((a, b) => a);
export const extraArg = gql.default((m) => m, options);
export const optional = gql?.default((m) => m);
export const computed = gql["default"]((m) => m);
export const ok = gql.default(function (m) { return m; });
)"};

const Fixture REFS{"/app/src/combined.ts", R"(
import { gql } from "@/graphql-system";
import { userFragment } from "./user";
import type { Shape } from "./shape";
import * as posts from "./posts";

const base = gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.id()]));

export const combined = gql.default(({ query }) =>
  query.operation({ name: "Combined" }, ({ f }) => [
    f.user()(() => [userFragment.spread(), base.spread()]),
    f.posts()(() => [posts.postFragment.spread()]),
    { userFragment: 1 },
  ])
);
)"};

const Fixture EXPORTS{"/app/src/exports.ts", R"(
import { gql } from "@/graphql-system";

const internal = gql.default(({ fragment }) => fragment.User({}, () => []));
const hidden = gql.default(({ fragment }) => fragment.Post({}, () => []));

export { internal as publicFragment };
export default hidden;
export { remote } from "./remote";
export * from "./all";
)"};

const Fixture TYPESCRIPT{"/app/src/typed.ts", R"(
import { gql } from "@/graphql-system";
import type { Client } from "./client";

interface UserRow {
  id: string;
  tags: Array<string>;
}

type Loader<T> = (id: string) => Promise<T>;

enum Role {
  Admin,
  Member,
}

export abstract class Service<T extends object> implements Loader<T> {
  private readonly cache: Map<string, T> = new Map();

  constructor(private client: Client) {}

  abstract load(id: string): Promise<T>;

  get size(): number {
    return this.cache.size;
  }

  protected query = gql.default(({ query }) => query.operation({ name: "Service" }, ({ f }) => [f.id()]));
}

export function select<T>(rows: T[], pick: (row: T) => boolean): T[] {
  const matched = rows.filter((row) => pick(row));
  for (const row of matched) {
    if (!row) continue;
  }
  return matched as T[];
}

export const userQuery = gql.default(({ query }) =>
  query.operation({ name: "User", variables: { id: "ID!" } }, ({ f, $ }) => [f.user({ id: $.id })(({ f }) => [f.id()])])
);

const roles: Record<string, Role> = { admin: Role.Admin };
let counter = 0;
while (counter < 2) {
  counter += 1;
}
)"};

const Fixture COMPONENT{"/app/src/View.tsx", R"(
import { gql } from "@/graphql-system";
import { useFragment } from "./hooks";

export const viewFragment = gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.name()]));

export const View = ({ user }) => {
  const data = useFragment(viewFragment, user);
  const items = [1, 2, 3];
  return (
    <div className="view">
      <h1>{data.name}</h1>
      <ul>
        {items.map((i) => (
          <li key={i}>{i}</li>
        ))}
      </ul>
    </div>
  );
};

export const Panel = () => {
  const panelFragment = gql.default(({ fragment }) => fragment.Post({}, ({ f }) => [f.title()]));
  return <section>{panelFragment ? "ready" : "empty"}</section>;
};
)"};

const Fixture DIAGNOSTICS{"/app/src/misuse.ts", R"(
import gqlDefault from "@/graphql-system";
import * as everything from "@/graphql-system";
import { gql } from "@/graphql-system";

export const direct = gql(({ fragment }) => fragment.User({}, () => []));
export const missing = gql.default();
export const spread = gql.default(...factories);
export const literal = gql.default("query { id }");
export const dynamic = (flag || gql).default(({ fragment }) => fragment.User({}, () => []));
export const valid = gql.default(({ fragment }) => fragment.User({}, () => []));

export class Holder {
  static first = gql.default(({ fragment }) => fragment.User({}, () => []));
  static nested = {
    inner: gql.default(({ fragment }) => fragment.Post({}, () => [])),
    other: gql.default(({ fragment }) => fragment.Post({}, () => [])),
  };
}
)"};

const Fixture SHADOWING{"/app/src/shadowing.ts", R"(
import { gql } from "@/graphql-system";
import { userFragment } from "./user";

const post = gql.default(({ fragment }) => fragment.Post({}, ({ f }) => [f.id()]));

export const user = gql.default(({ fragment: post }) => post.User({}, ({ f }) => [f.id()]));

export const mixed = gql.default(({ query }) => {
  const userFragment = query.local();
  for (const post of []) {
    userFragment.spread(post);
  }
  return query.operation({ name: "Mixed" }, ({ f }) => [f.user()(() => [userFragment.spread()]), post.spread()]);
});

export const named = gql.default(function (userFragment) {
  return [userFragment, post];
});
)"};

const Fixture ROOT_OBJECTS{"/app/src/root-objects.ts", R"(
import { gql } from "@/graphql-system";

export default {
  a: gql.default(({ fragment }) => fragment.User({}, () => [])),
  nested: { b: gql.default(({ fragment }) => fragment.User({}, () => [])) },
};

const { c } = {
  c: gql.default(({ fragment }) => fragment.Post({}, () => [])),
};
)"};

const std::vector<Fixture> ALL_FIXTURES = {DISAMBIGUATION, SCOPES, ALIASES,   SHAPES,      REFS,        EXPORTS,
                                           TYPESCRIPT,     COMPONENT, DIAGNOSTICS, SHADOWING, ROOT_OBJECTS};

std::vector<DiagnosticCode> codes(const ModuleAnalysis &module) {
    std::vector<DiagnosticCode> out;
    for (const auto &d : module.diagnostics)
        out.push_back(d.code);
    return out;
}

std::vector<std::string> ast_paths(const ModuleAnalysis &module) {
    std::vector<std::string> out;
    for (const auto &def : module.definitions)
        out.push_back(def.ast_path);
    return out;
}

class ParserBackendTest : public ::testing::TestWithParam<std::string> {
protected:
    ModuleAnalysis analyze(const Fixture &fixture) const {
        auto adapter = make_adapter(GetParam(), test_options());
        EXPECT_NE(adapter, nullptr);
        auto result = adapter->analyze(fixture.file, fixture.source);
        EXPECT_TRUE(result.has_value()) << fixture.file << ": "
                                        << (result ? std::string() : result.error().message);
        return result ? *result : ModuleAnalysis{};
    }
};

} // namespace

TEST_P(ParserBackendTest, DisambiguatesRepeatedNames) {
    ModuleAnalysis module = analyze(DISAMBIGUATION);
    ASSERT_EQ(module.definitions.size(), 4u);
    EXPECT_EQ(ast_paths(module),
              (std::vector<std::string>{"fragment1", "fragment2", "factory.fragment1", "factory.fragment2"}));

    const auto &defs = module.definitions;
    EXPECT_TRUE(defs[0].is_top_level);
    EXPECT_TRUE(defs[0].is_exported);
    EXPECT_EQ(defs[0].export_binding, "fragment1");
    EXPECT_TRUE(defs[1].is_top_level);
    EXPECT_EQ(defs[1].export_binding, "fragment2");
    EXPECT_FALSE(defs[2].is_top_level);
    EXPECT_FALSE(defs[2].is_exported);
    EXPECT_FALSE(defs[2].export_binding.has_value());
    EXPECT_FALSE(defs[3].is_top_level);
}

TEST_P(ParserBackendTest, RecordsCallDetails) {
    ModuleAnalysis module = analyze(DISAMBIGUATION);
    ASSERT_FALSE(module.definitions.empty());
    const Definition &def = module.definitions.front();
    EXPECT_EQ(def.schema, "default");
    EXPECT_EQ(def.expression, "gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.id()]))");
    EXPECT_EQ(def.location.line, 4u);
    EXPECT_EQ(def.location.column, 26u);
    EXPECT_TRUE(def.dependency_refs.empty());
}

TEST_P(ParserBackendTest, NamesEveryScopeKind) {
    ModuleAnalysis module = analyze(SCOPES);
    EXPECT_EQ(ast_paths(module), (std::vector<std::string>{
                                     "_anonymous_0",
                                     "_anonymous_1",
                                     "pair",
                                     "pair#2",
                                     "make._arrow_0",
                                     "legacy.function#0",
                                     "Repository.load",
                                     "Anonymous.class#0.build",
                                 }));
    ASSERT_EQ(module.definitions.size(), 8u);
    EXPECT_FALSE(module.definitions[0].is_top_level);
    EXPECT_TRUE(module.definitions[2].is_top_level);
    EXPECT_TRUE(module.definitions[3].is_top_level);
    EXPECT_FALSE(module.definitions[2].is_exported);
    EXPECT_FALSE(module.definitions[4].is_top_level);
    EXPECT_FALSE(module.definitions[4].is_exported);
}

TEST_P(ParserBackendTest, FollowsAliasedEntryImportsOnly) {
    ModuleAnalysis module = analyze(ALIASES);
    ASSERT_EQ(module.definitions.size(), 1u);
    EXPECT_EQ(module.definitions[0].ast_path, "viaAlias");
    EXPECT_EQ(module.definitions[0].export_binding, "viaAlias");
    EXPECT_TRUE(module.definitions[0].expression.starts_with("g.default("));

    ASSERT_EQ(module.imports.size(), 4u);
    EXPECT_EQ(module.imports[0].imported, "gql");
    EXPECT_EQ(module.imports[0].local, "g");
    EXPECT_EQ(module.imports[0].source, "@/graphql-system");
    EXPECT_TRUE(module.imports[2].is_type_only);
    EXPECT_FALSE(module.imports[3].is_type_only);
}

TEST_P(ParserBackendTest, IgnoresCallsThatDoNotTakeOneFactory) {
    ModuleAnalysis module = analyze(SHAPES);
    ASSERT_EQ(module.definitions.size(), 1u);
    EXPECT_EQ(module.definitions[0].ast_path, "ok");
    EXPECT_EQ(module.definitions[0].expression, "gql.default(function (m) { return m; })");
}

TEST_P(ParserBackendTest, DiagnosesRejectedCallShapes) {
    ModuleAnalysis module = analyze(SHAPES);
    ASSERT_EQ(codes(module), (std::vector<DiagnosticCode>{DiagnosticCode::InvalidArgumentType,
                                                          DiagnosticCode::ExtraArguments,
                                                          DiagnosticCode::OptionalChaining,
                                                          DiagnosticCode::ComputedProperty}));
    EXPECT_EQ(module.diagnostics[0].location, (SourceLocation{4, 26}));
    EXPECT_NE(module.diagnostics[0].message.find("unknown"), std::string::npos);
    EXPECT_EQ(module.diagnostics[1].location, (SourceLocation{6, 25}));
    EXPECT_NE(module.diagnostics[1].message.find("1 more"), std::string::npos);
    EXPECT_EQ(module.diagnostics[2].location.line, 7u);
    EXPECT_EQ(module.diagnostics[3].location.line, 8u);
    for (const auto &d : module.diagnostics)
        EXPECT_EQ(d.severity, Severity::Error);
}

TEST_P(ParserBackendTest, DiagnosesEntryImportMisuse) {
    ModuleAnalysis module = analyze(DIAGNOSTICS);
    EXPECT_EQ(ast_paths(module), (std::vector<std::string>{"valid"}));
    ASSERT_EQ(codes(module), (std::vector<DiagnosticCode>{
                                 DiagnosticCode::DefaultImport,
                                 DiagnosticCode::StarImport,
                                 DiagnosticCode::NonMemberCallee,
                                 DiagnosticCode::MissingArgument,
                                 DiagnosticCode::SpreadArgument,
                                 DiagnosticCode::InvalidArgumentType,
                                 DiagnosticCode::DynamicCallee,
                                 DiagnosticCode::ClassProperty,
                                 DiagnosticCode::ClassProperty,
                             }));

    const auto &d = module.diagnostics;
    EXPECT_EQ(d[0].severity, Severity::Warning);
    EXPECT_EQ(d[0].location.line, 2u);
    EXPECT_NE(d[0].message.find("gqlDefault"), std::string::npos);
    EXPECT_EQ(d[1].severity, Severity::Warning);
    EXPECT_NE(d[1].message.find("everything"), std::string::npos);
    EXPECT_EQ(d[2].location, (SourceLocation{6, 23}));
    EXPECT_EQ(d[3].location.line, 7u);
    EXPECT_EQ(d[4].location.line, 8u);
    EXPECT_EQ(d[5].location.line, 9u);
    EXPECT_NE(d[5].message.find("string"), std::string::npos);
    EXPECT_EQ(d[6].location, (SourceLocation{10, 24}));
    EXPECT_EQ(d[7].location.line, 14u);
    EXPECT_EQ(d[8].location.line, 16u);
}

TEST_P(ParserBackendTest, SkipsClassFieldInitializers) {
    ModuleAnalysis module = analyze(SCOPES);
    for (const auto &def : module.definitions)
        EXPECT_FALSE(def.ast_path.starts_with("Repository.fragment")) << def.ast_path;
    ASSERT_EQ(codes(module), (std::vector<DiagnosticCode>{DiagnosticCode::ClassProperty}));
    EXPECT_EQ(module.diagnostics[0].location, (SourceLocation{19, 21}));
}

TEST_P(ParserBackendTest, ValidModulesHaveNoDiagnostics) {
    for (const Fixture &fixture : {DISAMBIGUATION, REFS, EXPORTS, COMPONENT, SHADOWING, ROOT_OBJECTS})
        EXPECT_TRUE(analyze(fixture).diagnostics.empty()) << fixture.file;
}

TEST_P(ParserBackendTest, CollectsDependencyRefs) {
    ModuleAnalysis module = analyze(REFS);
    ASSERT_EQ(module.definitions.size(), 2u);
    EXPECT_TRUE(module.definitions[0].dependency_refs.empty());
    EXPECT_EQ(module.definitions[1].ast_path, "combined");
    EXPECT_EQ(module.definitions[1].dependency_refs, (std::vector<std::string>{"userFragment", "base", "posts"}));

    ASSERT_EQ(module.imports.size(), 4u);
    EXPECT_EQ(module.imports[3].kind, ImportKind::Namespace);
    EXPECT_EQ(module.imports[3].imported, "*");
    EXPECT_EQ(module.imports[3].local, "posts");
}

TEST_P(ParserBackendTest, IgnoresNamesShadowedInsideTheFactory) {
    ModuleAnalysis module = analyze(SHADOWING);
    ASSERT_EQ(ast_paths(module), (std::vector<std::string>{"post", "user", "mixed", "named"}));
    EXPECT_TRUE(module.definitions[0].dependency_refs.empty());
    EXPECT_TRUE(module.definitions[1].dependency_refs.empty());
    EXPECT_EQ(module.definitions[2].dependency_refs, (std::vector<std::string>{"post"}));
    EXPECT_EQ(module.definitions[3].dependency_refs, (std::vector<std::string>{"post"}));
}

TEST_P(ParserBackendTest, ResolvesExportBindings) {
    ModuleAnalysis module = analyze(EXPORTS);
    ASSERT_EQ(module.definitions.size(), 2u);
    EXPECT_EQ(module.definitions[0].ast_path, "internal");
    EXPECT_TRUE(module.definitions[0].is_exported);
    EXPECT_EQ(module.definitions[0].export_binding, "publicFragment");
    EXPECT_EQ(module.definitions[1].ast_path, "hidden");
    EXPECT_TRUE(module.definitions[1].is_top_level);
    EXPECT_FALSE(module.definitions[1].is_exported);

    ASSERT_EQ(module.exports.size(), 4u);
    EXPECT_EQ(module.exports[0].kind, ExportKind::Named);
    EXPECT_EQ(module.exports[0].exported, "publicFragment");
    EXPECT_EQ(module.exports[0].local, "internal");
    EXPECT_EQ(module.exports[1].exported, "default");
    EXPECT_EQ(module.exports[1].local, "hidden");
    EXPECT_EQ(module.exports[2].kind, ExportKind::Reexport);
    EXPECT_EQ(module.exports[2].source, "./remote");
    EXPECT_EQ(module.exports[3].exported, "*");
    EXPECT_EQ(module.exports[3].source, "./all");
}

TEST_P(ParserBackendTest, TreatsDirectMembersOfRootObjectsAsTopLevel) {
    ModuleAnalysis module = analyze(ROOT_OBJECTS);
    ASSERT_EQ(ast_paths(module), (std::vector<std::string>{"a", "nested.b", "c"}));
    EXPECT_TRUE(module.definitions[0].is_top_level);
    EXPECT_FALSE(module.definitions[1].is_top_level);
    EXPECT_TRUE(module.definitions[2].is_top_level);
    for (const auto &def : module.definitions) {
        EXPECT_FALSE(def.is_exported) << def.ast_path;
        EXPECT_FALSE(def.export_binding.has_value()) << def.ast_path;
    }
}

TEST_P(ParserBackendTest, HandlesTypeScriptSyntax) {
    ModuleAnalysis module = analyze(TYPESCRIPT);
    EXPECT_EQ(ast_paths(module), (std::vector<std::string>{"userQuery"}));
    ASSERT_EQ(codes(module), (std::vector<DiagnosticCode>{DiagnosticCode::ClassProperty}));
    EXPECT_EQ(module.diagnostics[0].location.line, 28u);
}

TEST_P(ParserBackendTest, HandlesJsx) {
    ModuleAnalysis module = analyze(COMPONENT);
    EXPECT_EQ(ast_paths(module), (std::vector<std::string>{"viewFragment", "Panel._arrow_0.panelFragment"}));
}

TEST_P(ParserBackendTest, ReportsUnbalancedSource) {
    auto adapter = make_adapter(GetParam(), test_options());
    ASSERT_NE(adapter, nullptr);
    auto result = adapter->analyze("/app/src/broken.ts", "const a = 1;\nconst b = (1 + 2;\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().file_path, "/app/src/broken.ts");
    EXPECT_EQ(result.error().line, 2u);
    EXPECT_FALSE(result.error().message.empty());
}

TEST_P(ParserBackendTest, RejectsMalformedExpressions) {
    auto adapter = make_adapter(GetParam(), test_options());
    ASSERT_NE(adapter, nullptr);
    auto result = adapter->analyze("/app/src/broken.ts", "import { gql } from \"@/graphql-system\";\nconst x = 1 +;\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().file_path, "/app/src/broken.ts");
    EXPECT_EQ(result.error().line, 2u);
}

TEST_P(ParserBackendTest, AcceptsEmptyModule) {
    auto adapter = make_adapter(GetParam(), test_options());
    ASSERT_NE(adapter, nullptr);
    auto result = adapter->analyze("/app/src/empty.ts", "");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->definitions.empty());
}

INSTANTIATE_TEST_SUITE_P(Backends, ParserBackendTest, ::testing::Values("tree", "stream"),
                         [](const ::testing::TestParamInfo<std::string> &info) { return info.param; });

TEST(ParserConformanceTest, BackendsAgreeOnEveryFixture) {
    auto tree = make_tree_adapter(test_options());
    auto stream = make_stream_adapter(test_options());
    for (const Fixture &fixture : ALL_FIXTURES) {
        auto a = tree->analyze(fixture.file, fixture.source);
        auto b = stream->analyze(fixture.file, fixture.source);
        ASSERT_TRUE(a.has_value()) << fixture.file << ": " << a.error().message;
        ASSERT_TRUE(b.has_value()) << fixture.file << ": " << b.error().message;
        EXPECT_EQ(ast_paths(*a), ast_paths(*b)) << fixture.file;
        ASSERT_EQ(a->definitions.size(), b->definitions.size()) << fixture.file;
        for (size_t i = 0; i < a->definitions.size(); ++i)
            EXPECT_EQ(a->definitions[i], b->definitions[i]) << fixture.file << " " << a->definitions[i].ast_path;
        EXPECT_EQ(a->imports, b->imports) << fixture.file;
        EXPECT_EQ(a->exports, b->exports) << fixture.file;
        EXPECT_EQ(a->diagnostics, b->diagnostics) << fixture.file;
    }
}

TEST(ParserConformanceTest, BackendsRejectTheSameSources) {
    auto tree = make_tree_adapter(test_options());
    auto stream = make_stream_adapter(test_options());
    for (const char *source : {"const x = 1 +;\n", "const y = (a, b;\n", "let = = 2;\n", "foo(,);\n",
                               "export const z = gql.default(({ f }) => f.User({} () => []));\n"}) {
        auto a = tree->analyze("/app/src/broken.ts", source);
        auto b = stream->analyze("/app/src/broken.ts", source);
        EXPECT_EQ(a.has_value(), b.has_value()) << source;
        if (!a && !b) {
            EXPECT_EQ(a.error().line, b.error().line) << source;
            EXPECT_EQ(a.error().column, b.error().column) << source;
        }
    }
}

TEST(LexerTest, TokenStreamOwnsTokensAndPartners) {
    auto ts = tokenize("f(a[1], `x${y}`);", false);
    ASSERT_TRUE(ts.has_value()) << ts.error().message;
    EXPECT_EQ(ts->at(0).text, "f");
    EXPECT_EQ(ts->partner(1), ts->size() - 3);
    EXPECT_EQ(ts->partner(3), 5u);
    EXPECT_EQ(ts->at(ts->size() - 2).text, ";");

    auto broken = tokenize("f(a[1);\n", false);
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().line, 1u);
}

TEST(ParserFactoryTest, KnowsBothBackends) {
    EXPECT_EQ(make_adapter("tree", test_options())->name(), "tree");
    EXPECT_EQ(make_adapter("stream", test_options())->name(), "stream");
    EXPECT_EQ(make_adapter("swc", test_options()), nullptr);
    EXPECT_EQ(adapter_names().size(), 2u);
}

TEST(ParserConformanceTest, RepeatedAnalysisIsDeterministic) {
    for (std::string_view name : adapter_names()) {
        auto adapter = make_adapter(name, test_options());
        for (const Fixture &fixture : ALL_FIXTURES) {
            auto first = adapter->analyze(fixture.file, fixture.source);
            auto second = adapter->analyze(fixture.file, fixture.source);
            ASSERT_TRUE(first.has_value() && second.has_value()) << name << " " << fixture.file;
            EXPECT_EQ(first->definitions, second->definitions) << name << " " << fixture.file;
        }
    }
}
