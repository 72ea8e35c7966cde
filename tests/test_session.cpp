#include "kiln/session.hpp"

#include "kiln/artifact.hpp"
#include "kiln/canonical_id.hpp"

#include "temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

using namespace kiln;
using kiln::test::TempDir;

namespace fs = std::filesystem;

namespace {

constexpr std::string_view A_SOURCE = R"(import { gql } from "@/graphql-system";
import { bFragment } from "./b";

export const aQuery = gql.default(({ query }) =>
  query.operation({ name: "A" }, ({ f }) => [f.user()(() => [bFragment.spread()])])
);
)";

constexpr std::string_view B_SOURCE = R"(import { gql } from "@/graphql-system";

export const bFragment = gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.id()]));
)";

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_verbosity(Verbosity::Quiet);
        a_ = dir_.write("src/a.ts", A_SOURCE);
        b_ = dir_.write("src/b.ts", B_SOURCE);
    }

    BuilderConfig config() const {
        BuilderConfig config;
        config.root = dir_.str();
        config.include = {"src/**/*.ts"};
        return config;
    }

    FileTrackerState persisted() const {
        return FileTracker(config().cache_path()).load_state();
    }

    void touch(const std::string &path, std::string_view extra) const {
        auto before = fs::last_write_time(path);
        dir_.write(fs::relative(path, dir_.path()).generic_string(),
                   std::string(path == a_ ? A_SOURCE : B_SOURCE) + std::string(extra));
        fs::last_write_time(path, before + std::chrono::seconds(2));
    }

    CanonicalId a_id() const {
        return encode_canonical_id(a_, "aQuery");
    }
    CanonicalId b_id() const {
        return encode_canonical_id(b_, "bFragment");
    }

    TempDir dir_;
    std::string a_;
    std::string b_;
};

class ThrowingEvaluator final : public ElementEvaluator {
public:
    explicit ThrowingEvaluator(std::string ast_path) : ast_path_(std::move(ast_path)) {
    }

    FactoryResult<ElementResult> evaluate(const GraphNode &node, const std::vector<ElementResult> &deps) override {
        if (node.summary.definition.ast_path == ast_path_)
            throw std::runtime_error("factory rejected");
        return std::get<ElementResult>(inner_->evaluate(node, deps));
    }

private:
    std::string ast_path_;
    std::unique_ptr<ElementEvaluator> inner_ = make_summary_evaluator();
};

// Resolves every element on another thread.
class DeferredEvaluator final : public ElementEvaluator {
public:
    FactoryResult<ElementResult> evaluate(const GraphNode &node, const std::vector<ElementResult> &deps) override {
        ElementResult ready = std::get<ElementResult>(inner_->evaluate(node, deps));
        return std::async(std::launch::async, [ready] {
                   std::this_thread::sleep_for(std::chrono::milliseconds(50));
                   return ready;
               }).share();
    }

private:
    std::unique_ptr<ElementEvaluator> inner_ = make_summary_evaluator();
};

} // namespace

TEST_F(SessionTest, FirstBuildAnalysesEverything) {
    BuilderSession session(config());
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value()) << format_error(artifact.error());

    ASSERT_EQ(artifact->elements.size(), 2u);
    const ElementResult &a = artifact->elements.at(a_id());
    const ElementResult &b = artifact->elements.at(b_id());
    EXPECT_EQ(a.kind, "operation");
    EXPECT_EQ(b.kind, "fragment");
    EXPECT_EQ(a.schema, "default");
    EXPECT_EQ(a.export_binding, "aQuery");
    EXPECT_EQ(a.dependencies, (std::vector<CanonicalId>{b_id()}));
    EXPECT_TRUE(b.dependencies.empty());

    EXPECT_EQ(artifact->report.cache, (CacheStats{.hits = 0, .misses = 2}));
    EXPECT_EQ(artifact->report.definition_counts.at("operation"), 1u);
    EXPECT_EQ(artifact->report.definition_counts.at("fragment"), 1u);
    EXPECT_TRUE(artifact->report.warnings.empty());

    EXPECT_EQ(persisted().files.size(), 2u);
    SessionSnapshot snapshot = session.snapshot();
    EXPECT_EQ(snapshot.node_count, 2u);
    EXPECT_EQ(snapshot.module_count, 2u);
    EXPECT_TRUE(snapshot.has_artifact);
}

TEST_F(SessionTest, UnchangedRebuildReusesArtifact) {
    BuilderSession session(config());
    auto first = session.build();
    ASSERT_TRUE(first.has_value());
    auto second = session.build();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->elements, first->elements);
    EXPECT_EQ(second->report.cache, first->report.cache);
}

TEST_F(SessionTest, OnlyTouchedFileIsReprocessed) {
    BuilderSession session(config());
    ASSERT_TRUE(session.build().has_value());
    FileMetadata b_before = persisted().files.at(b_);
    FileMetadata a_before = persisted().files.at(a_);

    touch(a_, "// edited\n");
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value()) << format_error(artifact.error());

    EXPECT_EQ(artifact->report.cache, (CacheStats{.hits = 1, .misses = 1}));
    EXPECT_EQ(artifact->elements.size(), 2u);
    FileTrackerState after = persisted();
    EXPECT_EQ(after.files.at(b_), b_before);
    EXPECT_NE(after.files.at(a_), a_before);
}

TEST_F(SessionTest, RestartedSessionUsesPersistedTracker) {
    {
        BuilderSession session(config());
        ASSERT_TRUE(session.build().has_value());
    }
    BuilderSession restarted(config());
    auto artifact = restarted.build();
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->elements.size(), 2u);
    EXPECT_EQ(artifact->report.cache.misses, 2u);
}

TEST_F(SessionTest, ForceReanalysesEverything) {
    BuilderSession session(config());
    ASSERT_TRUE(session.build().has_value());
    auto artifact = session.build({.force = true});
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->report.cache, (CacheStats{.hits = 0, .misses = 2}));
}

TEST_F(SessionTest, RemovedFileDropsItsNodes) {
    BuilderSession session(config());
    ASSERT_TRUE(session.build().has_value());

    fs::remove(b_);
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value()) << format_error(artifact.error());
    ASSERT_EQ(artifact->elements.size(), 1u);
    EXPECT_TRUE(artifact->elements.at(a_id()).dependencies.empty());
    EXPECT_FALSE(session.index().contains(b_));
    EXPECT_FALSE(persisted().files.contains(b_));
}

TEST_F(SessionTest, NewDefinitionsAppearAndVanish) {
    BuilderSession session(config());
    ASSERT_TRUE(session.build().has_value());

    touch(b_, "export const extra = gql.default(({ fragment }) => fragment.Post({}, ({ f }) => [f.id()]));\n");
    auto grown = session.build();
    ASSERT_TRUE(grown.has_value());
    EXPECT_EQ(grown->elements.size(), 3u);
    EXPECT_TRUE(grown->elements.contains(encode_canonical_id(b_, "extra")));

    touch(b_, "");
    auto shrunk = session.build();
    ASSERT_TRUE(shrunk.has_value());
    EXPECT_EQ(shrunk->elements.size(), 2u);
    EXPECT_EQ(session.graph().size(), 2u);
}

TEST_F(SessionTest, ParseFailureKeepsPreviousDefinitions) {
    BuilderSession session(config());
    ASSERT_TRUE(session.build().has_value());
    FileMetadata a_before = persisted().files.at(a_);

    dir_.write("src/a.ts", "export const broken = (;\n");
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value()) << format_error(artifact.error());
    EXPECT_EQ(artifact->elements.size(), 2u);
    EXPECT_TRUE(artifact->elements.contains(a_id()));
    ASSERT_EQ(artifact->report.warnings.size(), 1u);
    EXPECT_NE(artifact->report.warnings[0].find(a_), std::string::npos);
    EXPECT_EQ(persisted().files.at(a_), a_before);
}

TEST_F(SessionTest, NewBrokenFileIsNotTracked) {
    BuilderSession session(config());
    std::string c = dir_.write("src/c.ts", "const x = (;\n");
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->elements.size(), 2u);
    EXPECT_EQ(artifact->report.warnings.size(), 1u);
    EXPECT_FALSE(persisted().files.contains(c));

    auto again = session.build();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->report.warnings.size(), 1u);
}

TEST_F(SessionTest, StreamAnalyzerProducesSameArtifact) {
    BuilderSession tree(config());
    auto expected = tree.build();
    ASSERT_TRUE(expected.has_value());

    BuilderConfig stream_config = config();
    stream_config.analyzer = "stream";
    stream_config.cache_dir = ".cache/kiln-stream";
    BuilderSession stream(stream_config);
    auto actual = stream.build();
    ASSERT_TRUE(actual.has_value());
    EXPECT_EQ(actual->elements, expected->elements);
}

TEST_F(SessionTest, CycleIsReported) {
    dir_.write("src/a.ts", R"(import { gql } from "@/graphql-system";
import { bFragment } from "./b";
export const aFragment = gql.default(({ fragment }) => fragment.User({}, () => [bFragment.spread()]));
)");
    dir_.write("src/b.ts", R"(import { gql } from "@/graphql-system";
import { aFragment } from "./a";
export const bFragment = gql.default(({ fragment }) => fragment.User({}, () => [aFragment.spread()]));
)");

    BuilderSession session(config());
    auto artifact = session.build();
    ASSERT_FALSE(artifact.has_value());
    EXPECT_EQ(artifact.error().code, BuildError::Code::CircularDependency);
    EXPECT_EQ(artifact.error().canonical_id, encode_canonical_id(a_, "aFragment"));
    EXPECT_NE(artifact.error().message.find(" -> "), std::string::npos);
    EXPECT_FALSE(session.snapshot().has_artifact);
    EXPECT_TRUE(persisted().files.empty());
}

TEST_F(SessionTest, FactoryParametersShadowImportedNames) {
    dir_.write("src/a.ts", R"(import { gql } from "@/graphql-system";
import { post } from "./b";
export const user = gql.default(({ fragment: post }) => post.User({}, ({ f }) => [f.id()]));
)");
    dir_.write("src/b.ts", R"(import { gql } from "@/graphql-system";
import { user } from "./a";
export const post = gql.default(({ fragment: user }) => user.Post({}, ({ f }) => [f.id()]));
)");

    BuilderSession session(config());
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value()) << format_error(artifact.error());
    ASSERT_EQ(artifact->elements.size(), 2u);
    EXPECT_TRUE(artifact->elements.at(encode_canonical_id(a_, "user")).dependencies.empty());
    EXPECT_TRUE(artifact->elements.at(encode_canonical_id(b_, "post")).dependencies.empty());
}

TEST_F(SessionTest, RelativeRootIsResolvedAgainstWorkingDirectory) {
    BuilderConfig relative = config();
    relative.root = dir_.path().lexically_relative(fs::current_path()).generic_string();
    ASSERT_FALSE(relative.root.starts_with('/'));

    BuilderSession session(relative);
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value()) << format_error(artifact.error());
    EXPECT_EQ(artifact->elements.size(), 2u);
    EXPECT_TRUE(artifact->elements.contains(a_id()));
    EXPECT_TRUE(artifact->elements.contains(b_id()));
    EXPECT_EQ(persisted().files.size(), 2u);
}

TEST_F(SessionTest, DiagnosticsBecomeWarnings) {
    std::string c = dir_.write("src/c.ts", R"(import { gql } from "@/graphql-system";
export const missing = gql.default();
)");

    BuilderSession session(config());
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value()) << format_error(artifact.error());
    EXPECT_EQ(artifact->elements.size(), 2u);
    ASSERT_EQ(artifact->report.warnings.size(), 1u);
    EXPECT_EQ(artifact->report.warnings[0].find(c + ":2:24: [MISSING_ARGUMENT]"), 0u);
    EXPECT_TRUE(persisted().files.contains(c));
}

TEST_F(SessionTest, EvaluationFailureIsFatal) {
    BuilderSession session(config(), {.evaluator = std::make_shared<ThrowingEvaluator>("bFragment")});
    auto artifact = session.build();
    ASSERT_FALSE(artifact.has_value());
    EXPECT_EQ(artifact.error().code, BuildError::Code::EvaluationFailed);
    EXPECT_EQ(artifact.error().canonical_id, b_id());
    EXPECT_EQ(artifact.error().file_path, b_);
    EXPECT_NE(artifact.error().message.find("factory rejected"), std::string::npos);
    EXPECT_EQ(session.snapshot().node_count, 0u);
    EXPECT_FALSE(session.artifact().has_value());
    EXPECT_TRUE(persisted().files.empty());
}

TEST_F(SessionTest, AsyncModeWaitsForDeferredElements) {
    BuilderSession session(config(), {.evaluator = std::make_shared<DeferredEvaluator>()});
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value()) << format_error(artifact.error());
    EXPECT_EQ(artifact->elements.size(), 2u);
}

TEST_F(SessionTest, SyncModeRejectsDeferredElements) {
    BuilderSession session(config(), {.evaluator = std::make_shared<DeferredEvaluator>()});
    auto artifact = session.build({.mode = BuildMode::Sync});
    ASSERT_FALSE(artifact.has_value());
    EXPECT_EQ(artifact.error().code, BuildError::Code::WouldSuspend);
    EXPECT_TRUE(artifact.error().canonical_id.has_value());
}

TEST_F(SessionTest, MissingEntriesFail) {
    BuilderConfig empty = config();
    empty.include = {"lib/**/*.ts"};
    BuilderSession session(empty);
    auto artifact = session.build();
    ASSERT_FALSE(artifact.has_value());
    EXPECT_EQ(artifact.error().code, BuildError::Code::EntryResolution);
}

TEST_F(SessionTest, ArtifactAccessorAndReset) {
    BuilderSession session(config());
    auto none = session.artifact();
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, BuildError::Code::NoArtifact);

    ASSERT_TRUE(session.build().has_value());
    EXPECT_TRUE(session.artifact().has_value());

    session.reset();
    SessionSnapshot snapshot = session.snapshot();
    EXPECT_EQ(snapshot.node_count, 0u);
    EXPECT_EQ(snapshot.module_count, 0u);
    EXPECT_FALSE(snapshot.has_artifact);

    auto rebuilt = session.build();
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ(rebuilt->report.cache.misses, 2u);
}

TEST_F(SessionTest, ArtifactSerializesToJson) {
    BuilderSession session(config());
    auto artifact = session.build();
    ASSERT_TRUE(artifact.has_value());

    nlohmann::json doc = artifact_to_json(*artifact);
    const auto &element = doc["elements"][a_id()];
    EXPECT_EQ(element["astPath"], "aQuery");
    EXPECT_EQ(element["kind"], "operation");
    EXPECT_EQ(element["exportBinding"], "aQuery");
    EXPECT_EQ(element["dependencies"][0], b_id());
    EXPECT_EQ(doc["report"]["cache"]["misses"], 2);
    EXPECT_EQ(doc["report"]["definitionCounts"]["fragment"], 1);
    EXPECT_TRUE(doc["report"]["warnings"].empty());
}

TEST(SessionEndToEndTest, TouchingOneFileLeavesTheOtherAlone) {
    set_verbosity(Verbosity::Quiet);
    TempDir dir;
    std::string a = dir.write("src/a.ts", R"(import { gql } from "@/graphql-system";
export const userFragment = gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.id()]));
)");
    std::string b = dir.write("src/b.ts", "export const answer = 42;\n");

    BuilderConfig config;
    config.root = dir.str();
    config.include = {"src/**/*.ts"};
    BuilderSession session(config);

    auto first = session.build();
    ASSERT_TRUE(first.has_value()) << format_error(first.error());
    EXPECT_EQ(first->elements.size(), 1u);
    EXPECT_EQ(first->report.cache, (CacheStats{.hits = 0, .misses = 1}));
    FileTracker tracker(config.cache_path());
    FileMetadata b_before = tracker.load_state().files.at(b);

    auto stamp = fs::last_write_time(a);
    dir.write("src/a.ts", R"(import { gql } from "@/graphql-system";
export const userFragment = gql.default(({ fragment }) => fragment.User({}, ({ f }) => [f.id(), f.name()]));
)");
    fs::last_write_time(a, stamp + std::chrono::seconds(2));

    auto second = session.build();
    ASSERT_TRUE(second.has_value()) << format_error(second.error());
    EXPECT_EQ(second->elements.size(), 1u);
    EXPECT_EQ(second->report.cache, (CacheStats{.hits = 0, .misses = 1}));
    EXPECT_NE(second->elements.begin()->second.expression.find("f.name()"), std::string::npos);
    EXPECT_EQ(tracker.load_state().files.at(b), b_before);
}

TEST(BuildErrorTest, FormatsCodeAndLocation) {
    BuildError located{.code = BuildError::Code::CircularDependency,
                       .file_path = "/p/a.ts",
                       .canonical_id = "/p/a.ts::x",
                       .message = "circular dependency: x -> x"};
    EXPECT_EQ(format_error(located), "[CIRCULAR_DEPENDENCY] circular dependency: x -> x (at /p/a.ts::x)");

    BuildError by_file{.code = BuildError::Code::EntryResolution, .file_path = "/p", .message = "nothing matched"};
    EXPECT_EQ(format_error(by_file), "[ENTRY_RESOLUTION] nothing matched (in /p)");
}
