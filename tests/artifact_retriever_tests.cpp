#include "sandbox/artifact_retriever.hpp"

#include <gtest/gtest.h>

#include "fakes.hpp"

using kalibox::sandbox::ArtifactRetriever;
using kalibox::testing::FakeRuntime;

namespace {

std::string StartContainer(FakeRuntime& runtime) {
    kalibox::docker::ContainerSpec spec;
    spec.image = "dawnyawn-kali-agent";
    const auto id = runtime.CreateContainer(spec);
    runtime.StartContainer(id);
    return id;
}

}  // namespace

TEST(ArtifactRetrieverTests, ReturnsFileContent) {
    FakeRuntime runtime;
    const auto id = StartContainer(runtime);
    runtime.WriteFile(id, "/tmp/out.txt", "hello\n");

    const auto artifact = ArtifactRetriever::Fetch(runtime, id, "/tmp/out.txt");
    EXPECT_TRUE(artifact.present);
    EXPECT_EQ(artifact.path, "/tmp/out.txt");
    EXPECT_EQ(artifact.content, "hello\n");
}

TEST(ArtifactRetrieverTests, MissingPathIsAbsentNotAnError) {
    FakeRuntime runtime;
    const auto id = StartContainer(runtime);

    const auto artifact = ArtifactRetriever::Fetch(runtime, id, "/tmp/missing.txt");
    EXPECT_FALSE(artifact.present);
    EXPECT_EQ(artifact.content, "");
}

TEST(ArtifactRetrieverTests, EmptyArchiveIsAbsent) {
    FakeRuntime runtime;
    const auto id = StartContainer(runtime);
    runtime.MarkEmptyArchive(id, "/tmp/partial.txt");

    const auto artifact = ArtifactRetriever::Fetch(runtime, id, "/tmp/partial.txt");
    EXPECT_FALSE(artifact.present);
    EXPECT_EQ(artifact.content, "");
}

TEST(ArtifactRetrieverTests, SymlinkIsNotReturnedAsContent) {
    FakeRuntime runtime;
    const auto id = StartContainer(runtime);
    runtime.SetArchive(id, "/tmp/link.txt",
                       kalibox::testing::TarBuilder().AddSymlink("link.txt", "/etc/passwd").Finish());

    const auto artifact = ArtifactRetriever::Fetch(runtime, id, "/tmp/link.txt");
    EXPECT_FALSE(artifact.present);
    EXPECT_EQ(artifact.content, "");
}

TEST(ArtifactRetrieverTests, InvalidBytesAreSubstituted) {
    FakeRuntime runtime;
    const auto id = StartContainer(runtime);
    runtime.WriteFile(id, "/tmp/bin.out", std::string("ok\xFF\xFE end"));

    const auto artifact = ArtifactRetriever::Fetch(runtime, id, "/tmp/bin.out");
    EXPECT_TRUE(artifact.present);
    EXPECT_EQ(artifact.content, "ok\xEF\xBF\xBD\xEF\xBF\xBD end");
}

TEST(ArtifactRetrieverTests, EmptyFileIsPresent) {
    FakeRuntime runtime;
    const auto id = StartContainer(runtime);
    runtime.WriteFile(id, "/tmp/empty.txt", "");

    const auto artifact = ArtifactRetriever::Fetch(runtime, id, "/tmp/empty.txt");
    EXPECT_TRUE(artifact.present);
    EXPECT_EQ(artifact.content, "");
}

TEST(ArtifactRetrieverTests, VanishedContainerPropagates) {
    FakeRuntime runtime;
    EXPECT_THROW(ArtifactRetriever::Fetch(runtime, "deadbeef", "/tmp/out.txt"),
                 kalibox::docker::NotFoundError);
}
