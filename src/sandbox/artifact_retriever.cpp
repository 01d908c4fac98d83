#include "sandbox/artifact_retriever.hpp"

#include "archive/tar_reader.hpp"
#include "utils/logging.hpp"
#include "utils/text.hpp"

namespace kalibox::sandbox {

Artifact ArtifactRetriever::Fetch(kalibox::docker::ContainerRuntime& runtime,
                                  const std::string& container_id,
                                  const std::string& path) {
    Artifact artifact;
    artifact.path = path;

    const auto stream = runtime.GetArchive(container_id, path);
    if (!stream) {
        utils::Info("sandbox", "no output file at " + path);
        return artifact;
    }

    const auto entries = kalibox::archive::ReadTar(*stream);
    for (const auto& entry : entries) {
        if (entry.type != kalibox::archive::EntryType::kFile) {
            continue;
        }
        artifact.present = true;
        artifact.content = utils::SanitizeUtf8(entry.data);
        utils::Debug("sandbox", "fetched " + path + " (" + std::to_string(entry.data.size()) + " bytes)");
        return artifact;
    }

    utils::Info("sandbox", "archive for " + path + " holds no file");
    return artifact;
}

}  // namespace kalibox::sandbox
