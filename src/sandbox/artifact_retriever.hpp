#pragma once

#include <string>

#include "docker/container_runtime.hpp"

namespace kalibox::sandbox {

struct Artifact {
    std::string path;
    bool present = false;
    std::string content;
};

class ArtifactRetriever {
public:
    // A missing path, or an archive with no file in it, yields present=false.
    // Content is decoded as UTF-8 with invalid sequences substituted.
    static Artifact Fetch(kalibox::docker::ContainerRuntime& runtime,
                          const std::string& container_id,
                          const std::string& path);
};

}  // namespace kalibox::sandbox
