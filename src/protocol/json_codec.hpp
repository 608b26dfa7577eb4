#pragma once

#include <nlohmann/json.hpp>
#include "protocol/annotation_contract.hpp"
#include "protocol/upload_contract.hpp"

namespace uploader::protocol {

nlohmann::json to_json(const TaskIdentification& identification);
nlohmann::json to_json(const ArtifactsUpload& upload);
// Chunk bytes are not embedded; only the path and size are recorded.
nlohmann::json to_json(const ArtifactChunk& chunk);
nlohmann::json to_json(const Annotation& annotation);
nlohmann::json to_json(const ReportAnnotationsRequest& request);

}  // namespace uploader::protocol
