#include "protocol/json_codec.hpp"

namespace uploader::protocol {

using nlohmann::json;

json to_json(const TaskIdentification& identification) {
    json payload;
    payload["task_id"] = identification.task_id;
    payload["has_secret"] = !identification.secret.empty();
    return payload;
}

json to_json(const ArtifactsUpload& upload) {
    json payload;
    payload["task_identification"] = to_json(upload.task_identification);
    payload["name"] = upload.name;
    payload["type"] = upload.type;
    payload["format"] = upload.format;
    return payload;
}

json to_json(const ArtifactChunk& chunk) {
    json payload;
    payload["artifact_path"] = chunk.artifact_path;
    payload["size"] = chunk.data.size();
    return payload;
}

json to_json(const Annotation& annotation) {
    json payload;
    payload["type"] = to_string(annotation.type);
    payload["level"] = to_string(annotation.level);
    payload["message"] = annotation.message;
    payload["raw_details"] = annotation.raw_details;
    payload["fully_qualified_name"] = annotation.fully_qualified_name;
    if (annotation.location.has_value()) {
        const auto& location = annotation.location.value();
        payload["location"] = {{"path", location.path},
                               {"start_line", location.start_line},
                               {"end_line", location.end_line},
                               {"start_column", location.start_column},
                               {"end_column", location.end_column}};
    } else {
        payload["location"] = nullptr;
    }
    return payload;
}

json to_json(const ReportAnnotationsRequest& request) {
    json payload;
    payload["task_identification"] = to_json(request.task_identification);
    payload["annotations"] = json::array();
    for (const auto& annotation : request.annotations) {
        payload["annotations"].push_back(to_json(annotation));
    }
    return payload;
}

}  // namespace uploader::protocol
