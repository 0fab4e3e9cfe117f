#include "tricurate/yaml_emitters.h"

#include <chrono>

YAML::Emitter& tricurate::operator<<(YAML::Emitter& emitter, const curation_report& report)
{
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "total_tracks" << YAML::Value << report.total_tracks;
    emitter << YAML::Key << "accepted" << YAML::Value << report.accepted;
    emitter << YAML::Key << "under_determined" << YAML::Value << report.under_determined;
    emitter << YAML::Key << "cheirality_failures" << YAML::Value << report.cheirality_failures;
    emitter << YAML::Key << "reprojection_rejections" << YAML::Value << report.reprojection_rejections;
    emitter << YAML::Key << "insufficient_support" << YAML::Value << report.insufficient_support;
    emitter << YAML::Key << "track_length_histogram" << YAML::Value << YAML::Flow << YAML::BeginMap;
    for (const auto& [length, n] : report.track_length_histogram)
    {
        emitter << YAML::Key << length << YAML::Value << n;
    }
    emitter << YAML::EndMap;
    emitter << YAML::Key << "mean_reprojection_error" << YAML::Value << YAML::Precision(4) << report.mean_reprojection_error;
    emitter << YAML::Key << "median_reprojection_error" << YAML::Value << YAML::Precision(4) << report.median_reprojection_error;
    emitter << YAML::Key << "elapsed" << YAML::Value << YAML::Precision(4) << std::chrono::duration<double>(report.elapsed).count();
    emitter << YAML::EndMap;

    return emitter;
}

YAML::Emitter& tricurate::operator<<(YAML::Emitter& emitter, const landmark& landmark)
{
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "point" << YAML::Value << YAML::Flow << YAML::BeginSeq << landmark.point().x << landmark.point().y << landmark.point().z << YAML::EndSeq;
    emitter << YAML::Key << "measurements" << YAML::Value << YAML::BeginSeq;
    for (const auto& m : landmark.measurements())
    {
        emitter << YAML::Flow << YAML::BeginSeq << m.camera_index << m.pixel.x << m.pixel.y << YAML::EndSeq;
    }
    emitter << YAML::EndSeq;
    emitter << YAML::EndMap;

    return emitter;
}

YAML::Emitter& tricurate::operator<<(YAML::Emitter& emitter, const std::vector<landmark>& landmarks)
{
    emitter << YAML::BeginSeq;
    for (const auto& landmark : landmarks)
    {
        emitter << landmark;
    }
    emitter << YAML::EndSeq;

    return emitter;
}
