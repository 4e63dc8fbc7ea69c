#pragma once

#include "backend/CatalogService.hpp"
#include "model/Catalog.hpp"
#include <nlohmann/json.hpp>

// nlohmann/json finds these through ADL, so they live beside the types

namespace lorchestre::model {

void to_json(nlohmann::json& j, const LyricLine& line);
void to_json(nlohmann::json& j, const Color& color);
void to_json(nlohmann::json& j, const Track& track);
void to_json(nlohmann::json& j, const Album& album);
void to_json(nlohmann::json& j, const Playlist& playlist);
void to_json(nlohmann::json& j, const Catalog& catalog);

}  // namespace lorchestre::model

namespace lorchestre::backend {

void to_json(nlohmann::json& j, const Diagnostic& diagnostic);
void to_json(nlohmann::json& j, const RebuildReport& report);

}  // namespace lorchestre::backend
