#pragma once

#include "mesh/Model.h"

#include <filesystem>
#include <string>

namespace io
{

class ModelImporter
{
public:
    ModelImporter() = default;

    bool load(const std::filesystem::path& file,
              mesh::Model& outModel,
              std::string& error) const;
};

} // namespace io
