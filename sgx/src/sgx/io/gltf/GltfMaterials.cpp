// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sgx/io/gltf/GltfMaterials.hpp"
#include "sgx/core/Logging.hpp"
// fmt
#include <fmt/format.h>
// std
#include <string>
#include <type_traits>

namespace sgx::io::gltf {

using namespace sgx::core;
using namespace sgx::math;

static bool isNumberArray(const nlohmann::json &value, size_t minSize)
{
  if (!value.is_array() || value.size() < minSize)
    return false;
  for (size_t i = 0; i < minSize; i++) {
    if (!value[i].is_number())
      return false;
  }
  return true;
}

template <typename T>
static T GetValueOrDefault(
    const nlohmann::json &value, const T &defaultValue, const char *name)
{
  if (!value.is_object() || !value.contains(name))
    return defaultValue;

  const auto &subValue = value[name];
  if constexpr (std::is_same_v<T, bool>) {
    if (subValue.is_boolean())
      return subValue.get<bool>();
  } else if constexpr (std::is_floating_point_v<T>) {
    if (subValue.is_number())
      return subValue.get<T>();
  } else if constexpr (std::is_same_v<T, std::string>) {
    if (subValue.is_string())
      return subValue.get<std::string>();
  } else if constexpr (std::is_same_v<T, float3>) {
    if (isNumberArray(subValue, 3))
      return float3(subValue[0].get<float>(),
          subValue[1].get<float>(),
          subValue[2].get<float>());
  } else if constexpr (std::is_same_v<T, float4>) {
    if (isNumberArray(subValue, 4))
      return float4(subValue[0].get<float>(),
          subValue[1].get<float>(),
          subValue[2].get<float>(),
          subValue[3].get<float>());
  } else {
    static_assert(!std::is_same_v<T, T>, "unsupported material value type");
  }

  logWarning("[gltf] material field '%s' has an unexpected type", name);
  return defaultValue;
}

static const nlohmann::json &elementOf(
    const nlohmann::json &document, const char *key, size_t index)
{
  if (!document.contains(key) || !document[key].is_array()
      || index >= document[key].size()) {
    throw FormatError(fmt::format("{} index {} out of range", key, index));
  }
  return document[key][index];
}

static size_t indexOf(const nlohmann::json &value, const char *what)
{
  if (!value.is_number_integer() || value.get<int64_t>() < 0)
    throw FormatError(fmt::format("{} must be a non-negative integer", what));
  return value.get<size_t>();
}

///////////////////////////////////////////////////////////////////////////////
// Import /////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

nlohmann::json flattenMaterial(const nlohmann::json &material)
{
  if (!material.is_object())
    throw FormatError("material entries must be JSON objects");

  auto flattened = material;
  auto itr = flattened.find("pbrMetallicRoughness");
  if (itr != flattened.end()) {
    const auto pbr = *itr;
    flattened.erase(itr);
    if (pbr.is_object()) {
      for (const auto &item : pbr.items())
        flattened[item.key()] = item.value();
    }
  }

  return flattened;
}

MaterialFields splitMaterialFields(const nlohmann::json &flattened,
    const nlohmann::json &document,
    const std::vector<ImagePtr> &images)
{
  MaterialFields fields;

  for (const auto &item : flattened.items()) {
    const auto &v = item.value();
    if (!v.is_object()) {
      fields.scalars[item.key()] = v;
      continue;
    }

    if (!v.contains("index"))
      continue;

    const auto textureIndex = indexOf(v["index"], "texture index");
    const auto &texture = elementOf(document, "textures", textureIndex);
    if (!texture.contains("source")) {
      logWarning("[gltf] texture %zu used by '%s' has no image source",
          textureIndex,
          item.key().c_str());
      fields.textures[item.key()] = nullptr;
      continue;
    }

    const auto source = indexOf(texture["source"], "texture source");
    if (source >= images.size()) {
      throw FormatError(
          fmt::format("texture {} references missing image {}",
              textureIndex,
              source));
    }

    fields.textures[item.key()] = images[source];
  }

  return fields;
}

PBRMaterialPtr makeMaterial(const MaterialFields &fields)
{
  auto m = std::make_shared<PBRMaterial>();
  const auto &s = fields.scalars;

  m->name = GetValueOrDefault<std::string>(s, m->name, "name");
  m->baseColorFactor =
      GetValueOrDefault<float4>(s, m->baseColorFactor, "baseColorFactor");
  m->metallicFactor =
      GetValueOrDefault<float>(s, m->metallicFactor, "metallicFactor");
  m->roughnessFactor =
      GetValueOrDefault<float>(s, m->roughnessFactor, "roughnessFactor");
  m->emissiveFactor =
      GetValueOrDefault<float3>(s, m->emissiveFactor, "emissiveFactor");
  m->alphaMode = GetValueOrDefault<std::string>(s, m->alphaMode, "alphaMode");
  m->alphaCutoff = GetValueOrDefault<float>(s, m->alphaCutoff, "alphaCutoff");
  m->doubleSided = GetValueOrDefault<bool>(s, m->doubleSided, "doubleSided");

  // clang-format off
  static const char *KNOWN_SCALARS[] = {
    "name", "baseColorFactor", "metallicFactor", "roughnessFactor",
    "emissiveFactor", "alphaMode", "alphaCutoff", "doubleSided"
  };
  // clang-format on

  for (const auto &item : s.items()) {
    bool known = false;
    for (const char *k : KNOWN_SCALARS)
      known = known || item.key() == k;
    if (!known) {
      logDebug("[gltf] ignoring material field '%s'", item.key().c_str());
    }
  }

  for (const auto &t : fields.textures) {
    if (t.first == "baseColorTexture")
      m->baseColorTexture = t.second;
    else if (t.first == "metallicRoughnessTexture")
      m->metallicRoughnessTexture = t.second;
    else if (t.first == "normalTexture")
      m->normalTexture = t.second;
    else if (t.first == "occlusionTexture")
      m->occlusionTexture = t.second;
    else if (t.first == "emissiveTexture")
      m->emissiveTexture = t.second;
    else
      logDebug("[gltf] ignoring material texture '%s'", t.first.c_str());
  }

  return m;
}

std::vector<ImagePtr> decodeImages(const nlohmann::json &document,
    const std::vector<ByteBuffer> &views,
    const ImageDecoder &decoder,
    const FileMap *files)
{
  std::vector<ImagePtr> images;
  if (!document.contains("images"))
    return images;

  const auto &entries = document["images"];
  if (!entries.is_array())
    throw FormatError("'images' must be an array");

  for (size_t i = 0; i < entries.size(); i++) {
    const auto &entry = entries[i];
    if (!entry.is_object())
      throw FormatError(fmt::format("image {} is not a JSON object", i));

    const auto mimeType = entry.value("mimeType", std::string{});
    ImagePtr image;

    if (entry.contains("bufferView")) {
      const auto viewIndex = indexOf(entry["bufferView"], "image bufferView");
      if (viewIndex >= views.size()) {
        throw FormatError(fmt::format(
            "image {} references missing bufferView {}", i, viewIndex));
      }
      const auto &bytes = views[viewIndex];
      image = decoder.decode(bytes.data(), bytes.size(), mimeType);
    } else if (entry.contains("uri") && entry["uri"].is_string()) {
      const auto uri = entry["uri"].get<std::string>();
      const ByteBuffer *bytes = files ? files->find(uri) : nullptr;
      if (uri.rfind("data:", 0) == 0) {
        logError("[gltf] embedded data URIs are not supported (image %zu)", i);
      } else if (!bytes) {
        logError("[gltf] image file '%s' not found", uri.c_str());
      } else {
        image = decoder.decode(bytes->data(), bytes->size(), mimeType);
      }
    } else {
      logWarning("[gltf] image %zu has neither bufferView nor uri", i);
    }

    if (image)
      image->name = entry.value("name", std::string{});
    else
      logError("[gltf] failed to decode image %zu", i);

    images.push_back(image);
  }

  return images;
}

std::optional<std::vector<PBRMaterialPtr>> parseMaterials(
    const nlohmann::json &document,
    const std::vector<ByteBuffer> &views,
    const ImageDecoder *decoder,
    const FileMap *files)
{
  if (!document.contains("materials"))
    return std::vector<PBRMaterialPtr>{};

  if (!decoder) {
    logWarning("[gltf] no image decoder available, materials skipped");
    return std::nullopt;
  }

  const auto &entries = document["materials"];
  if (!entries.is_array())
    throw FormatError("'materials' must be an array");

  const auto images = decodeImages(document, views, *decoder, files);

  std::vector<PBRMaterialPtr> materials;
  for (const auto &entry : entries) {
    const auto fields =
        splitMaterialFields(flattenMaterial(entry), document, images);
    materials.push_back(makeMaterial(fields));
  }

  logDebug("[gltf] parsed %zu material(s), %zu image(s)",
      materials.size(),
      images.size());

  return materials;
}

///////////////////////////////////////////////////////////////////////////////
// Export /////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

nlohmann::json materialToGLTF(const PBRMaterial &material)
{
  const auto &c = material.baseColorFactor;

  nlohmann::json retval;
  retval["pbrMetallicRoughness"] = {{"baseColorFactor", {c.x, c.y, c.z, c.w}},
      {"metallicFactor", material.metallicFactor},
      {"roughnessFactor", material.roughnessFactor}};

  if (!material.name.empty())
    retval["name"] = material.name;

  const auto &e = material.emissiveFactor;
  if (e.x != 0.f || e.y != 0.f || e.z != 0.f)
    retval["emissiveFactor"] = {e.x, e.y, e.z};

  if (material.alphaMode != "OPAQUE")
    retval["alphaMode"] = material.alphaMode;
  if (material.alphaMode == "MASK")
    retval["alphaCutoff"] = material.alphaCutoff;
  if (material.doubleSided)
    retval["doubleSided"] = true;

  return retval;
}

nlohmann::json colorToGLTF(const ubyte4 &color)
{
  const auto c = toColorF(color);
  nlohmann::json retval;
  retval["pbrMetallicRoughness"] = {{"baseColorFactor", {c.x, c.y, c.z, c.w}},
      {"metallicFactor", 0.0},
      {"roughnessFactor", 0.0}};
  return retval;
}

nlohmann::json defaultMaterial()
{
  nlohmann::json retval;
  retval["pbrMetallicRoughness"] = {{"baseColorFactor", {0, 0, 0, 0}},
      {"metallicFactor", 0},
      {"roughnessFactor", 0}};
  return retval;
}

} // namespace sgx::io::gltf
