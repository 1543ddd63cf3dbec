/**
 * @file FieldSchema.cpp
 * @brief OGR field binding and typed attribute access
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "FieldSchema.hpp"
#include "RasterError.hpp"
#include <cpl_conv.h>
#include <cpl_string.h>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace demforge {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// GetFieldIndex() is case-insensitive but exact; padded names and a leading BOM fall back here
int find_field(const OGRFeatureDefn& definition, const std::string& name) {
    int index = definition.GetFieldIndex(name.c_str());
    if (index >= 0) {
        return index;
    }
    for (int i = 0; i < definition.GetFieldCount(); ++i) {
        std::string candidate = trim(definition.GetFieldDefn(i)->GetNameRef());
        if (candidate.rfind("\xEF\xBB\xBF", 0) == 0) {
            candidate.erase(0, 3);
        }
        if (EQUAL(candidate.c_str(), name.c_str())) {
            return i;
        }
    }
    return -1;
}

bool is_numeric(OGRFieldType type) {
    return type == OFTReal || type == OFTInteger || type == OFTInteger64;
}

} // namespace

FieldSchema::FieldSchema(std::vector<FieldSpec> fields) : fields_(std::move(fields)) {}

void FieldSchema::add(const FieldSpec& field) {
    fields_.push_back(field);
    resolved_ = false;
}

OGRFieldType FieldSchema::ogr_type(FieldType type) {
    switch (type) {
        case FieldType::REAL:    return OFTReal;
        case FieldType::INTEGER: return OFTInteger64;
        case FieldType::STRING:  return OFTString;
    }
    return OFTString;
}

void FieldSchema::resolve(const OGRFeatureDefn& definition, const std::string& source) {
    source_ = source;
    indices_.assign(fields_.size(), std::nullopt);

    for (size_t f = 0; f < fields_.size(); ++f) {
        const int index = find_field(definition, fields_[f].name);
        if (index >= 0) {
            indices_[f] = index;
        } else if (fields_[f].required) {
            throw RasterError(RasterErrorCode::FIELD_NOT_FOUND, "resolve_schema",
                              "required field '" + fields_[f].name + "' is missing", source);
        }
    }
    resolved_ = true;
}

void FieldSchema::create_fields(OGRLayer& layer, const std::string& source) {
    for (const auto& field : fields_) {
        OGRFieldDefn definition(field.name.c_str(), ogr_type(field.type));
        if (layer.CreateField(&definition) != OGRERR_NONE) {
            throw_gdal_error(RasterErrorCode::RASTER_IO_ERROR, "create_fields",
                             "cannot create field '" + field.name + "'", source);
        }
    }

    resolve(*layer.GetLayerDefn(), source);
    for (size_t f = 0; f < fields_.size(); ++f) {
        if (!indices_[f]) {
            throw RasterError(RasterErrorCode::FIELD_NOT_FOUND, "create_fields",
                              "field '" + fields_[f].name + "' was renamed by the " +
                              "output driver", source);
        }
    }
}

size_t FieldSchema::field_position(const std::string& name) const {
    for (size_t f = 0; f < fields_.size(); ++f) {
        if (EQUAL(fields_[f].name.c_str(), name.c_str())) {
            return f;
        }
    }
    throw RasterError(RasterErrorCode::FIELD_NOT_FOUND, "field_lookup",
                      "field '" + name + "' is not part of the schema", source_);
}

std::optional<int> FieldSchema::find(const std::string& name) const {
    if (!resolved_) {
        return std::nullopt;
    }
    return indices_[field_position(name)];
}

int FieldSchema::index_of(const std::string& name) const {
    auto index = find(name);
    if (!index) {
        throw RasterError(RasterErrorCode::FIELD_NOT_FOUND, "field_lookup",
                          "field '" + name + "' is not present", source_);
    }
    return *index;
}

std::vector<std::string> FieldSchema::names() const {
    std::vector<std::string> result;
    result.reserve(fields_.size());
    for (const auto& field : fields_) {
        result.push_back(field.name);
    }
    return result;
}

void FieldSchema::validate(const OGRFeature& feature) const {
    for (const auto& field : fields_) {
        switch (field.type) {
            case FieldType::REAL:
                real(feature, field.name);
                break;
            case FieldType::INTEGER:
                integer(feature, field.name);
                break;
            case FieldType::STRING:
                break;
        }
    }
}

std::string FieldSchema::text(const OGRFeature& feature, const std::string& name) const {
    auto index = find(name);
    if (!index || !feature.IsFieldSetAndNotNull(*index)) {
        return "";
    }
    return trim(feature.GetFieldAsString(*index));
}

std::optional<double> FieldSchema::real(const OGRFeature& feature,
                                        const std::string& name) const {
    auto index = find(name);
    if (!index || !feature.IsFieldSetAndNotNull(*index)) {
        return std::nullopt;
    }
    if (is_numeric(feature.GetFieldDefnRef(*index)->GetType())) {
        return feature.GetFieldAsDouble(*index);
    }

    const std::string value = text(feature, name);
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double result = CPLStrtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !std::isfinite(result)) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "read_field",
                          "field '" + name + "' is not a number: '" + value + "'", source_);
    }
    return result;
}

std::optional<long long> FieldSchema::integer(const OGRFeature& feature,
                                              const std::string& name) const {
    auto index = find(name);
    if (!index || !feature.IsFieldSetAndNotNull(*index)) {
        return std::nullopt;
    }
    const OGRFieldType type = feature.GetFieldDefnRef(*index)->GetType();
    if (type == OFTInteger || type == OFTInteger64) {
        return static_cast<long long>(feature.GetFieldAsInteger64(*index));
    }

    const std::string value = text(feature, name);
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const long long result = std::strtoll(value.c_str(), &end, 10);
    if (end != value.c_str() + value.size() || errno == ERANGE) {
        throw RasterError(RasterErrorCode::INVALID_ARGUMENT, "read_field",
                          "field '" + name + "' is not an integer: '" + value + "'", source_);
    }
    return result;
}

} // namespace demforge
