/**
 * @file FieldSchema.hpp
 * @brief Typed, ordered field list bound to an OGR layer definition
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <ogrsf_frmts.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace demforge {

enum class FieldType {
    STRING,
    REAL,
    INTEGER
};

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::STRING;
    bool required = true;
};

/**
 * @brief Resolves named fields to OGR field indices once per layer
 *
 * A missing required field invalidates the whole layer and is raised as
 * FieldNotFound by resolve(). Value conversion errors belong to a single
 * feature and are raised as InvalidArgument by the typed getters.
 */
class FieldSchema {
public:
    FieldSchema() = default;
    explicit FieldSchema(std::vector<FieldSpec> fields);

    void add(const FieldSpec& field);

    /**
     * @brief Bind the schema to a layer definition (names compared case-insensitively)
     * @param source Layer or file name used in error messages
     * @throws RasterError (FieldNotFound) when a required field is absent
     */
    void resolve(const OGRFeatureDefn& definition, const std::string& source);

    /**
     * @brief Create every field on an output layer, then resolve against it
     *
     * A driver that renames a field (shapefile truncation, laundering) makes
     * the field unresolvable and is reported as FieldNotFound.
     * @throws RasterError RasterIOError (field creation), FieldNotFound
     */
    void create_fields(OGRLayer& layer, const std::string& source);

    bool is_resolved() const { return resolved_; }

    /**
     * @brief OGR index of a field, nullopt for an absent optional field
     */
    std::optional<int> find(const std::string& name) const;

    /**
     * @brief OGR index of a field that must be present
     * @throws RasterError (FieldNotFound)
     */
    int index_of(const std::string& name) const;

    const std::vector<FieldSpec>& fields() const { return fields_; }

    std::vector<std::string> names() const;

    /**
     * @brief Check every present value against its field type
     * @throws RasterError (InvalidArgument) naming the first bad field
     */
    void validate(const OGRFeature& feature) const;

    // Typed access to a feature; absent optional fields read as empty
    std::string text(const OGRFeature& feature, const std::string& name) const;
    std::optional<double> real(const OGRFeature& feature, const std::string& name) const;
    std::optional<long long> integer(const OGRFeature& feature, const std::string& name) const;

    static OGRFieldType ogr_type(FieldType type);

private:
    std::vector<FieldSpec> fields_;
    std::vector<std::optional<int>> indices_;
    std::string source_;
    bool resolved_ = false;

    size_t field_position(const std::string& name) const;
};

} // namespace demforge
