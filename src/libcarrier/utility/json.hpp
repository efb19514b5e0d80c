/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef libcarrier_utility_json_hpp
#define libcarrier_utility_json_hpp

#include <string>
#include <map>
#include <cstdint>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/schema.h>


namespace libcarrier {
namespace json {

rapidjson::SchemaDocument readSchema(const boost::filesystem::path& schemaFile);
rapidjson::Document parseStream(std::istream& is);
rapidjson::Document parse(const std::string& string);
rapidjson::Document read(const boost::filesystem::path& filename);
rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile,
                                    const boost::filesystem::path& schemaFile);
void write(const rapidjson::Value& json, const boost::filesystem::path& filename);
std::string serialize(const rapidjson::Value& json);

// Typed member accessors which report the offending key on failure
std::string getString(const rapidjson::Value& object, const char* key);
std::string getStringOrDefault(const rapidjson::Value& object, const char* key, const std::string& defaultValue = "");
int64_t getInt64(const rapidjson::Value& object, const char* key);
std::map<std::string, std::string> getStringMap(const rapidjson::Value& object, const char* key);
void setStringMap(rapidjson::Value& object, const char* key,
                  const std::map<std::string, std::string>& map,
                  rapidjson::Document::AllocatorType& allocator);

}}

#endif
