/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "json.hpp"

#include <fstream>
#include <sstream>

#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>

#include "libcarrier/Error.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "libcarrier/utility/logging.hpp"


namespace libcarrier {
namespace json {

rapidjson::Document parseStream(std::istream& is) {
    auto json = rapidjson::Document{};

    try {
        rapidjson::IStreamWrapper isw(is);
        json.ParseStream(isw);
    }
    catch (const std::exception& e) {
        CARRIER_RETHROW_ERROR(e, "Error parsing JSON stream");
    }

    return json;
}

rapidjson::Document parse(const std::string& string) {
    auto json = rapidjson::Document{};
    json.Parse(string.c_str(), string.size());
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON string:\n'%s'\nInput data is not valid JSON\n"
            "Error(offset %u): %s")
            % string
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        CARRIER_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::Document read(const boost::filesystem::path& filename) {
    std::ifstream ifs(filename.string());
    if(!ifs) {
        auto message = boost::format("Failed to open JSON file %s") % filename;
        CARRIER_THROW_ERROR(message.str());
    }
    auto json = parseStream(ifs);
    if (json.HasParseError()) {
        auto message = boost::format(
            "Error parsing JSON file %s. Input data is not valid JSON\n"
            "Error(offset %u): %s")
            % filename
            % static_cast<unsigned>(json.GetErrorOffset())
            % rapidjson::GetParseError_En(json.GetParseError());
        CARRIER_THROW_ERROR(message.str());
    }
    return json;
}

rapidjson::SchemaDocument readSchema(const boost::filesystem::path& schemaFile) {
    class RemoteSchemaDocumentProvider : public rapidjson::IRemoteSchemaDocumentProvider {
    public:
        RemoteSchemaDocumentProvider(const boost::filesystem::path& schemasDir)
            : schemasDir{schemasDir}
        {}
        const rapidjson::SchemaDocument* GetRemoteDocument(const char* uri, rapidjson::SizeType length) override {
            auto filename = std::string(uri, length);
            auto schema = json::read(schemasDir / filename);
            return new rapidjson::SchemaDocument(schema);
        }
    private:
        boost::filesystem::path schemasDir;
    };

    auto schemaJSON = json::read(schemaFile);
    auto provider = RemoteSchemaDocumentProvider{ schemaFile.parent_path() };
    return rapidjson::SchemaDocument{ schemaJSON, nullptr, rapidjson::SizeType(0), &provider };
}

rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    auto schema = readSchema(schemaFile);

    rapidjson::Document json;

    try {
        std::ifstream inputStream(jsonFile.string());
        if(!inputStream) {
            auto message = boost::format("Failed to open JSON file %s") % jsonFile;
            CARRIER_THROW_ERROR(message.str());
        }
        rapidjson::IStreamWrapper streamWrapper(inputStream);
        // Parse JSON from reader, validate the SAX events, and populate the Document.
        rapidjson::SchemaValidatingReader<rapidjson::kParseDefaultFlags, rapidjson::IStreamWrapper, rapidjson::UTF8<> > reader(streamWrapper, schema);
        json.Populate(reader);

        if (!reader.GetParseResult()) {
            // The reader stops either because the document violates the schema
            // or because the input is not JSON at all
            if (!reader.IsValid()) {
                rapidjson::StringBuffer sb;
                reader.GetInvalidSchemaPointer().StringifyUriFragment(sb);
                auto message = boost::format("Invalid schema: %s\n") % sb.GetString();
                message = boost::format("%sInvalid keyword: %s\n") % message % reader.GetInvalidSchemaKeyword();
                sb.Clear();
                reader.GetInvalidDocumentPointer().StringifyUriFragment(sb);
                message = boost::format("%sInvalid document: %s\n") % message % sb.GetString();
                sb.Clear();
                rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
                reader.GetError().Accept(w);
                message = boost::format("%sError report:\n%s") % message % sb.GetString();
                CARRIER_THROW_ERROR(message.str());
            }
            else {
                auto message = boost::format("Error parsing JSON file: %s") % jsonFile;
                CARRIER_THROW_ERROR(message.str());
            }
        }
    }
    catch(const libcarrier::Error&) {
        throw;
    }
    catch (const std::exception& e) {
        auto message = boost::format("Error reading JSON file %s") % jsonFile;
        CARRIER_RETHROW_ERROR(e, message.str());
    }

    return json;
}

void write(const rapidjson::Value& json, const boost::filesystem::path& filename) {
    try {
        filesystem::createFoldersIfNecessary(filename.parent_path());
        std::ofstream ofs(filename.string());
        if(!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            CARRIER_THROW_ERROR(message.str());
        }
        rapidjson::OStreamWrapper osw(ofs);
        rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(osw);
        writer.SetIndent(' ', 3);
        json.Accept(writer);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write JSON to %s") % filename;
        CARRIER_RETHROW_ERROR(e, message.str());
    }
}

std::string serialize(const rapidjson::Value& json) {
    namespace rj = rapidjson;
    rj::StringBuffer buffer;
    rj::Writer<rj::StringBuffer> writer(buffer);
    json.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string getString(const rapidjson::Value& object, const char* key) {
    if(!object.IsObject() || !object.HasMember(key) || !object[key].IsString()) {
        auto message = boost::format("Expected JSON string member \"%s\"") % key;
        CARRIER_THROW_ERROR(message.str());
    }
    const auto& value = object[key];
    return std::string(value.GetString(), value.GetStringLength());
}

std::string getStringOrDefault(const rapidjson::Value& object, const char* key, const std::string& defaultValue) {
    if(!object.IsObject() || !object.HasMember(key) || object[key].IsNull()) {
        return defaultValue;
    }
    return getString(object, key);
}

int64_t getInt64(const rapidjson::Value& object, const char* key) {
    if(!object.IsObject() || !object.HasMember(key) || !object[key].IsInt64()) {
        auto message = boost::format("Expected JSON integer member \"%s\"") % key;
        CARRIER_THROW_ERROR(message.str());
    }
    return object[key].GetInt64();
}

std::map<std::string, std::string> getStringMap(const rapidjson::Value& object, const char* key) {
    auto map = std::map<std::string, std::string>{};
    if(!object.IsObject() || !object.HasMember(key) || object[key].IsNull()) {
        return map;
    }
    const auto& value = object[key];
    if(!value.IsObject()) {
        auto message = boost::format("Expected JSON object member \"%s\"") % key;
        CARRIER_THROW_ERROR(message.str());
    }
    for(auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
        if(!it->value.IsString()) {
            auto message = boost::format("Expected string values in JSON object \"%s\"") % key;
            CARRIER_THROW_ERROR(message.str());
        }
        map[it->name.GetString()] = std::string(it->value.GetString(), it->value.GetStringLength());
    }
    return map;
}

void setStringMap(rapidjson::Value& object, const char* key,
                  const std::map<std::string, std::string>& map,
                  rapidjson::Document::AllocatorType& allocator) {
    object.RemoveMember(key);
    if(map.empty()) {
        return;
    }
    auto value = rapidjson::Value{rapidjson::kObjectType};
    for(const auto& kv : map) {
        value.AddMember(rapidjson::Value{kv.first.c_str(), allocator},
                        rapidjson::Value{kv.second.c_str(), allocator},
                        allocator);
    }
    object.AddMember(rapidjson::Value{key, allocator}, value, allocator);
}

}}
