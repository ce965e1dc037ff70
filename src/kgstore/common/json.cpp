#include "kgstore/common/json.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <rapidjson/error/en.h>

namespace kgstore {
namespace common {

namespace {

std::string Serialize(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

core::Error ParseFailure(const rapidjson::Document& doc, const char* what) {
    return core::StorageFailureError(
        std::string("corrupt ") + what + " column: " +
        rapidjson::GetParseError_En(doc.GetParseError()));
}

}  // namespace

std::string EncodeStringList(const std::vector<std::string>& values) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& allocator = doc.GetAllocator();
    for (const auto& value : values) {
        doc.PushBack(rapidjson::Value(value.c_str(),
                                      static_cast<rapidjson::SizeType>(value.size()),
                                      allocator).Move(),
                     allocator);
    }
    return Serialize(doc);
}

core::Result<std::vector<std::string>> DecodeStringList(const std::string& json) {
    std::vector<std::string> values;
    if (json.empty()) {
        return values;
    }

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return ParseFailure(doc, "observations");
    }
    if (!doc.IsArray()) {
        return core::StorageFailureError("observations column is not a JSON array");
    }

    values.reserve(doc.Size());
    for (const auto& item : doc.GetArray()) {
        if (item.IsString()) {
            values.emplace_back(item.GetString(), item.GetStringLength());
        } else {
            values.push_back(Serialize(item));
        }
    }
    return values;
}

std::string EncodeMetadata(const core::Metadata& metadata) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();
    for (const auto& [key, value] : metadata) {
        doc.AddMember(rapidjson::Value(key.c_str(),
                                       static_cast<rapidjson::SizeType>(key.size()),
                                       allocator).Move(),
                      rapidjson::Value(value.c_str(),
                                       static_cast<rapidjson::SizeType>(value.size()),
                                       allocator).Move(),
                      allocator);
    }
    return Serialize(doc);
}

core::Result<core::Metadata> DecodeMetadata(const std::string& json) {
    core::Metadata metadata;
    if (json.empty()) {
        return metadata;
    }

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return ParseFailure(doc, "metadata");
    }
    if (!doc.IsObject()) {
        return core::StorageFailureError("metadata column is not a JSON object");
    }

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        if (it->value.IsString()) {
            metadata[key] = std::string(it->value.GetString(), it->value.GetStringLength());
        } else {
            metadata[key] = Serialize(it->value);
        }
    }
    return metadata;
}

} // namespace common
} // namespace kgstore
