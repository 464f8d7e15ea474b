#include "fpservice/storage/TemplateDocument.hpp"
#include "fpservice/core/exception.h"

#include <yaml-cpp/yaml.h>

namespace fpservice {
namespace storage {

namespace {

const char* const KEY_VERSION = "version";
const char* const KEY_TEMPLATES = "templates";
const char* const KEY_NAME = "name";
const char* const KEY_GROUP_ID = "groupId";
const char* const KEY_TEMPLATE_ID = "templateId";
const char* const KEY_DEVICE_ID = "deviceId";

template<typename T>
T requireField(const YAML::Node& entry, const char* key, size_t index) {
    const YAML::Node value = entry[key];
    if (!value || value.IsNull()) {
        throw YAML::Exception(YAML::Mark::null_mark(),
                              "template #" + std::to_string(index) + " is missing '" + key + "'");
    }
    return value.as<T>();
}

} // namespace

std::string TemplateDocument::serialize(const std::vector<Template>& templates) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << KEY_VERSION << YAML::Value << kVersion;
    out << YAML::Key << KEY_TEMPLATES << YAML::Value << YAML::BeginSeq;
    for (const auto& tmpl : templates) {
        out << YAML::BeginMap;
        out << YAML::Key << KEY_TEMPLATE_ID << YAML::Value << tmpl.template_id;
        out << YAML::Key << KEY_NAME << YAML::Value << YAML::DoubleQuoted << tmpl.name;
        out << YAML::Key << KEY_GROUP_ID << YAML::Value << tmpl.group_id;
        out << YAML::Key << KEY_DEVICE_ID << YAML::Value << static_cast<long long>(tmpl.device_id);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!out.good()) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                             "Failed to encode templates: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

std::vector<Template> TemplateDocument::parse(const std::string& contents, const std::string& source) {
    std::vector<Template> templates;

    try {
        const YAML::Node root = YAML::Load(contents);
        if (!root || root.IsNull()) {
            return templates;
        }
        if (!root.IsMap()) {
            throw YAML::Exception(YAML::Mark::null_mark(), "document root is not a map");
        }

        const YAML::Node version = root[KEY_VERSION];
        if (version && !version.IsNull() && version.as<int>() > kVersion) {
            throw YAML::Exception(YAML::Mark::null_mark(),
                                  "unsupported version " + version.as<std::string>());
        }

        const YAML::Node entries = root[KEY_TEMPLATES];
        if (!entries || entries.IsNull()) {
            return templates;
        }
        if (!entries.IsSequence()) {
            throw YAML::Exception(YAML::Mark::null_mark(), "'templates' is not a sequence");
        }

        templates.reserve(entries.size());
        for (size_t i = 0; i < entries.size(); ++i) {
            const YAML::Node entry = entries[i];
            if (!entry.IsMap()) {
                throw YAML::Exception(YAML::Mark::null_mark(),
                                      "template #" + std::to_string(i) + " is not a map");
            }
            templates.emplace_back(requireField<std::string>(entry, KEY_NAME, i),
                                   requireField<int32_t>(entry, KEY_GROUP_ID, i),
                                   requireField<int32_t>(entry, KEY_TEMPLATE_ID, i),
                                   requireField<int64_t>(entry, KEY_DEVICE_ID, i));
        }
    } catch (const YAML::Exception& e) {
        FPSERVICE_THROW_CODE(core::FileException, core::ResultCode::ERROR_PARSE,
                             "Failed parsing template document " + source + ": " + e.what());
    }

    return templates;
}

} // namespace storage
} // namespace fpservice
