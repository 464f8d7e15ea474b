#pragma once

#include "fpservice/storage/Template.hpp"

#include <string>
#include <vector>

namespace fpservice {
namespace storage {

/**
 * @brief YAML encoding of a user's template list
 *
 * @code
 * version: 1
 * templates:
 *   - templateId: 7
 *     name: Finger 1
 *     groupId: 0
 *     deviceId: 0
 * @endcode
 */
class TemplateDocument {
public:
    static constexpr int kVersion = 1;

    /**
     * @throws core::FileException(ERROR_FILE_IO) if the emitter fails
     */
    static std::string serialize(const std::vector<Template>& templates);

    /**
     * @brief Parse a document; an empty document holds no templates
     * @throws core::FileException(ERROR_PARSE) on malformed input
     */
    static std::vector<Template> parse(const std::string& contents, const std::string& source = "");
};

} // namespace storage
} // namespace fpservice
